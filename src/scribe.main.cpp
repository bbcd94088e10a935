#include <scribe/cli/main.hpp>
#include <scribe/util/log.hpp>

int main(int argc, char** argv) {
    scribe::log::init_logger();
    return scribe::cli::main_fn(argv[0], {argv + 1, argv + argc});
}
