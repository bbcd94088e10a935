#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

using namespace scribe;

namespace scribe::cli {

namespace cmd {
using command = int(const options&);

command convert;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return scribe::handle_cli_errors([&] { return cmd::convert(opts); });
}

}  // namespace scribe::cli
