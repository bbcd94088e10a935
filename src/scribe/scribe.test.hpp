#pragma once

#include <catch2/catch.hpp>

#include <scribe/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/pred.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

namespace scribe::testing {

namespace fs = std::filesystem;

const auto REPO_ROOT = fs::canonical((fs::path(__FILE__) / "../../..").lexically_normal());
const auto DATA_DIR  = REPO_ROOT / "data";

template <typename Fn>
constexpr auto leaf_handle_nofail(Fn&& fn) {
    return boost::leaf::try_catch(  //
        fn,
        [](const boost::leaf::verbose_diagnostic_info& info) -> decltype(fn()) {
            FAIL("Operation failed: " << info);
            std::terminate();
        });
}

#define REQUIRES_LEAF_NOFAIL(...)                                                                  \
    (::scribe::testing::leaf_handle_nofail([&] { return (__VA_ARGS__); }))

/**
 * @brief While alive, collect everything logged at `info` and above, instead of writing it to the
 * terminal.
 */
class log_capture {
    std::ostringstream              _out;
    std::shared_ptr<spdlog::logger> _prev_logger = spdlog::default_logger();
    log::level                      _prev_level  = log::current_log_level;

public:
    log_capture() {
        auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(_out);
        auto logger = std::make_shared<spdlog::logger>("scribe-test", sink);
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("[%l] %v");
        spdlog::set_default_logger(logger);
        log::current_log_level = log::level::info;
    }

    ~log_capture() {
        spdlog::set_default_logger(_prev_logger);
        log::current_log_level = _prev_level;
    }

    log_capture(const log_capture&) = delete;
    log_capture& operator=(const log_capture&) = delete;

    std::string str() const { return _out.str(); }
};

}  // namespace scribe::testing
