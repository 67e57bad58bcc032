#include "core/logging.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace booksync {

void setup_logging(std::string_view level, bool to_stderr) {
    // Async logging keeps console I/O off the event loop
    spdlog::init_thread_pool(8192, 1);

    spdlog::sink_ptr sink;
    if (to_stderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    auto logger = std::make_shared<spdlog::async_logger>(
        "booksync",
        sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    auto parsed = spdlog::level::from_str(std::string(level));
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

}  // namespace booksync
