/*
    Logger construction
*/

#include "logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <string>

namespace mnsig {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>("mnsig", console_sink);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [mnsig] %v");

    spdlog::level::level_enum level = spdlog::level::warn;
    if (const char* env = std::getenv("MNSIG_LOG_LEVEL")) {
        level = spdlog::level::from_str(env);
    }
    log->set_level(level);
    log->flush_on(spdlog::level::warn);
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    // Thread-safe static initialisation
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace mnsig
