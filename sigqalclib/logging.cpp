#include "sigqalc/logging.hpp"

#include <mutex>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sigqalc {

static const char *const LOGGER_NAME = "sigqalc";

static std::shared_ptr<spdlog::logger> default_logger() {
    auto &registry = spdlog::details::registry::instance();
    registry.drop(LOGGER_NAME);

    std::shared_ptr<spdlog::logger> sink = spdlog::stderr_color_mt(LOGGER_NAME);
    sink->set_level(spdlog::level::warn);
    sink->set_pattern("[%n] [%l] %v");
    sink->flush_on(spdlog::level::warn);

    // SPDLOG_LEVEL=sigqalc=debug (or a bare level) overrides the default.
    spdlog::cfg::load_env_levels();
    return sink;
}

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] { instance = default_logger(); });
    return instance;
}

void set_log_level(spdlog::level::level_enum lvl) {
    logger()->set_level(lvl);
}

spdlog::level::level_enum get_log_level() {
    return logger()->level();
}

} // namespace sigqalc
