// logging.hpp
// Library-wide spdlog logger ("sigqalc"), stderr sink, quiet by default.

#ifndef SIGQALC_INC_LOGGING_HPP
#define SIGQALC_INC_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace sigqalc {

// Created on first use; SPDLOG_LEVEL in the environment overrides the default level.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum lvl);
spdlog::level::level_enum get_log_level();

} // namespace sigqalc

#define SIGQALC_TRACE(...) ::sigqalc::logger()->trace(__VA_ARGS__)
#define SIGQALC_DEBUG(...) ::sigqalc::logger()->debug(__VA_ARGS__)

#endif // SIGQALC_INC_LOGGING_HPP
