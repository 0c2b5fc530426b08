// src/logging.hpp
// Library logger (spdlog) and logging macros.

#pragma once

#include "apns/types.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace apns {
namespace logging {

// Set the level of the "apns" logger. APNS_LOG_LEVEL in the environment
// (trace, debug, info, warn, error, off) takes precedence over `level`.
void initialize(LogLevel level);

// The shared "apns" logger, created on first use (stderr, level warn).
const std::shared_ptr<spdlog::logger>& logger();

spdlog::level::level_enum to_spdlog(LogLevel level);

} // namespace logging
} // namespace apns

#define APNS_LOG_TRACE(...) ::apns::logging::logger()->trace(__VA_ARGS__)
#define APNS_LOG_DEBUG(...) ::apns::logging::logger()->debug(__VA_ARGS__)
#define APNS_LOG_INFO(...)  ::apns::logging::logger()->info(__VA_ARGS__)
#define APNS_LOG_WARN(...)  ::apns::logging::logger()->warn(__VA_ARGS__)
#define APNS_LOG_ERROR(...) ::apns::logging::logger()->error(__VA_ARGS__)
