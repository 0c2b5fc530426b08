// src/logging.cpp
// Library logger setup.

#include "logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace apns {
namespace logging {
namespace {

constexpr const char* LOGGER_NAME = "apns";
constexpr const char* DEFAULT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [tid %t] %v";

std::shared_ptr<spdlog::logger> create_logger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_pattern(DEFAULT_PATTERN);
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Off:   return spdlog::level::off;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Trace: return spdlog::level::trace;
    }
    return spdlog::level::warn;
}

const std::shared_ptr<spdlog::logger>& logger() {
    static const std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void initialize(LogLevel level) {
    auto resolved = to_spdlog(level);
    if (const char* env = std::getenv("APNS_LOG_LEVEL")) {
        // from_str() answers off for names it does not know.
        std::string name(env);
        auto parsed = spdlog::level::from_str(name);
        if (parsed != spdlog::level::off || name == "off") {
            resolved = parsed;
        } else {
            logger()->warn("ignoring unknown APNS_LOG_LEVEL '{}'", name);
        }
    }
    logger()->set_level(resolved);
}

} // namespace logging
} // namespace apns
