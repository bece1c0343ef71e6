#pragma once

#include "h5ds/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// FILE: h5ds/core/log.hpp
// BRIEF: Library logger ("h5ds") backed by spdlog
// =============================================================================

namespace h5ds::log {

constexpr const char* LOGGER_NAME = "h5ds";

/// @brief Parse a level name (`trace`, `debug`, ..., `off`).
///
/// spdlog's from_str maps names it does not know to `off`; those are
/// reported as nullopt here instead.
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    const auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return parsed;
}

namespace detail {

inline spdlog::level::level_enum initial_level() {
    const auto fallback = parse_level(config::DEFAULT_LOG_LEVEL).value_or(spdlog::level::warn);
    const char* env = std::getenv(config::LOG_LEVEL_ENV);
    if (env == nullptr || env[0] == '\0') {
        return fallback;
    }
    return parse_level(env).value_or(fallback);
}

} // namespace detail

/// @brief Shared library logger, created on first use.
///
/// A logger registered under "h5ds" before the first call (e.g. by an
/// application routing output to a file) is reused as-is.
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(detail::initial_level());
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

inline void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

inline spdlog::level::level_enum level() {
    return logger()->level();
}

} // namespace h5ds::log
