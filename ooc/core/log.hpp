#pragma once

#include "ooc/core/macros.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// =============================================================================
// FILE: ooc/core/log.hpp
// BRIEF: Leveled stderr diagnostics
// =============================================================================

namespace ooc::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

namespace detail {

inline Level level_from_env() noexcept {
    const char* env = std::getenv("OOC_LOG_LEVEL");
    if (env == nullptr) return Level::Warn;
    if (std::strcmp(env, "debug") == 0) return Level::Debug;
    if (std::strcmp(env, "info") == 0)  return Level::Info;
    if (std::strcmp(env, "warn") == 0)  return Level::Warn;
    if (std::strcmp(env, "error") == 0) return Level::Error;
    if (std::strcmp(env, "off") == 0)   return Level::Off;
    return Level::Warn;
}

inline std::atomic<int>& threshold() noexcept {
    static std::atomic<int> value{static_cast<int>(level_from_env())};
    return value;
}

} // namespace detail

inline void set_level(Level level) noexcept {
    detail::threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

OOC_NODISCARD inline Level level() noexcept {
    return static_cast<Level>(detail::threshold().load(std::memory_order_relaxed));
}

OOC_NODISCARD inline bool enabled(Level lvl) noexcept {
    return lvl != Level::Off &&
           static_cast<int>(lvl) >= detail::threshold().load(std::memory_order_relaxed);
}

OOC_NODISCARD inline const char* level_tag(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARNING";
        case Level::Error: return "ERROR";
        default:           return "";
    }
}

} // namespace ooc::log

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define OOC_LOG_AT(lvl, ...) \
    do { \
        if (::ooc::log::enabled(lvl)) { \
            std::fprintf(stderr, "%s: ", ::ooc::log::level_tag(lvl)); \
            std::fprintf(stderr, __VA_ARGS__); \
            std::fputc('\n', stderr); \
        } \
    } while (0)

#define OOC_LOG_DEBUG(...) OOC_LOG_AT(::ooc::log::Level::Debug, __VA_ARGS__)
#define OOC_LOG_INFO(...)  OOC_LOG_AT(::ooc::log::Level::Info, __VA_ARGS__)
#define OOC_LOG_WARN(...)  OOC_LOG_AT(::ooc::log::Level::Warn, __VA_ARGS__)
#define OOC_LOG_ERROR(...) OOC_LOG_AT(::ooc::log::Level::Error, __VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)
