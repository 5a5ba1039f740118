#pragma once

#include <fmt/core.h>

#include <string_view>

namespace semver::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    /// Only meaningful as a threshold. Nothing is logged at this level.
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

/**
 * @brief Install the message pattern on the default spdlog logger
 */
void init_logger() noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) noexcept { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (level_enabled(l)) {
        auto message = fmt::vformat(s, fmt::make_format_args(args...));
        log_print(l, message);
    }
}

#define semver_log(Level, str, ...)                                                                \
    do {                                                                                           \
        if (int(semver::log::level::Level) >= int(semver::log::current_log_level)) {               \
            ::semver::log::log(::semver::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)

}  // namespace semver::log
