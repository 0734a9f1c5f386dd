#ifndef LOGGING_H
#define LOGGING_H

#include <format>
#include <string_view>
#include <utility>

namespace logging {

enum Level {
    Error,
    Warning,
    Info
};

constexpr auto prefix(Level level) noexcept -> std::string_view {
    switch (level) {
        case Level::Error: return "[E]";
        case Level::Warning: return "[W]";
        case Level::Info: return "[I]";
    }

    return "[U]";
}

// Messages above the threshold are dropped. Defaults to Warning.
auto set_threshold(Level) noexcept -> void;
auto threshold() noexcept -> Level;
auto enabled(Level) noexcept -> bool;

auto log(Level level, std::string_view message) -> void;

auto error(std::string_view message) -> void;
auto warning(std::string_view message) -> void;
auto info(std::string_view message) -> void;

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
    if (enabled(Level::Info)) {
        log(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }
}

}

#endif // LOGGING_H
