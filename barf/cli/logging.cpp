#include <chrono>
#include <print>

#include "logging.h"

namespace {

auto current_threshold = logging::Level::Warning;

}

auto logging::set_threshold(logging::Level level) noexcept -> void {
    current_threshold = level;
}

auto logging::threshold() noexcept -> logging::Level {
    return current_threshold;
}

auto logging::enabled(logging::Level level) noexcept -> bool {
    return level <= current_threshold;
}

auto logging::log(logging::Level level, std::string_view message) -> void {
    if (!enabled(level)) {
        return;
    }

    const auto now = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now()
    );

    // NOTE: UTC, ISO 8601 with second precision.
    std::println(stderr, "{} {:%FT%TZ} - {}", prefix(level), now, message);
}

auto logging::error(std::string_view message) -> void {
    log(Level::Error, message);
}

auto logging::warning(std::string_view message) -> void {
    log(Level::Warning, message);
}

auto logging::info(std::string_view message) -> void {
    log(Level::Info, message);
}
