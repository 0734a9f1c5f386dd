#ifndef FORMATS_H
#define FORMATS_H

#include <charconv>
#include <cstddef>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "sinks.h"

namespace formats {

using ByteSink = sinks::VectorSink<std::byte>;
using Writer = auto (*)(ByteSink&, std::string_view) -> void;

struct Format {
    std::string_view name;
    Writer write;
};

// Parses all of `text` as a `T`. Throws std::runtime_error when the text is
// not a number or does not fit `T`.
template <typename T>
auto parse_number(std::string_view text, int base = 10) -> T {
    T value{};
    const auto* end = text.data() + text.size();

    std::from_chars_result parsed;

    if constexpr (std::is_floating_point_v<T>) {
        parsed = std::from_chars(text.data(), end, value);
    } else {
        parsed = std::from_chars(text.data(), end, value, base);
    }

    if (parsed.ec == std::errc::result_out_of_range) {
        throw std::runtime_error(
            std::format("Value ({}) is out of range for the format", text)
        );
    }

    if (parsed.ec != std::errc{} || parsed.ptr != end) {
        throw std::runtime_error(
            std::format("Failed to parse value ({})", text)
        );
    }

    return value;
}

auto available() noexcept -> std::span<const Format>;

// Throws std::runtime_error for unknown formats and for formats whose
// encoder was left out of this build.
auto find_writer(std::string_view name) -> Writer;

auto to_hex(std::span<const std::byte> bytes) -> std::string;

// Encodes every value with the named format and returns the bytes as hex.
auto encode_values(std::string_view format, std::span<const std::string_view> values)
    -> std::string;

}

#endif // FORMATS_H
