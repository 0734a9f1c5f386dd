#ifndef UTF8_H
#define UTF8_H

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "barfer.h"
#include "encoded.h"

namespace utf8 {

inline constexpr std::size_t max_length = 4;

using Encoded = barfer::Encoded<max_length>;

auto encode(char32_t codepoint) noexcept
    -> std::expected<Encoded, barfer::Error>;

auto is_valid(std::span<const std::byte> bytes) noexcept -> bool;

auto decode(std::string_view text)
    -> std::expected<std::u32string, barfer::Error>;

struct Char {
    char32_t value;
};

auto encode_into(barfer::ByteSink auto& sink, const Char& c) -> barfer::Result {
    const auto encoded = encode(c.value);

    if (!encoded) {
        return std::unexpected(encoded.error());
    }

    return barfer::slice(sink, encoded->view());
}

auto character(barfer::ByteSink auto& sink, char32_t codepoint) -> barfer::Result {
    return barfer::single(sink, Char{codepoint});
}

// Byte sinks take the text as-is, one byte per code unit.
auto string(barfer::ByteSink auto& sink, std::string_view text) -> barfer::Result {
    return barfer::slice(sink, std::as_bytes(std::span{text}));
}

// Text sinks take codepoints. Malformed input is rejected before anything
// is appended.
auto string(barfer::TextSink auto& sink, std::string_view text) -> barfer::Result {
    const auto codepoints = decode(text);

    if (!codepoints) {
        return std::unexpected(codepoints.error());
    }

    return barfer::slice(sink, std::span<const char32_t>{codepoints.value()});
}

}

#endif // UTF8_H
