#include <cstdint>

#include "utf8.h"

namespace {

constexpr auto is_scalar_value(char32_t codepoint) noexcept -> bool {
    return codepoint <= 0x10FFFF
        && (codepoint < 0xD800 || codepoint > 0xDFFF);
}

constexpr auto is_continuation(uint8_t byte) noexcept -> bool {
    return (byte & 0xC0) == 0x80;
}

// Reads one scalar value starting at `bytes[0]`. Returns the number of bytes
// it spans, or zero when the sequence is malformed.
auto read_scalar(std::span<const std::byte> bytes, char32_t& out) noexcept
        -> std::size_t {
    const auto lead = std::to_integer<uint8_t>(bytes[0]);

    std::size_t length;
    char32_t codepoint;
    char32_t minimum;

    if (lead < 0x80) {
        out = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        codepoint = lead & 0x1F;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        codepoint = lead & 0x0F;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        codepoint = lead & 0x07;
        minimum = 0x10000;
    } else {
        return 0;
    }

    if (bytes.size() < length) {
        return 0;
    }

    for (auto i = 1uz; i < length; ++i) {
        const auto byte = std::to_integer<uint8_t>(bytes[i]);

        if (!is_continuation(byte)) {
            return 0;
        }

        codepoint = (codepoint << 6) | (byte & 0x3F);
    }

    // NOTE: Overlong forms and surrogates are well-formed bit patterns but
    // not valid UTF-8.
    if (codepoint < minimum || !is_scalar_value(codepoint)) {
        return 0;
    }

    out = codepoint;
    return length;
}

}

auto utf8::encode(char32_t codepoint) noexcept
        -> std::expected<utf8::Encoded, barfer::Error> {
    if (!is_scalar_value(codepoint)) {
        return std::unexpected(barfer::Error::InvalidCodepoint);
    }

    utf8::Encoded result{};

    if (codepoint < 0x80) {
        result.push(static_cast<std::byte>(codepoint));
    } else if (codepoint < 0x800) {
        result.push(static_cast<std::byte>(0xC0 | (codepoint >> 6)));
        result.push(static_cast<std::byte>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        result.push(static_cast<std::byte>(0xE0 | (codepoint >> 12)));
        result.push(static_cast<std::byte>(0x80 | ((codepoint >> 6) & 0x3F)));
        result.push(static_cast<std::byte>(0x80 | (codepoint & 0x3F)));
    } else {
        result.push(static_cast<std::byte>(0xF0 | (codepoint >> 18)));
        result.push(static_cast<std::byte>(0x80 | ((codepoint >> 12) & 0x3F)));
        result.push(static_cast<std::byte>(0x80 | ((codepoint >> 6) & 0x3F)));
        result.push(static_cast<std::byte>(0x80 | (codepoint & 0x3F)));
    }

    return result;
}

auto utf8::is_valid(std::span<const std::byte> bytes) noexcept -> bool {
    while (!bytes.empty()) {
        char32_t codepoint;
        const auto length = read_scalar(bytes, codepoint);

        if (length == 0) {
            return false;
        }

        bytes = bytes.subspan(length);
    }

    return true;
}

auto utf8::decode(std::string_view text)
        -> std::expected<std::u32string, barfer::Error> {
    auto bytes = std::as_bytes(std::span{text});

    std::u32string result{};
    result.reserve(text.size());

    while (!bytes.empty()) {
        char32_t codepoint;
        const auto length = read_scalar(bytes, codepoint);

        if (length == 0) {
            return std::unexpected(barfer::Error::InvalidUtf8);
        }

        result.push_back(codepoint);
        bytes = bytes.subspan(length);
    }

    return result;
}
