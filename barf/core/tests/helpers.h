#ifndef HELPERS_H
#define HELPERS_H

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <vector>

#include "gmock/gmock.h"

inline auto hex_byte(std::byte byte) -> std::string {
    return std::format("0x{:02X}", std::to_integer<unsigned>(byte));
}

MATCHER_P(EqualsBinary, expected, "holds exactly the expected bytes") {
    const auto [wanted, got] = std::ranges::mismatch(expected, arg);

    const auto wanted_end = std::ranges::end(expected);
    const auto got_end = std::ranges::end(arg);

    if (wanted == wanted_end && got == got_end) {
        return true;
    }

    if (wanted == wanted_end || got == got_end) {
        *result_listener << "expected " << std::ranges::size(expected)
            << " bytes but got " << std::ranges::size(arg);
    } else {
        *result_listener << "first difference at byte "
            << std::ranges::distance(std::ranges::begin(expected), wanted)
            << ": expected " << hex_byte(*wanted) << ", got " << hex_byte(*got);
    }

    return false;
}

inline auto to_bytes(std::initializer_list<uint8_t> values) -> std::vector<std::byte> {
    std::vector<std::byte> result{};
    result.reserve(values.size());

    for (const auto value : values) {
        result.push_back(std::byte{value});
    }

    return result;
}

// Straightforward decoders, only used to check encoder output.
namespace reference {

template <typename T>
struct Decoded {
    T value;
    std::size_t length;
};

inline auto decode_uleb128(std::span<const std::byte> bytes)
        -> std::optional<Decoded<uint64_t>> {
    uint64_t value = 0;
    auto shift = 0u;

    for (auto i = 0uz; i < bytes.size(); ++i) {
        const auto byte = std::to_integer<uint8_t>(bytes[i]);

        if (shift < 64) {
            value |= static_cast<uint64_t>(byte & 0x7F) << shift;
        }

        shift += 7;

        if ((byte & 0x80) == 0) {
            return Decoded<uint64_t>{value, i + 1};
        }
    }

    return std::nullopt;
}

inline auto decode_sleb128(std::span<const std::byte> bytes)
        -> std::optional<Decoded<int64_t>> {
    uint64_t value = 0;
    auto shift = 0u;

    for (auto i = 0uz; i < bytes.size(); ++i) {
        const auto byte = std::to_integer<uint8_t>(bytes[i]);

        if (shift < 64) {
            value |= static_cast<uint64_t>(byte & 0x7F) << shift;
        }

        shift += 7;

        if ((byte & 0x80) == 0) {
            if (shift < 64 && (byte & 0x40) != 0) {
                value |= ~uint64_t{0} << shift;
            }

            return Decoded<int64_t>{static_cast<int64_t>(value), i + 1};
        }
    }

    return std::nullopt;
}

inline auto read_little_endian(std::span<const std::byte> bytes) -> uint64_t {
    uint64_t value = 0;

    for (auto i = 0uz; i < bytes.size(); ++i) {
        value |= std::to_integer<uint64_t>(bytes[i]) << (8 * i);
    }

    return value;
}

inline auto decode_vint64(std::span<const std::byte> bytes)
        -> std::optional<Decoded<uint64_t>> {
    if (bytes.empty()) {
        return std::nullopt;
    }

    const auto first = std::to_integer<uint8_t>(bytes[0]);

    if (first == 0) {
        if (bytes.size() < 9) {
            return std::nullopt;
        }

        return Decoded<uint64_t>{read_little_endian(bytes.subspan(1, 8)), 9};
    }

    const auto length = static_cast<std::size_t>(std::countr_zero(first)) + 1;

    if (bytes.size() < length) {
        return std::nullopt;
    }

    return Decoded<uint64_t>{
        read_little_endian(bytes.first(length)) >> length,
        length
    };
}

inline auto unzigzag(uint64_t value) -> int64_t {
    return static_cast<int64_t>(value >> 1) ^ -static_cast<int64_t>(value & 1);
}

}

#endif // HELPERS_H
