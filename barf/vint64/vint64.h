#ifndef VINT64_H
#define VINT64_H

#include <cstddef>
#include <cstdint>

#include "barfer.h"
#include "encoded.h"

// vint64: a prefix varint. The count of trailing zero bits in the first byte
// gives the total length, and the value follows in little-endian order. A
// value needing more than 56 bits is written as a zero byte followed by all
// eight bytes of the value.
namespace vint64 {

inline constexpr std::size_t max_length = 9;

using Encoded = barfer::Encoded<max_length>;

auto encoded_length(uint64_t value) noexcept -> std::size_t;

auto encode_unsigned(uint64_t value) noexcept -> Encoded;

// Zigzag-maps `value` so small magnitudes of either sign stay short.
auto encode_signed(int64_t value) noexcept -> Encoded;

auto zigzag(int64_t value) noexcept -> uint64_t;

struct Unsigned {
    uint64_t value;
};

struct Signed {
    int64_t value;
};

auto encode_into(barfer::ByteSink auto& sink, const Unsigned& number)
        -> barfer::Result {
    const auto encoded = encode_unsigned(number.value);
    return barfer::slice(sink, encoded.view());
}

auto encode_into(barfer::ByteSink auto& sink, const Signed& number)
        -> barfer::Result {
    const auto encoded = encode_signed(number.value);
    return barfer::slice(sink, encoded.view());
}

auto write_unsigned(barfer::ByteSink auto& sink, uint64_t value)
        -> barfer::Result {
    return barfer::single(sink, Unsigned{value});
}

auto write_signed(barfer::ByteSink auto& sink, int64_t value)
        -> barfer::Result {
    return barfer::single(sink, Signed{value});
}

}

#endif // VINT64_H
