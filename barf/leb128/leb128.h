#ifndef LEB128_H
#define LEB128_H

#include <cstddef>
#include <cstdint>

#include "barfer.h"
#include "encoded.h"

// LEB128: 7 payload bits per byte, least significant group first, with the
// high bit set on every byte except the last.
namespace leb128 {

inline constexpr std::size_t max_length = 10;

using Encoded = barfer::Encoded<max_length>;

auto encode_unsigned(uint64_t value) noexcept -> Encoded;
auto encode_signed(int64_t value) noexcept -> Encoded;

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

#endif // LEB128_H
