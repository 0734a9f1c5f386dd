#include <bit>

#include "vint64.h"

auto vint64::encoded_length(uint64_t value) noexcept -> std::size_t {
    const auto significant_bits = 64 - std::countl_zero(value);

    if (significant_bits <= 7) {
        return 1;
    }

    const auto length = static_cast<std::size_t>((significant_bits + 6) / 7);
    return length > 8 ? max_length : length;
}

auto vint64::encode_unsigned(uint64_t value) noexcept -> vint64::Encoded {
    vint64::Encoded result{};
    const auto length = encoded_length(value);

    if (length == max_length) {
        result.push(std::byte{0x00});

        for (auto i = 0uz; i < sizeof(uint64_t); ++i) {
            result.push(static_cast<std::byte>(value >> (8 * i)));
        }

        return result;
    }

    // NOTE: `length` is at most 8 here, so the value has at most 56
    // significant bits and the shift cannot drop any of them.
    const auto prefixed = (value << length) | (uint64_t{1} << (length - 1));

    for (auto i = 0uz; i < length; ++i) {
        result.push(static_cast<std::byte>(prefixed >> (8 * i)));
    }

    return result;
}

auto vint64::zigzag(int64_t value) noexcept -> uint64_t {
    return (static_cast<uint64_t>(value) << 1)
        ^ static_cast<uint64_t>(value >> 63);
}

auto vint64::encode_signed(int64_t value) noexcept -> vint64::Encoded {
    return encode_unsigned(zigzag(value));
}
