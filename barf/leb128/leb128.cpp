#include <array>

#include <folly/Varint.h>

#include "leb128.h"

auto leb128::encode_unsigned(uint64_t value) noexcept -> leb128::Encoded {
    static_assert(folly::kMaxVarintLength64 == leb128::max_length);

    std::array<uint8_t, folly::kMaxVarintLength64> buffer{};
    const auto length = folly::encodeVarint(value, buffer.data());

    leb128::Encoded result{};

    for (auto i = 0uz; i < length; ++i) {
        result.push(std::byte{buffer[i]});
    }

    return result;
}

auto leb128::encode_signed(int64_t value) noexcept -> leb128::Encoded {
    leb128::Encoded result{};

    while (true) {
        auto byte = static_cast<uint8_t>(value & 0x7F);

        // NOTE: Relies on arithmetic right shift, guaranteed since C++20.
        value >>= 7;

        const auto sign_bit_set = (byte & 0x40) != 0;

        if ((value == 0 && !sign_bit_set) || (value == -1 && sign_bit_set)) {
            result.push(std::byte{byte});
            return result;
        }

        result.push(std::byte{static_cast<uint8_t>(byte | 0x80)});
    }
}
