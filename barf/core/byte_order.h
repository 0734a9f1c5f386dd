#ifndef BYTE_ORDER_H
#define BYTE_ORDER_H

#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>

#ifdef __cplusplus
extern "C++" {

namespace endian {

template <typename T>
concept Number =
    (std::integral<T> && !std::same_as<T, bool>)
    || std::same_as<T, float>
    || std::same_as<T, double>;

template <Number V>
using Bytes = std::array<std::byte, sizeof(V)>;

template <Number V>
constexpr auto native(V value) -> Bytes<V> {
    return std::bit_cast<Bytes<V>>(value);
}

template <Number V>
constexpr auto big(V value) -> Bytes<V> {
    auto bytes = native(value);

    if constexpr (std::endian::native == std::endian::little) {
        std::ranges::reverse(bytes);
    }

    return bytes;
}

template <Number V>
constexpr auto little(V value) -> Bytes<V> {
    auto bytes = native(value);

    if constexpr (std::endian::native == std::endian::big) {
        std::ranges::reverse(bytes);
    }

    return bytes;
}

}

}
#endif

#endif // BYTE_ORDER_H
