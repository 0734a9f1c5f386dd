#ifndef NUMBERS_H
#define NUMBERS_H

#include <span>

#include "barfer.h"
#include "byte_order.h"

namespace numbers {

using endian::Number;

template <Number T>
struct Little {
    static constexpr auto encoded_size = sizeof(T);
    T value;
};

template <Number T>
struct Big {
    static constexpr auto encoded_size = sizeof(T);
    T value;
};

template <Number T>
struct Native {
    static constexpr auto encoded_size = sizeof(T);
    T value;
};

template <Number T>
auto encode_into(barfer::ByteSink auto& sink, const Little<T>& number)
        -> barfer::Result {
    const auto bytes = endian::little(number.value);
    return barfer::slice(sink, std::span<const std::byte>{bytes});
}

template <Number T>
auto encode_into(barfer::ByteSink auto& sink, const Big<T>& number)
        -> barfer::Result {
    const auto bytes = endian::big(number.value);
    return barfer::slice(sink, std::span<const std::byte>{bytes});
}

template <Number T>
auto encode_into(barfer::ByteSink auto& sink, const Native<T>& number)
        -> barfer::Result {
    const auto bytes = endian::native(number.value);
    return barfer::slice(sink, std::span<const std::byte>{bytes});
}

template <Number T>
auto little(barfer::ByteSink auto& sink, T value) -> barfer::Result {
    return barfer::single(sink, Little<T>{value});
}

template <Number T>
auto big(barfer::ByteSink auto& sink, T value) -> barfer::Result {
    return barfer::single(sink, Big<T>{value});
}

template <Number T>
auto native(barfer::ByteSink auto& sink, T value) -> barfer::Result {
    return barfer::single(sink, Native<T>{value});
}

}

#endif // NUMBERS_H
