#ifndef BARFER_H
#define BARFER_H

#include <concepts>
#include <cstddef>
#include <expected>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace barfer {

enum class Error {
    NotEnoughCapacity,
    InvalidCodepoint,
    InvalidUtf8
};

using Result = std::expected<void, Error>;

auto describe(Error) noexcept -> std::string_view;

// A sink stores elements of `value_type` and only ever grows at the tail.
// `single` appends one element, `slice` appends a contiguous group. A sink
// may also provide `many` to drain a range itself and `reserve` to grow its
// capacity ahead of a known-size group.
template <typename S>
concept Sink = requires(
    S& sink,
    const typename S::value_type& value,
    std::span<const typename S::value_type> values
) {
    { sink.single(value) } -> std::same_as<Result>;
    { sink.slice(values) } -> std::same_as<Result>;
};

template <Sink S>
using element_t = typename S::value_type;

template <typename S, typename E>
concept Barfer = Sink<S> && std::same_as<element_t<S>, E>;

template <typename S>
concept ByteSink = Barfer<S, std::byte>;

template <typename S>
concept TextSink = Barfer<S, char32_t>;

template <typename S, typename R>
concept DrainsRange = requires(S& sink, R&& values) {
    { sink.many(std::forward<R>(values)) } -> std::same_as<Result>;
};

template <typename S>
concept Reserves = requires(S& sink, std::size_t additional) {
    sink.reserve(additional);
};

// Values that expand into one or more sink elements. The expansion is found
// by argument-dependent lookup, so encoders for a type live beside it.
template <typename V, typename S>
concept Encodable = Sink<S> && requires(S& sink, const V& value) {
    { encode_into(sink, value) } -> std::same_as<Result>;
};

template <typename V>
concept FixedWidth = requires {
    { V::encoded_size } -> std::convertible_to<std::size_t>;
};

// `From` builds a `T` without a narrowing conversion.
template <typename From, typename T>
concept Lossless = requires(From&& value) {
    T{std::forward<From>(value)};
};

// Elements go in as exactly the sink's element type. Anything else has to
// be an encodable value.
template <typename S, typename V>
concept Accepts = Sink<S>
    && (std::same_as<std::remove_cvref_t<V>, element_t<S>>
        || Encodable<std::remove_cvref_t<V>, S>);

template <Sink S, std::same_as<element_t<S>> V>
auto single(S& sink, const V& value) -> Result {
    return sink.single(value);
}

template <Sink S, Encodable<S> V>
auto single(S& sink, const V& value) -> Result {
    return encode_into(sink, value);
}

// Drains `values` exactly once, in iteration order. Stops at the first value
// that fails; whatever was appended before it stays in the sink.
template <Sink S, std::ranges::input_range R>
    requires DrainsRange<S, R>
        || Accepts<S, std::ranges::range_reference_t<R>>
auto many(S& sink, R&& values) -> Result {
    if constexpr (DrainsRange<S, R>) {
        return sink.many(std::forward<R>(values));
    } else {
        for (auto&& value : values) {
            const auto result = barfer::single(sink, value);

            if (!result) {
                return result;
            }
        }

        return {};
    }
}

template <Sink S>
auto slice(S& sink, std::span<const element_t<S>> values) -> Result {
    return sink.slice(values);
}

template <Sink S, std::ranges::contiguous_range R>
    requires std::ranges::sized_range<R>
        && Encodable<std::ranges::range_value_t<R>, S>
auto slice(S& sink, const R& values) -> Result {
    using V = std::ranges::range_value_t<R>;

    if constexpr (FixedWidth<V> && Reserves<S>) {
        sink.reserve(std::ranges::size(values) * V::encoded_size);
    }

    for (const auto& value : values) {
        const auto result = encode_into(sink, value);

        if (!result) {
            return result;
        }
    }

    return {};
}

}

#endif // BARFER_H
