#ifndef STACK_BUFFER_H
#define STACK_BUFFER_H

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <ranges>
#include <span>
#include <utility>

#include "barfer.h"

namespace sinks {

// Fixed-capacity sink kept inline, for callers that cannot allocate.
template <typename T, std::size_t N>
class StackBuffer {
private:
    std::array<T, N> buffer_{};
    std::size_t size_{0};
public:
    using value_type = T;

    static constexpr auto capacity() noexcept -> std::size_t {
        return N;
    }

    auto size() const noexcept -> std::size_t {
        return size_;
    }

    auto empty() const noexcept -> bool {
        return size_ == 0;
    }

    auto push(T value) -> barfer::Result {
        if (size_ >= N) {
            return std::unexpected(barfer::Error::NotEnoughCapacity);
        }

        buffer_[size_++] = std::move(value);
        return {};
    }

    // Appends the whole range or, when the buffer fills up first, nothing.
    template <std::ranges::input_range R>
        requires barfer::Lossless<std::ranges::range_reference_t<R>, T>
    auto extend(R&& values) -> barfer::Result {
        const auto initial_size = size_;

        for (auto&& value : values) {
            const auto result = push(T{std::forward<decltype(value)>(value)});

            if (!result) {
                size_ = initial_size;
                return result;
            }
        }

        return {};
    }

    // All-or-nothing: the group is only written when all of it fits.
    auto extend_from_slice(std::span<const T> values) -> barfer::Result {
        if (values.size() > N - size_) {
            return std::unexpected(barfer::Error::NotEnoughCapacity);
        }

        std::ranges::copy(values, buffer_.begin() + size_);
        size_ += values.size();

        return {};
    }

    auto get() const noexcept -> std::span<const T> {
        return std::span<const T>{buffer_}.first(size_);
    }

    auto single(const T& value) -> barfer::Result {
        return push(value);
    }

    template <std::ranges::input_range R>
        requires barfer::Lossless<std::ranges::range_reference_t<R>, T>
    auto many(R&& values) -> barfer::Result {
        return extend(std::forward<R>(values));
    }

    auto slice(std::span<const T> values) -> barfer::Result {
        return extend_from_slice(values);
    }
};

}

#endif // STACK_BUFFER_H
