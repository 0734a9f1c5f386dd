#ifndef SINKS_H
#define SINKS_H

#include <concepts>
#include <cstddef>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "barfer.h"

namespace sinks {

template <typename T>
class VectorSink {
private:
    std::vector<T> buffer_;
public:
    using value_type = T;

    VectorSink() = default;

    explicit VectorSink(std::vector<T> buffer) noexcept
        : buffer_(std::move(buffer)) {}

    auto single(const T& value) -> barfer::Result {
        buffer_.push_back(value);
        return {};
    }

    template <std::ranges::input_range R>
        requires barfer::Lossless<std::ranges::range_reference_t<R>, T>
    auto many(R&& values) -> barfer::Result {
        if constexpr (std::ranges::sized_range<R>) {
            reserve(std::ranges::size(values));
        }

        for (auto&& value : values) {
            buffer_.push_back(T{std::forward<decltype(value)>(value)});
        }

        return {};
    }

    auto slice(std::span<const T> values) -> barfer::Result {
        buffer_.insert(buffer_.end(), values.begin(), values.end());
        return {};
    }

    auto reserve(std::size_t additional) -> void {
        buffer_.reserve(buffer_.size() + additional);
    }

    auto size() const noexcept -> std::size_t {
        return buffer_.size();
    }

    auto view() const noexcept -> std::span<const T> {
        return buffer_;
    }

    auto take() && noexcept -> std::vector<T> {
        return std::move(buffer_);
    }
};

// Text sink: takes codepoints, stores them as UTF-8.
class StringSink {
private:
    std::string buffer_;
public:
    using value_type = char32_t;

    StringSink();
    explicit StringSink(std::string) noexcept;

    auto single(char32_t codepoint) -> barfer::Result;
    auto slice(std::span<const char32_t> codepoints) -> barfer::Result;

    // Both validate the whole input before appending any of it.
    auto append_str(std::string_view text) -> barfer::Result;
    auto append_bytes(std::span<const std::byte> bytes) -> barfer::Result;

    auto reserve(std::size_t additional) -> void;
    auto size() const noexcept -> std::size_t;
    auto view() const noexcept -> std::string_view;
    auto take() && noexcept -> std::string;
};

}

#endif // SINKS_H
