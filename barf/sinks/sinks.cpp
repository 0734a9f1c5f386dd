#include "sinks.h"
#include "utf8.h"

sinks::StringSink::StringSink() : buffer_(std::string()) {}

sinks::StringSink::StringSink(std::string buffer) noexcept
    : buffer_(std::move(buffer)) {}

auto sinks::StringSink::single(char32_t codepoint) -> barfer::Result {
    const auto encoded = utf8::encode(codepoint);

    if (!encoded) {
        return std::unexpected(encoded.error());
    }

    for (const auto byte : encoded->view()) {
        buffer_.push_back(static_cast<char>(byte));
    }

    return {};
}

auto sinks::StringSink::slice(std::span<const char32_t> codepoints)
        -> barfer::Result {
    // NOTE: Most text is ASCII, so one byte per codepoint is a decent guess.
    reserve(codepoints.size());

    for (const auto codepoint : codepoints) {
        const auto result = single(codepoint);

        if (!result) {
            return result;
        }
    }

    return {};
}

auto sinks::StringSink::append_str(std::string_view text) -> barfer::Result {
    return append_bytes(std::as_bytes(std::span{text}));
}

auto sinks::StringSink::append_bytes(std::span<const std::byte> bytes)
        -> barfer::Result {
    if (!utf8::is_valid(bytes)) {
        return std::unexpected(barfer::Error::InvalidUtf8);
    }

    buffer_.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return {};
}

auto sinks::StringSink::reserve(std::size_t additional) -> void {
    buffer_.reserve(buffer_.size() + additional);
}

auto sinks::StringSink::size() const noexcept -> std::size_t {
    return buffer_.size();
}

auto sinks::StringSink::view() const noexcept -> std::string_view {
    return buffer_;
}

auto sinks::StringSink::take() && noexcept -> std::string {
    return std::move(buffer_);
}
