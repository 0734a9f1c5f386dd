#ifndef ENCODED_H
#define ENCODED_H

#include <array>
#include <cstddef>
#include <span>

namespace barfer {

// Scratch space for one encoded value. Codecs fill it completely before any
// byte reaches a sink, so a value is appended whole or not at all.
template <std::size_t Capacity>
class Encoded {
private:
    std::array<std::byte, Capacity> bytes_{};
    std::size_t size_{0};
public:
    static constexpr auto capacity = Capacity;

    constexpr auto push(std::byte byte) noexcept -> void {
        bytes_[size_++] = byte;
    }

    constexpr auto size() const noexcept -> std::size_t {
        return size_;
    }

    constexpr auto view() const noexcept -> std::span<const std::byte> {
        return std::span<const std::byte>{bytes_}.first(size_);
    }
};

}

#endif // ENCODED_H
