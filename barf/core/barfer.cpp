#include "barfer.h"

auto barfer::describe(barfer::Error error) noexcept -> std::string_view {
    switch (error) {
        case barfer::Error::NotEnoughCapacity:
            return "not enough capacity left in sink";
        case barfer::Error::InvalidCodepoint:
            return "value is not a Unicode scalar value";
        case barfer::Error::InvalidUtf8:
            return "input is not well-formed UTF-8";
    }

    return "unknown error";
}
