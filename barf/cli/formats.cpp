#include <algorithm>
#include <array>
#include <cstdint>

#include "barfer.h"
#include "formats.h"
#include "logging.h"
#include "numbers.h"
#include "utf8.h"

#ifdef BARF_WITH_LEB128
#include "leb128.h"
#endif

#ifdef BARF_WITH_VINT64
#include "vint64.h"
#endif

using namespace std::literals;

namespace {

using formats::ByteSink;
using formats::parse_number;

auto check(barfer::Result result, std::string_view value) -> void {
    if (!result) {
        throw std::runtime_error(
            std::format(
                "Failed to encode value ({}): {}",
                value,
                barfer::describe(result.error())
            )
        );
    }
}

auto write_byte(ByteSink& sink, std::string_view text) -> void {
    check(barfer::single(sink, std::byte{parse_number<uint8_t>(text)}), text);
}

template <typename E>
auto write_number(ByteSink& sink, std::string_view text) -> void {
    using T = decltype(E::value);
    check(barfer::single(sink, E{parse_number<T>(text)}), text);
}

auto write_char(ByteSink& sink, std::string_view text) -> void {
    auto digits = text;

    if (digits.starts_with("U+"sv) || digits.starts_with("u+"sv)) {
        digits.remove_prefix(2);
    }

    const auto codepoint = parse_number<uint32_t>(digits, 16);
    check(utf8::character(sink, static_cast<char32_t>(codepoint)), text);
}

auto write_text(ByteSink& sink, std::string_view text) -> void {
    // NOTE: Round-trip through a text sink so malformed input is rejected
    // instead of passed through byte for byte.
    sinks::StringSink validated{};
    check(validated.append_str(text), text);
    check(utf8::string(sink, validated.view()), text);
}

constexpr auto table = std::to_array<formats::Format>({
    {"byte", write_byte},
    {"le-u8", write_number<numbers::Little<uint8_t>>},
    {"le-u16", write_number<numbers::Little<uint16_t>>},
    {"le-u32", write_number<numbers::Little<uint32_t>>},
    {"le-u64", write_number<numbers::Little<uint64_t>>},
    {"le-i8", write_number<numbers::Little<int8_t>>},
    {"le-i16", write_number<numbers::Little<int16_t>>},
    {"le-i32", write_number<numbers::Little<int32_t>>},
    {"le-i64", write_number<numbers::Little<int64_t>>},
    {"le-f32", write_number<numbers::Little<float>>},
    {"le-f64", write_number<numbers::Little<double>>},
    {"be-u8", write_number<numbers::Big<uint8_t>>},
    {"be-u16", write_number<numbers::Big<uint16_t>>},
    {"be-u32", write_number<numbers::Big<uint32_t>>},
    {"be-u64", write_number<numbers::Big<uint64_t>>},
    {"be-i8", write_number<numbers::Big<int8_t>>},
    {"be-i16", write_number<numbers::Big<int16_t>>},
    {"be-i32", write_number<numbers::Big<int32_t>>},
    {"be-i64", write_number<numbers::Big<int64_t>>},
    {"be-f32", write_number<numbers::Big<float>>},
    {"be-f64", write_number<numbers::Big<double>>},
    {"ne-u8", write_number<numbers::Native<uint8_t>>},
    {"ne-u16", write_number<numbers::Native<uint16_t>>},
    {"ne-u32", write_number<numbers::Native<uint32_t>>},
    {"ne-u64", write_number<numbers::Native<uint64_t>>},
    {"ne-i8", write_number<numbers::Native<int8_t>>},
    {"ne-i16", write_number<numbers::Native<int16_t>>},
    {"ne-i32", write_number<numbers::Native<int32_t>>},
    {"ne-i64", write_number<numbers::Native<int64_t>>},
    {"ne-f32", write_number<numbers::Native<float>>},
    {"ne-f64", write_number<numbers::Native<double>>},
    {"char", write_char},
    {"text", write_text},
#ifdef BARF_WITH_LEB128
    {"uleb128", write_number<leb128::Unsigned>},
    {"sleb128", write_number<leb128::Signed>},
#endif
#ifdef BARF_WITH_VINT64
    {"uvint64", write_number<vint64::Unsigned>},
    {"svint64", write_number<vint64::Signed>},
#endif
});

// NOTE: Known to the CLI but only present when their adapter is built.
constexpr auto optional_formats = std::to_array({
    "uleb128"sv, "sleb128"sv, "uvint64"sv, "svint64"sv
});

}

auto formats::available() noexcept -> std::span<const formats::Format> {
    return table;
}

auto formats::find_writer(std::string_view name) -> formats::Writer {
    const auto format = std::ranges::find(table, name, &Format::name);

    if (format != table.end()) {
        return format->write;
    }

    if (std::ranges::find(optional_formats, name) != optional_formats.end()) {
        throw std::runtime_error(
            std::format("Format ({}) is not available in this build", name)
        );
    }

    throw std::runtime_error(std::format("Unknown format ({})", name));
}

auto formats::to_hex(std::span<const std::byte> bytes) -> std::string {
    std::string result{};

    for (auto i = 0uz; i < bytes.size(); ++i) {
        if (i > 0) {
            result.push_back(' ');
        }

        result += std::format("{:02X}", std::to_integer<unsigned>(bytes[i]));
    }

    return result;
}

auto formats::encode_values(
    std::string_view format,
    std::span<const std::string_view> values
) -> std::string {
    const auto write = find_writer(format);

    if (values.empty()) {
        logging::warning("No values given, nothing to encode");
    }

    ByteSink sink{};

    for (const auto value : values) {
        const auto before = sink.size();
        write(sink, value);

        logging::info(
            "Encoded {} as {} byte(s) of {}",
            value,
            sink.size() - before,
            format
        );
    }

    return to_hex(sink.view());
}
