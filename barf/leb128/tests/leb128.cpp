#include <array>
#include <cstdint>
#include <limits>
#include <vector>

#include <folly/Range.h>
#include <folly/Varint.h>

#include "gtest/gtest.h"

#include "leb128.h"
#include "stack_buffer.h"
#include "tests/helpers.h"

using Buffer = sinks::StackBuffer<std::byte, 64>;

namespace {

auto unsigned_samples() -> std::vector<uint64_t> {
    std::vector<uint64_t> samples{0, 1, 127, 128, 255, 300, 16383, 16384};

    for (auto shift = 7u; shift < 64; shift += 7) {
        const auto boundary = uint64_t{1} << shift;
        samples.push_back(boundary - 1);
        samples.push_back(boundary);
    }

    samples.push_back(std::numeric_limits<uint64_t>::max());
    return samples;
}

auto signed_samples() -> std::vector<int64_t> {
    std::vector<int64_t> samples{0, 1, -1, 63, -64, 64, -65, 127, -128};

    for (auto shift = 6u; shift < 63; shift += 7) {
        const auto boundary = int64_t{1} << shift;
        samples.push_back(boundary - 1);
        samples.push_back(boundary);
        samples.push_back(-boundary);
        samples.push_back(-boundary - 1);
    }

    samples.push_back(std::numeric_limits<int64_t>::max());
    samples.push_back(std::numeric_limits<int64_t>::min());
    return samples;
}

}

TEST(Leb128, EncodesUnsignedAsSingleValue) {
    Buffer buffer{};

    ASSERT_TRUE(barfer::single(buffer, leb128::Unsigned{300}));

    EXPECT_THAT(buffer.get(), EqualsBinary(to_bytes({0xAC, 0x02})));
}

TEST(Leb128, EncodesKnownUnsignedValues) {
    EXPECT_THAT(leb128::encode_unsigned(0).view(), EqualsBinary(to_bytes({0x00})));
    EXPECT_THAT(leb128::encode_unsigned(127).view(), EqualsBinary(to_bytes({0x7F})));
    EXPECT_THAT(
        leb128::encode_unsigned(128).view(),
        EqualsBinary(to_bytes({0x80, 0x01}))
    );
    EXPECT_THAT(
        leb128::encode_unsigned(314159).view(),
        EqualsBinary(to_bytes({0xAF, 0x96, 0x13}))
    );
    EXPECT_THAT(
        leb128::encode_unsigned(std::numeric_limits<uint64_t>::max()).view(),
        EqualsBinary(to_bytes({
            0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01
        }))
    );
}

TEST(Leb128, EncodesKnownSignedValues) {
    EXPECT_THAT(leb128::encode_signed(0).view(), EqualsBinary(to_bytes({0x00})));
    EXPECT_THAT(leb128::encode_signed(-1).view(), EqualsBinary(to_bytes({0x7F})));
    EXPECT_THAT(leb128::encode_signed(63).view(), EqualsBinary(to_bytes({0x3F})));
    EXPECT_THAT(leb128::encode_signed(-64).view(), EqualsBinary(to_bytes({0x40})));
    EXPECT_THAT(
        leb128::encode_signed(64).view(),
        EqualsBinary(to_bytes({0xC0, 0x00}))
    );
    EXPECT_THAT(
        leb128::encode_signed(-65).view(),
        EqualsBinary(to_bytes({0xBF, 0x7F}))
    );
    EXPECT_THAT(
        leb128::encode_signed(-123456).view(),
        EqualsBinary(to_bytes({0xC0, 0xBB, 0x78}))
    );
}

TEST(Leb128, UnsignedRoundTripsThroughReferenceDecoder) {
    for (const auto value : unsigned_samples()) {
        Buffer buffer{};
        ASSERT_TRUE(leb128::write_unsigned(buffer, value));

        const auto decoded = reference::decode_uleb128(buffer.get());

        ASSERT_TRUE(decoded.has_value()) << "value " << value;
        EXPECT_EQ(value, decoded->value);
        EXPECT_EQ(buffer.size(), decoded->length);
        EXPECT_LE(buffer.size(), leb128::max_length);
    }
}

TEST(Leb128, UnsignedMatchesFollyDecoder) {
    for (const auto value : unsigned_samples()) {
        const auto encoded = leb128::encode_unsigned(value);
        const auto bytes = encoded.view();

        folly::ByteRange range{
            reinterpret_cast<const uint8_t*>(bytes.data()),
            bytes.size()
        };

        EXPECT_EQ(value, folly::decodeVarint(range)) << "value " << value;
        EXPECT_TRUE(range.empty());
    }
}

TEST(Leb128, SignedRoundTripsThroughReferenceDecoder) {
    for (const auto value : signed_samples()) {
        Buffer buffer{};
        ASSERT_TRUE(leb128::write_signed(buffer, value));

        const auto decoded = reference::decode_sleb128(buffer.get());

        ASSERT_TRUE(decoded.has_value()) << "value " << value;
        EXPECT_EQ(value, decoded->value);
        EXPECT_EQ(buffer.size(), decoded->length);
        EXPECT_LE(buffer.size(), leb128::max_length);
    }
}

TEST(Leb128, ConcatenatesValuesInOrder) {
    Buffer buffer{};

    const auto values = std::array{
        leb128::Unsigned{1},
        leb128::Unsigned{300},
        leb128::Unsigned{2}
    };

    ASSERT_TRUE(barfer::many(buffer, values));

    EXPECT_THAT(buffer.get(), EqualsBinary(to_bytes({0x01, 0xAC, 0x02, 0x02})));
}

TEST(Leb128, NeverAppendsPartialEncoding) {
    sinks::StackBuffer<std::byte, 2> buffer{};
    ASSERT_TRUE(leb128::write_unsigned(buffer, 1));

    const auto result = leb128::write_unsigned(buffer, 300);

    ASSERT_FALSE(result);
    EXPECT_EQ(barfer::Error::NotEnoughCapacity, result.error());
    EXPECT_THAT(buffer.get(), EqualsBinary(to_bytes({0x01})));
}
