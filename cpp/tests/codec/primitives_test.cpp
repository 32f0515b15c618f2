#include <gtest/gtest.h>
#include "../../codec/codec.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <optional>

using codec::buffer_t;

TEST(CodecPrimitivesTest, boolean) {
    EXPECT_EQ(buffer_t({0x01}), codec::to_bytes(true));
    EXPECT_EQ(buffer_t({0x00}), codec::to_bytes(false));
    EXPECT_TRUE(codec::from_bytes<bool>(buffer_t{0x01}));
    EXPECT_FALSE(codec::from_bytes<bool>(buffer_t{0x00}));
}

TEST(CodecPrimitivesTest, invalid_boolean) {
    try {
        codec::from_bytes<bool>(buffer_t{0x02});
        FAIL() << "expected invalid_boolean";
    } catch (const codec::invalid_boolean& e) {
        EXPECT_EQ("2", e.param("value"));
    }
}

TEST(CodecPrimitivesTest, integers_are_big_endian) {
    EXPECT_EQ(buffer_t({0x01, 0x02}), codec::to_bytes(uint16_t(0x0102)));
    EXPECT_EQ(buffer_t({0x00, 0x00, 0x00, 0x07}), codec::to_bytes(int32_t(7)));
    EXPECT_EQ(buffer_t({0xFF, 0xFF, 0xFF, 0xFE}), codec::to_bytes(int32_t(-2)));
    EXPECT_EQ(buffer_t({0x80}), codec::to_bytes(int8_t(-128)));
    EXPECT_EQ(buffer_t({0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08}),
              codec::to_bytes(uint64_t(0x0102030405060708)));

    EXPECT_EQ(std::numeric_limits<int64_t>::min(),
              codec::from_bytes<int64_t>(codec::to_bytes(std::numeric_limits<int64_t>::min())));
    EXPECT_EQ(0xCAFEu, codec::from_bytes<uint16_t>(buffer_t{0xCA, 0xFE}));
}

TEST(CodecPrimitivesTest, floating_point_bit_pattern) {
    EXPECT_EQ(buffer_t({0x3F, 0x80, 0x00, 0x00}), codec::to_bytes(1.0f));
    EXPECT_EQ(buffer_t({0xC0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}), codec::to_bytes(-2.0));
    EXPECT_EQ(3.25, codec::from_bytes<double>(codec::to_bytes(3.25)));
    EXPECT_TRUE(std::isnan(codec::from_bytes<float>(codec::to_bytes(std::numeric_limits<float>::quiet_NaN()))));
    EXPECT_EQ(std::numeric_limits<double>::infinity(),
              codec::from_bytes<double>(codec::to_bytes(std::numeric_limits<double>::infinity())));
}

TEST(CodecPrimitivesTest, optional) {
    EXPECT_EQ(buffer_t({0x00}), codec::to_bytes(std::optional<int32_t>()));
    EXPECT_EQ(buffer_t({0x01, 0x00, 0x00, 0x00, 0x07}), codec::to_bytes(std::optional<int32_t>(7)));
    EXPECT_EQ(std::optional<int32_t>(7), codec::from_bytes<std::optional<int32_t>>(buffer_t{1, 0, 0, 0, 7}));
    EXPECT_EQ(std::nullopt, codec::from_bytes<std::optional<int32_t>>(buffer_t{0}));
}

TEST(CodecPrimitivesTest, optional_with_bad_discriminant) {
    try {
        codec::from_bytes<std::optional<int32_t>>(buffer_t{0x02, 0, 0, 0, 7});
        FAIL() << "expected unknown_variant";
    } catch (const codec::unknown_variant& e) {
        EXPECT_EQ(2u, e.value());
    }
}

TEST(CodecPrimitivesTest, truncated_integer_is_end_of_stream) {
    // The stream closes after 2 of the 4 bytes.
    EXPECT_THROW(codec::from_bytes<uint32_t>(buffer_t{0x00, 0x01}), codec::unexpected_end_of_stream);
    EXPECT_THROW(codec::from_bytes<uint8_t>(buffer_t{}), codec::unexpected_end_of_stream);
}

TEST(CodecPrimitivesTest, result) {
    using result_t = codec::result<uint16_t, std::string>;
    EXPECT_EQ(buffer_t({0x00, 0x00, 0x05}), codec::to_bytes(result_t::success(5)));
    EXPECT_EQ(buffer_t({0x01, 0, 0, 0, 0, 0, 0, 0, 2, 'n', 'o'}), codec::to_bytes(result_t::failure("no")));

    auto failure = codec::from_bytes<result_t>(buffer_t{0x01, 0, 0, 0, 0, 0, 0, 0, 2, 'n', 'o'});
    ASSERT_FALSE(failure.has_value());
    EXPECT_EQ("no", failure.error());
    EXPECT_THROW(codec::from_bytes<result_t>(buffer_t{0x02}), codec::unknown_variant);
}

TEST(CodecPrimitivesTest, duration) {
    using namespace std::chrono_literals;
    auto bytes = codec::to_bytes(std::chrono::milliseconds(2500));
    EXPECT_EQ(buffer_t({0, 0, 0, 0, 0, 0, 0, 2, 0x1D, 0xCD, 0x65, 0x00}), bytes);
    EXPECT_EQ(2500ms, codec::from_bytes<std::chrono::milliseconds>(bytes));
    EXPECT_EQ(std::chrono::nanoseconds(1'000'000'007), codec::from_bytes<std::chrono::nanoseconds>(
                                                           codec::to_bytes(std::chrono::nanoseconds(1'000'000'007))));
    EXPECT_THROW(codec::to_bytes(std::chrono::seconds(-1)), codec::negative_duration);
    EXPECT_THROW(codec::from_bytes<std::chrono::seconds>(buffer_t{0, 0, 0, 0, 0, 0, 0, 0, 0x3B, 0x9A, 0xCA, 0x00}),
                 codec::custom_failure);
}

TEST(CodecPrimitivesTest, duration_at_the_range_limit) {
    // 9223372036 seconds and 854775807 nanoseconds is the largest 64-bit nanosecond count.
    const buffer_t largest{0x00, 0x00, 0x00, 0x02, 0x25, 0xC1, 0x7D, 0x04, 0x32, 0xF2, 0xD7, 0xFF};
    EXPECT_EQ(std::chrono::nanoseconds::max(), codec::from_bytes<std::chrono::nanoseconds>(largest));

    const buffer_t one_more{0x00, 0x00, 0x00, 0x02, 0x25, 0xC1, 0x7D, 0x04, 0x32, 0xF2, 0xD8, 0x00};
    EXPECT_THROW(codec::from_bytes<std::chrono::nanoseconds>(one_more), codec::custom_failure);

    const buffer_t last_second{0x00, 0x00, 0x00, 0x02, 0x25, 0xC1, 0x7D, 0x04, 0x3B, 0x9A, 0xC9, 0xFF};
    EXPECT_THROW(codec::from_bytes<std::chrono::nanoseconds>(last_second), codec::custom_failure);
}

TEST(CodecPrimitivesTest, duration_is_not_truncated) {
    // 1 second and 5 nanoseconds.
    const buffer_t bytes{0, 0, 0, 0, 0, 0, 0, 1, 0x00, 0x00, 0x00, 0x05};
    EXPECT_EQ(std::chrono::nanoseconds(1'000'000'005), codec::from_bytes<std::chrono::nanoseconds>(bytes));
    EXPECT_THROW(codec::from_bytes<std::chrono::seconds>(bytes), codec::custom_failure);
    EXPECT_THROW(codec::from_bytes<std::chrono::minutes>(codec::to_bytes(std::chrono::seconds(61))),
                 codec::custom_failure);
    EXPECT_EQ(std::chrono::minutes(2), codec::from_bytes<std::chrono::minutes>(codec::to_bytes(std::chrono::seconds(120))));
}
