#include <optional>
#include <utility>

#include <cstdint>
#include <gtest/gtest.h>
#include <unspool.hpp>

using unspool::ByteString;
using unspool::Either;
using unspool::Left;
using unspool::Right;

TEST(LookAheadTest, DoesNotConsume) {
    auto d = unspool::get_two_of(unspool::look_ahead(unspool::get_word16be()),
                                 unspool::get_word16be());

    auto result = unspool::run(d, ByteString{0x12, 0x34});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->first, 0x1234);
    EXPECT_EQ(result->second, 0x1234);
}

TEST(LookAheadTest, FailurePropagates) {
    auto d = unspool::look_ahead(unspool::get_word32be());

    auto result = unspool::run(d, ByteString{1});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().reason, "too few bytes");
}

TEST(LookAheadTest, FailureRestoresInputForAlternative) {
    auto d = unspool::or_else(
        unspool::look_ahead(unspool::get_word8().then(unspool::fail<uint8_t>("x"))),
        unspool::get_word8());

    auto result = unspool::run_with_remainder(d, ByteString{5, 6}, 0);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->first, 5);
    EXPECT_EQ(result->second, (ByteString{6}));
}

TEST(LookAheadTest, AcrossChunks) {
    auto d = unspool::get_two_of(unspool::look_ahead(unspool::get_word32be()),
                                 unspool::get_word32be());

    auto result = unspool::run_partial(d, ByteString{0x00, 0x00});
    ASSERT_TRUE(result.is_partial());
    result = std::move(result).feed(ByteString{0x00, 0x01, 0x09, 0x09});
    ASSERT_TRUE(result.is_done());
    EXPECT_EQ(result.value().first, 1u);
    EXPECT_EQ(result.value().second, 1u);
    EXPECT_EQ(result.leftover(), (ByteString{0x09, 0x09}));
}

namespace {

// Tag 1 followed by a byte is a value; anything else is "nothing"
unspool::Decoder<std::optional<uint8_t>> tagged_byte() {
    return unspool::get_word8().and_then([](uint8_t tag) {
        if (tag == 1) {
            return unspool::get_word8().map([](uint8_t v) { return std::optional<uint8_t>{v}; });
        }
        return unspool::pure(std::optional<uint8_t>{});
    });
}

unspool::Decoder<Either<uint8_t, uint16_t>> wide_or_narrow() {
    return unspool::get_word8().and_then([](uint8_t tag) {
        using E = Either<uint8_t, uint16_t>;
        if (tag == 0xFF) {
            return unspool::get_word16be().map([](uint16_t v) { return E{Right<uint16_t>{v}}; });
        }
        return unspool::pure(E{Left<uint8_t>{tag}});
    });
}

} // namespace

TEST(LookAheadTest, MaybeKeepsConsumptionOnValue) {
    auto d = unspool::look_ahead_m(tagged_byte());

    auto result = unspool::run_with_remainder(d, ByteString{1, 42, 7}, 0);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->first, std::optional<uint8_t>{42});
    EXPECT_EQ(result->second, (ByteString{7}));
}

TEST(LookAheadTest, MaybeRewindsOnNothing) {
    auto d = unspool::look_ahead_m(tagged_byte());

    auto result = unspool::run_with_remainder(d, ByteString{0, 42}, 0);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->first.has_value());
    EXPECT_EQ(result->second, (ByteString{0, 42}));
}

TEST(LookAheadTest, EitherKeepsConsumptionOnRight) {
    auto d = unspool::look_ahead_e(wide_or_narrow());

    auto result = unspool::run_with_remainder(d, ByteString{0xFF, 0x01, 0x02, 0x03}, 0);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(unspool::is_right(result->first));
    EXPECT_EQ(std::get<Right<uint16_t>>(result->first).value, 0x0102);
    EXPECT_EQ(result->second, (ByteString{0x03}));
}

TEST(LookAheadTest, EitherRewindsOnLeft) {
    auto d = unspool::look_ahead_e(wide_or_narrow());

    auto result = unspool::run_with_remainder(d, ByteString{0x05, 0x06}, 0);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(unspool::is_left(result->first));
    EXPECT_EQ(std::get<Left<uint8_t>>(result->first).value, 0x05);
    EXPECT_EQ(result->second, (ByteString{0x05, 0x06}));
}

TEST(LookAheadTest, NestedInsideOrElseAcrossChunks) {
    // The look-ahead rewinds, then the outer branch fails and rewinds again
    auto first = unspool::look_ahead(unspool::get_word16be())
                     .and_then([](uint16_t) { return unspool::get_word32be(); })
                     .and_then([](uint32_t) { return unspool::fail<uint32_t>("reject"); });
    auto d = first.or_else(unspool::get_word8().map([](uint8_t v) { return uint32_t{v}; }));

    auto result = unspool::run_partial(d, ByteString{0x0A});
    ASSERT_TRUE(result.is_partial());
    result = std::move(result).feed(ByteString{0x0B});
    ASSERT_TRUE(result.is_partial());
    result = std::move(result).feed(ByteString{0x0C, 0x0D});
    ASSERT_TRUE(result.is_done());
    EXPECT_EQ(result.value(), 0x0Au);
    EXPECT_EQ(result.leftover(), (ByteString{0x0B, 0x0C, 0x0D}));
}
