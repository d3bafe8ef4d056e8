#include <utility>

#include <cstdint>
#include <gtest/gtest.h>
#include <unspool.hpp>

using unspool::ByteString;

TEST(IsolateTest, ExactConsumption) {
    auto d = unspool::isolate(2, unspool::get_word16be());

    auto result = unspool::run_with_remainder(d, ByteString{0x01, 0x02, 0x03}, 0);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->first, 0x0102);
    EXPECT_EQ(result->second, (ByteString{0x03}));
}

TEST(IsolateTest, UnderConsumptionFails) {
    auto d = unspool::isolate(3, unspool::get_word16be());

    auto result = unspool::run(d, ByteString{0x01, 0x02, 0x03});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().reason, "Failed reading: not all bytes parsed in isolate");
}

TEST(IsolateTest, OverConsumptionFails) {
    auto d = unspool::isolate(2, unspool::get_word32be());

    auto result = unspool::run(d, ByteString{1, 2, 3, 4});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().reason, "too few bytes");
}

TEST(IsolateTest, NegativeLengthFails) {
    auto d = unspool::isolate(-1, unspool::get_word8());

    auto result = unspool::run(d, ByteString{1, 2});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().reason,
              "Failed reading: Attempted to isolate a negative number of bytes");
}

TEST(IsolateTest, WindowLongerThanInputFails) {
    auto result = unspool::run(unspool::isolate(4, unspool::get_word8()), ByteString{1, 2});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().reason, "too few bytes");
}

TEST(IsolateTest, ZeroWidthWindow) {
    auto d = unspool::isolate(0, unspool::is_empty());

    auto result = unspool::run_with_remainder(d, ByteString{7}, 0);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->first);
    EXPECT_EQ(result->second, (ByteString{7}));
}

TEST(IsolateTest, InnerDecoderSeesOnlyWindow) {
    auto d = unspool::isolate(3, unspool::remaining());

    auto result = unspool::run(d.or_else(unspool::pure<std::size_t>(99)), ByteString{1, 2, 3, 4, 5});
    ASSERT_TRUE(result.has_value());
    // remaining() consumes nothing, so the window is left unparsed
    EXPECT_EQ(*result, 99u);

    auto counted = unspool::isolate(3, unspool::remaining().and_then([](std::size_t n) {
        return unspool::skip(n).then(unspool::pure(n));
    }));
    auto whole = unspool::run(counted, ByteString{1, 2, 3, 4, 5});
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(*whole, 3u);
}

TEST(IsolateTest, IncrementalWaitsForWholeWindow) {
    auto d = unspool::isolate(3, unspool::get_word8().then(unspool::get_word16le()));

    auto result = unspool::run_partial(d, ByteString{0x01});
    ASSERT_TRUE(result.is_partial());
    result = std::move(result).feed(ByteString{0x02, 0x03, 0x04});
    ASSERT_TRUE(result.is_done());
    EXPECT_EQ(result.value(), 0x0302);
    EXPECT_EQ(result.leftover(), (ByteString{0x04}));
}

TEST(IsolateTest, IncrementalNeverReadsPastWindow) {
    // The window holds the input; over-reading it fails instead of suspending
    auto d = unspool::isolate(2, unspool::get_word32be());

    auto result = unspool::run_partial(d, ByteString{1, 2, 3, 4});
    EXPECT_TRUE(result.is_fail());
    EXPECT_EQ(result.error().reason, "too few bytes");
}

TEST(IsolateTest, OuterModeRestoredAfterWindow) {
    // After the window the decoder may suspend again
    auto d = unspool::isolate(1, unspool::get_word8()).then(unspool::get_word16be());

    auto result = unspool::run_partial(d, ByteString{0x01, 0x02});
    ASSERT_TRUE(result.is_partial());
    result = std::move(result).feed(ByteString{0x03});
    ASSERT_TRUE(result.is_done());
    EXPECT_EQ(result.value(), 0x0203);
}
