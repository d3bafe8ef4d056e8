#include <stdexcept>
#include <string>

#include <cstdint>
#include <gtest/gtest.h>
#include <unspool.hpp>

using unspool::ByteString;

TEST(ResultTest, PartialUntilEnoughInput) {
    auto result = unspool::run_partial(unspool::get_word32be(), ByteString{0x12, 0x34});
    ASSERT_TRUE(result.is_partial());

    result = std::move(result).feed(ByteString{0x56});
    ASSERT_TRUE(result.is_partial());

    result = std::move(result).feed(ByteString{0x78, 0x9A});
    ASSERT_TRUE(result.is_done());
    EXPECT_EQ(result.value(), 0x12345678u);
    EXPECT_EQ(result.leftover(), (ByteString{0x9A}));
}

TEST(ResultTest, EmptyChunkSignalsEndOfInput) {
    auto result = unspool::run_partial(unspool::get_word16le(), ByteString{0x01});
    ASSERT_TRUE(result.is_partial());

    result = std::move(result).feed(ByteString{});
    ASSERT_TRUE(result.is_fail());
    EXPECT_EQ(result.error().reason, "too few bytes");
    ASSERT_EQ(result.error().trace.size(), 1u);
    EXPECT_EQ(result.error().trace[0], "demandInput");
}

TEST(ResultTest, DoneIsFinal) {
    auto result = unspool::run_partial(unspool::get_word8(), ByteString{7, 8});
    ASSERT_TRUE(result.is_done());

    result = std::move(result).feed(ByteString{9});
    ASSERT_TRUE(result.is_done());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(result.leftover(), (ByteString{8}));
}

TEST(ResultTest, FailIsFinal) {
    auto result = unspool::run_partial(unspool::fail<int>("nope"), ByteString{});
    ASSERT_TRUE(result.is_fail());

    result = std::move(result).feed(ByteString{1});
    ASSERT_TRUE(result.is_fail());
    EXPECT_EQ(result.error().reason, "Failed reading: nope");
}

TEST(ResultTest, ResumingTwiceThrows) {
    auto result = unspool::run_partial(unspool::get_word16be(), ByteString{});
    ASSERT_TRUE(result.is_partial());

    auto copy = result;
    auto next = std::move(result).feed(ByteString{1, 2});
    ASSERT_TRUE(next.is_done());

    EXPECT_THROW((void)std::move(copy).feed(ByteString{1, 2}), std::logic_error);
}

TEST(ResultTest, MapTransformsDoneValue) {
    auto result = unspool::run_partial(unspool::get_word8(), ByteString{41})
                      .map([](uint8_t v) { return std::to_string(v + 1); });
    ASSERT_TRUE(result.is_done());
    EXPECT_EQ(result.value(), "42");
}

TEST(ResultTest, MapThroughPartial) {
    auto result = unspool::run_partial(unspool::get_word16be(), ByteString{0x01})
                      .map([](uint16_t v) { return v * 2; });
    ASSERT_TRUE(result.is_partial());

    result = std::move(result).feed(ByteString{0x00});
    ASSERT_TRUE(result.is_done());
    EXPECT_EQ(result.value(), 0x0200);
}

TEST(ResultTest, MapKeepsFailure) {
    auto result = unspool::run_partial(unspool::fail<int>("x"), ByteString{})
                      .map([](int v) { return v + 1; });
    ASSERT_TRUE(result.is_fail());
    EXPECT_EQ(result.error().reason, "Failed reading: x");
}
