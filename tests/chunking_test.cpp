#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <unspool.hpp>

using unspool::ByteString;
using unspool::Decoder;

namespace {

// Split `input` at every position whose bit is set in `cuts`
std::vector<ByteString> partition(const std::vector<uint8_t>& input, uint32_t cuts) {
    std::vector<ByteString> chunks;
    std::vector<uint8_t> current;
    for (std::size_t i = 0; i < input.size(); ++i) {
        current.push_back(input[i]);
        const bool last = (i + 1 == input.size());
        if (last || (cuts & (1u << i))) {
            chunks.emplace_back(std::move(current));
            current.clear();
        }
    }
    return chunks;
}

// Every way of splitting `input` into non-empty chunks must decode exactly
// like the whole input at once.
template <typename T>
void expect_chunking_invariant(const Decoder<T>& decoder, const std::vector<uint8_t>& input) {
    ASSERT_GT(input.size(), 0u);
    ASSERT_LE(input.size(), 16u);

    const auto reference =
        unspool::run_with_remainder(decoder, ByteString(std::vector<uint8_t>(input)), 0);

    const uint32_t partitions = 1u << (input.size() - 1);
    for (uint32_t cuts = 0; cuts < partitions; ++cuts) {
        SCOPED_TRACE("cut mask " + std::to_string(cuts));
        auto chunks = partition(input, cuts);

        auto result = unspool::run_partial(decoder, chunks[0]);
        std::size_t next = 1;
        while (result.is_partial() && next < chunks.size()) {
            result = std::move(result).feed(chunks[next++]);
        }
        if (result.is_partial()) {
            result = std::move(result).feed(ByteString{});
        }

        if (reference.has_value()) {
            ASSERT_TRUE(result.is_done());
            EXPECT_EQ(result.value(), reference->first);

            ByteString rest = result.leftover();
            for (; next < chunks.size(); ++next) {
                rest = rest.append(chunks[next]);
            }
            EXPECT_EQ(rest, reference->second);
        } else {
            ASSERT_TRUE(result.is_fail());
            EXPECT_EQ(result.error().reason, reference.error().reason);
            EXPECT_EQ(result.error().trace, reference.error().trace);
        }
    }
}

using Frame = std::tuple<uint32_t, uint16_t, uint16_t>;

// A tagged header (0xAA + word16be, or a bare word32le), a peeked word16be,
// then a three byte window holding a word8 and a word16le
Decoder<Frame> frame_decoder() {
    auto tagged = unspool::get_word8().and_then([](uint8_t tag) {
        if (tag == 0xAA) {
            return unspool::get_word16be().map([](uint16_t v) { return uint32_t{v}; });
        }
        return unspool::fail<uint32_t>("untagged");
    });
    auto header = unspool::label("header", tagged.or_else(unspool::get_word32le()));

    return header.and_then([](uint32_t h) {
        return unspool::look_ahead(unspool::get_word16be()).and_then([h](uint16_t peek) {
            auto body = unspool::isolate(
                3, unspool::get_word8().then(unspool::get_word16le()));
            return body.map([h, peek](uint16_t w) { return Frame{h, peek, w}; });
        });
    });
}

} // namespace

TEST(ChunkingTest, TaggedHeaderFrame) {
    const std::vector<uint8_t> input{0xAA, 0x12, 0x34, 0x01, 0x02, 0x03, 0x04, 0x05, 0xFF};

    auto whole = unspool::run_with_remainder(frame_decoder(), ByteString(std::vector<uint8_t>(input)), 0);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->first, (Frame{0x1234, 0x0102, 0x0302}));
    EXPECT_EQ(whole->second, (ByteString{0x04, 0x05, 0xFF}));

    expect_chunking_invariant(frame_decoder(), input);
}

TEST(ChunkingTest, UntaggedHeaderFrame) {
    const std::vector<uint8_t> input{0x01, 0x02, 0x03, 0x04, 0x10, 0x20, 0x30, 0x40};

    auto whole = unspool::run_with_remainder(frame_decoder(), ByteString(std::vector<uint8_t>(input)), 0);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->first, (Frame{0x04030201, 0x1020, 0x3020}));
    EXPECT_EQ(whole->second, (ByteString{0x40}));

    expect_chunking_invariant(frame_decoder(), input);
}

TEST(ChunkingTest, BothHeaderBranchesShort) {
    const std::vector<uint8_t> input{0xAA, 0x12};

    auto whole = unspool::run(frame_decoder(), ByteString(std::vector<uint8_t>(input)));
    ASSERT_FALSE(whole.has_value());
    EXPECT_EQ(whole.error().reason, "too few bytes");

    expect_chunking_invariant(frame_decoder(), input);
}

TEST(ChunkingTest, PeekRunsOutOfInput) {
    const std::vector<uint8_t> input{0x01, 0x02, 0x03, 0x04, 0x10};

    auto whole = unspool::run(frame_decoder(), ByteString(std::vector<uint8_t>(input)));
    ASSERT_FALSE(whole.has_value());
    EXPECT_EQ(whole.error().reason, "too few bytes");

    expect_chunking_invariant(frame_decoder(), input);
}

TEST(ChunkingTest, CountedList) {
    const std::vector<uint8_t> input{0, 0, 0, 0, 0, 0, 0, 3, 0x00, 0x01, 0x00, 0x02, 0x00, 0x03, 0x09};

    auto decoder = unspool::get_list_of(unspool::get_word16be());
    auto whole = unspool::run(decoder, ByteString(std::vector<uint8_t>(input)));
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(*whole, (std::vector<uint16_t>{1, 2, 3}));

    expect_chunking_invariant(decoder, input);
}

TEST(ChunkingTest, LookAheadWithOptional) {
    const std::vector<uint8_t> input{0x01, 0x2A, 0x00, 0x07};

    auto decoder = unspool::get_two_of(unspool::look_ahead(unspool::get_maybe_of(unspool::get_word8())),
                                       unspool::get_two_of(unspool::get_word16be(), unspool::get_word8()));
    expect_chunking_invariant(decoder, input);
}
