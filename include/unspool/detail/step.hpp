#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../byte_string.hpp"
#include "../decode_error.hpp"

namespace unspool {

/**
 * @brief Whether more input may still arrive
 *
 * complete: the buffer is all the input there will ever be (single-shot decode).
 * incomplete: demand_input() may suspend and ask the driver for another chunk.
 */
enum class InputMode : uint8_t { complete, incomplete };

namespace detail {

/**
 * Untyped outcome of one run of the continuation engine.
 *
 * Decoders are polymorphic in the type their driver finally produces, which C++
 * cannot express through a type-erased callable. The engine therefore returns
 * this untyped Step, and the driver's terminal success continuation parks the
 * typed value in a slot it owns (see run.hpp).
 *
 * Yield never reaches a driver: it is how a trampolined repetition (repeat.hpp)
 * hands control back to its own loop after one element, identified by `owner`.
 */
struct StepFail {
    DecodeError error;
};

struct Step;

struct StepPartial {
    std::function<Step(ByteString)> resume;
};

struct StepDone {
    ByteString leftover;
};

struct StepYield {
    const void* owner;
};

struct Step {
    std::variant<StepFail, StepPartial, StepDone, StepYield> state;

    [[nodiscard]] bool is_fail() const noexcept { return std::holds_alternative<StepFail>(state); }
    [[nodiscard]] bool is_partial() const noexcept {
        return std::holds_alternative<StepPartial>(state);
    }
    [[nodiscard]] bool is_done() const noexcept { return std::holds_alternative<StepDone>(state); }

    [[nodiscard]] bool is_yield_of(const void* owner) const noexcept {
        const auto* y = std::get_if<StepYield>(&state);
        return y != nullptr && y->owner == owner;
    }
};

/**
 * Append-only list of received chunks, shared between cursor copies.
 *
 * Each copy sees only the first count() chunks of the shared vector. A push
 * from the copy that owns the tail of the vector extends it in place; a push
 * from any other copy first takes its own prefix. Pushes are amortized O(1)
 * and never copy chunk bytes.
 */
class ChunkLog {
public:
    void push(ByteString chunk) {
        if (chunk.empty()) {
            return;
        }
        if (!chunks_ || chunks_->size() != count_) {
            auto own = std::make_shared<std::vector<ByteString>>();
            if (chunks_) {
                own->assign(chunks_->begin(),
                            chunks_->begin() + static_cast<std::ptrdiff_t>(count_));
            }
            chunks_ = std::move(own);
        }
        chunks_->push_back(std::move(chunk));
        ++count_;
    }

    void push_all(const ChunkLog& other) {
        for (std::size_t i = 0; i < other.count_; ++i) {
            ByteString chunk = (*other.chunks_)[i];
            push(std::move(chunk));
        }
    }

    [[nodiscard]] std::size_t count() const noexcept { return count_; }

    /**
     * All recorded bytes in one contiguous string (one copy, or none for a
     * single chunk)
     */
    [[nodiscard]] ByteString flatten() const {
        if (count_ == 0) {
            return ByteString{};
        }
        return LazyByteString(std::vector<ByteString>(
                                  chunks_->begin(),
                                  chunks_->begin() + static_cast<std::ptrdiff_t>(count_)))
            .to_strict();
    }

private:
    std::shared_ptr<std::vector<ByteString>> chunks_;
    std::size_t count_{0};
};

/**
 * Decoder state threaded through every continuation.
 *
 * `record` is engaged while a backtracking point (or_else, look_ahead*) is
 * active and collects every chunk the decoder receives, so rewinding to the
 * branch's entry can restore the entry buffer plus whatever arrived since.
 */
struct Cursor {
    ByteString input;
    std::optional<ChunkLog> record;
    InputMode mode{InputMode::complete};
};

/// Everything `record` collected, or nothing when it is disengaged
[[nodiscard]] inline ByteString recorded_bytes(const std::optional<ChunkLog>& record) {
    return record ? record->flatten() : ByteString{};
}

/**
 * Extend an outer record with what an inner backtracking point recorded.
 * Stays disengaged when no outer point is recording.
 */
[[nodiscard]] inline std::optional<ChunkLog> merge_record(const std::optional<ChunkLog>& outer,
                                                          const std::optional<ChunkLog>& inner) {
    if (!outer) {
        return std::nullopt;
    }
    ChunkLog merged = *outer;
    if (inner) {
        merged.push_all(*inner);
    }
    return merged;
}

/**
 * Labels in the order failure reached them: innermost first. The terminal
 * failure handler reverses them into the outermost-first DecodeError::trace.
 */
using Trace = std::vector<std::string>;

/// Failure continuation: (state at the failure, trace, message) -> Step
using Failure = std::function<Step(Cursor, Trace, std::string)>;

/// Success continuation: (state after the decoder, value) -> Step
template <typename T>
using Success = std::function<Step(Cursor, T)>;

} // namespace detail
} // namespace unspool
