#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include <cstddef>
#include <cstdint>

#include "byte_string.hpp"
#include "decode_error.hpp"
#include "decoder.hpp"
#include "expected.hpp"
#include "result.hpp"

namespace unspool::detail {

/// Where the terminal success continuation parks the decoded value
template <typename T>
using ValueSlot = std::shared_ptr<std::optional<T>>;

// Terminal failure handler: turn the innermost-first trace around
[[nodiscard]] inline Failure terminal_failure() {
    return [](Cursor, Trace trace, std::string message) {
        std::reverse(trace.begin(), trace.end());
        return Step{StepFail{DecodeError{std::move(message), std::move(trace)}}};
    };
}

template <typename T>
[[nodiscard]] Success<T> terminal_success(ValueSlot<T> slot) {
    return [slot](Cursor cursor, T value) {
        slot->emplace(std::move(value));
        return Step{StepDone{std::move(cursor.input)}};
    };
}

/**
 * Convert an engine Step into the public Result, keeping the slot alive across
 * any number of suspensions.
 */
template <typename T>
[[nodiscard]] Result<T> to_result(Step step, ValueSlot<T> slot) {
    if (auto* failed = std::get_if<StepFail>(&step.state)) {
        return Fail{std::move(failed->error)};
    }
    if (auto* done = std::get_if<StepDone>(&step.state)) {
        return Done<T>{std::move(**slot), std::move(done->leftover)};
    }
    if (auto* partial = std::get_if<StepPartial>(&step.state)) {
        return Partial<T>{[resume = std::move(partial->resume), slot](ByteString chunk) {
            return to_result<T>(resume(std::move(chunk)), slot);
        }};
    }
    // A repetition's yield escaped its loop; the engine never produces this
    return Fail{DecodeError{failed_reading_prefix + std::string("Internal error: stray yield."), {}}};
}

template <typename T>
[[nodiscard]] Result<T> drive(const Decoder<T>& decoder, ByteString input, InputMode mode) {
    auto slot = std::make_shared<std::optional<T>>();
    Step step = decoder(Cursor{std::move(input), std::nullopt, mode}, terminal_failure(),
                        terminal_success<T>(slot));
    return to_result<T>(std::move(step), std::move(slot));
}

[[nodiscard]] inline DecodeError unexpected_partial() {
    return DecodeError{failed_reading_prefix + std::string("Internal error: unexpected Partial."),
                       {}};
}

} // namespace unspool::detail

// ==========
// Public API entry points
// ==========
namespace unspool {

/**
 * @brief Decode a complete input in one shot
 *
 * Runs in complete mode, so the decoder can never suspend: running out of
 * bytes is a failure.
 *
 * Usage:
 * @code
 *   auto result = unspool::run(unspool::get_word32be(), bytes);
 *   if (!result) {
 *       std::cerr << result.error().message();
 *   }
 * @endcode
 *
 * @param decoder Decoder to drive
 * @param input All the input there is
 * @return The decoded value, or the DecodeError
 */
template <typename T>
[[nodiscard]] expected<T, DecodeError> run(const Decoder<T>& decoder, ByteString input) {
    auto result = detail::drive(decoder, std::move(input), InputMode::complete);
    if (result.is_done()) {
        return std::move(result).value();
    }
    if (result.is_fail()) {
        return unexpected(result.error());
    }
    return unexpected(detail::unexpected_partial());
}

/**
 * @brief Decode a caller-owned buffer in one shot (the bytes are copied)
 */
template <typename T>
[[nodiscard]] expected<T, DecodeError> run(const Decoder<T>& decoder,
                                           std::span<const uint8_t> input) {
    return run(decoder, ByteString(input));
}

/**
 * @brief Start an incremental decode
 *
 * Runs in incomplete mode: whenever the decoder needs more bytes than it has,
 * it returns a Partial. Feed chunks with Result::feed() in stream order and an
 * empty chunk once the stream has ended.
 *
 * @param decoder Decoder to drive
 * @param input First chunk (may be empty)
 * @return Fail, Partial or Done
 */
template <typename T>
[[nodiscard]] Result<T> run_partial(const Decoder<T>& decoder, ByteString input) {
    return detail::drive(decoder, std::move(input), InputMode::incomplete);
}

template <typename T>
[[nodiscard]] Result<T> run_partial(const Decoder<T>& decoder, std::span<const uint8_t> input) {
    return run_partial(decoder, ByteString(input));
}

/**
 * @brief Decode a complete input starting at `offset`, also returning the tail
 *
 * An offset past the end decodes against an empty buffer.
 *
 * @return (value, unconsumed bytes) or the DecodeError
 */
template <typename T>
[[nodiscard]] expected<std::pair<T, ByteString>, DecodeError>
run_with_remainder(const Decoder<T>& decoder, ByteString input, std::size_t offset) {
    auto result = detail::drive(decoder, input.drop(offset), InputMode::complete);
    if (result.is_done()) {
        ByteString rest = result.leftover();
        return std::pair<T, ByteString>{std::move(result).value(), std::move(rest)};
    }
    if (result.is_fail()) {
        return unexpected(result.error());
    }
    return unexpected(detail::unexpected_partial());
}

template <typename T>
[[nodiscard]] expected<std::pair<T, ByteString>, DecodeError>
run_with_remainder(const Decoder<T>& decoder, std::span<const uint8_t> input, std::size_t offset) {
    return run_with_remainder(decoder, ByteString(input), offset);
}

} // namespace unspool
