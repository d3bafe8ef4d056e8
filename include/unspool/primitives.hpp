#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "decoder.hpp"
#include "either.hpp"

namespace unspool {

/**
 * @brief Suspend and ask the driver for more input
 *
 * In complete mode this fails at once with "too few bytes". Otherwise it
 * returns a Partial whose continuation appends the next chunk to the buffer.
 * An empty chunk marks end of input: the decoder fails, and the mode becomes
 * complete so that no later demand suspends again.
 *
 * This is the only place a decoder ever suspends.
 */
[[nodiscard]] inline Decoder<Unit> demand_input() {
    return Decoder<Unit>([](detail::Cursor cursor, const detail::Failure& kf,
                            const detail::Success<Unit>& ks) -> detail::Step {
        if (cursor.mode == InputMode::complete) {
            return kf(std::move(cursor), detail::Trace{"demandInput"}, "too few bytes");
        }
        return detail::Step{detail::StepPartial{[cursor, kf, ks](ByteString chunk) -> detail::Step {
            detail::Cursor next = cursor;
            if (chunk.empty()) {
                next.mode = InputMode::complete;
                return kf(std::move(next), detail::Trace{"demandInput"}, "too few bytes");
            }
            next.input = next.input.append(chunk);
            if (next.record) {
                next.record->push(chunk);
            }
            next.mode = InputMode::incomplete;
            return ks(std::move(next), Unit{});
        }}};
    });
}

namespace detail {

// Chunks collected by ensure() until `wanted` bytes are buffered
struct Gather {
    std::size_t wanted;
    std::vector<ByteString> chunks;
    std::size_t total;
    Cursor cursor;
    Failure kf;
    Success<ByteString> ks;
};

// Each resume only stores the chunk; the buffer is joined once, when enough
// has arrived or input ends.
[[nodiscard]] inline Step gather_input(std::shared_ptr<Gather> g) {
    return Step{StepPartial{[g](ByteString chunk) -> Step {
        if (chunk.empty()) {
            g->cursor.input = LazyByteString(std::move(g->chunks)).to_strict();
            g->cursor.mode = InputMode::complete;
            return g->kf(std::move(g->cursor), Trace{"demandInput"}, "too few bytes");
        }
        if (g->cursor.record) {
            g->cursor.record->push(chunk);
        }
        g->total += chunk.size();
        g->chunks.push_back(std::move(chunk));
        if (g->total < g->wanted) {
            return gather_input(g);
        }
        g->cursor.input = LazyByteString(std::move(g->chunks)).to_strict();
        g->cursor.mode = InputMode::incomplete;
        ByteString input = g->cursor.input;
        return g->ks(std::move(g->cursor), std::move(input));
    }}};
}

} // namespace detail

/**
 * @brief Make at least n bytes available, returning the current buffer
 *
 * Suspends until the buffer holds n bytes; fails once input is exhausted.
 * Consumes nothing.
 */
[[nodiscard]] inline Decoder<ByteString> ensure(std::size_t n) {
    return Decoder<ByteString>([n](detail::Cursor cursor, const detail::Failure& kf,
                                   const detail::Success<ByteString>& ks) -> detail::Step {
        if (cursor.input.size() >= n) {
            ByteString input = cursor.input;
            return ks(std::move(cursor), std::move(input));
        }
        if (cursor.mode == InputMode::complete) {
            return kf(std::move(cursor), detail::Trace{"demandInput"}, "too few bytes");
        }
        const std::size_t total = cursor.input.size();
        std::vector<ByteString> chunks{cursor.input};
        return detail::gather_input(std::make_shared<detail::Gather>(
            detail::Gather{n, std::move(chunks), total, std::move(cursor), kf, ks}));
    });
}

/**
 * @brief Run `d` over exactly the next n bytes
 *
 * `d` sees a buffer of exactly n bytes and runs in complete mode, so it can
 * neither observe nor request anything past the window. Fails when n is
 * negative and when `d` leaves any of the window unconsumed. On success the
 * bytes after the window become the input again, in the outer input mode.
 */
template <typename T>
[[nodiscard]] Decoder<T> isolate(std::int64_t n, Decoder<T> d) {
    return Decoder<T>([n, d](detail::Cursor cursor, const detail::Failure& kf,
                             const detail::Success<T>& ks) -> detail::Step {
        if (n < 0) {
            return kf(std::move(cursor), {},
                      failed_reading_prefix +
                          std::string("Attempted to isolate a negative number of bytes"));
        }
        const auto width = static_cast<std::size_t>(n);
        return ensure(width)(
            std::move(cursor), kf, [width, d, kf, ks](detail::Cursor c, ByteString) {
                ByteString window = c.input.take(width);
                ByteString rest = c.input.drop(width);
                const InputMode outer_mode = c.mode;

                auto on_failure = [outer_mode, kf](detail::Cursor f, detail::Trace trace,
                                                   std::string message) {
                    f.mode = outer_mode;
                    return kf(std::move(f), std::move(trace), std::move(message));
                };
                auto on_success = [rest, outer_mode, kf, ks](detail::Cursor used,
                                                             T value) -> detail::Step {
                    used.mode = outer_mode;
                    if (!used.input.empty()) {
                        return kf(std::move(used), {},
                                  failed_reading_prefix +
                                      std::string("not all bytes parsed in isolate"));
                    }
                    used.input = rest;
                    return ks(std::move(used), std::move(value));
                };
                return d(detail::Cursor{std::move(window), c.record, InputMode::complete},
                         on_failure, on_success);
            });
    });
}

/**
 * @brief Consume and discard exactly n bytes, waiting for input as needed
 */
[[nodiscard]] inline Decoder<Unit> skip(std::size_t n) {
    return ensure(n).and_then([n](ByteString input) { return detail::put_input(input.drop(n)); });
}

/**
 * @brief Drop up to n buffered bytes; never requests input and never fails
 */
[[nodiscard]] inline Decoder<Unit> unchecked_skip(std::size_t n) {
    return detail::get_input().and_then(
        [n](ByteString input) { return detail::put_input(input.drop(n)); });
}

/**
 * @brief Up to n buffered bytes, without consuming them or requesting input
 */
[[nodiscard]] inline Decoder<ByteString> unchecked_look_ahead(std::size_t n) {
    return detail::get_input().map([n](ByteString input) { return input.take(n); });
}

/**
 * @brief Number of buffered, unconsumed bytes
 *
 * Only counts what has arrived so far; in incomplete mode more may follow.
 */
[[nodiscard]] inline Decoder<std::size_t> remaining() {
    return detail::get_input().map([](ByteString input) { return input.size(); });
}

/**
 * @brief True when no buffered bytes remain
 */
[[nodiscard]] inline Decoder<bool> is_empty() {
    return detail::get_input().map([](ByteString input) { return input.empty(); });
}

namespace detail {

// Run `d`, then rewind to the entry buffer (plus chunks received meanwhile)
// when rewind(value) holds. A failure of `d` fails the whole decoder.
template <typename T, typename Pred>
[[nodiscard]] Decoder<T> look_ahead_if(Decoder<T> d, Pred rewind) {
    return Decoder<T>([d, rewind](Cursor cursor, const Failure& kf, const Success<T>& ks) {
        Cursor inner{cursor.input, ChunkLog{}, cursor.mode};

        auto on_success = [entry = cursor, rewind, ks](Cursor c, T value) {
            ByteString input = rewind(value)
                                   ? entry.input.append(recorded_bytes(c.record))
                                   : std::move(c.input);
            Cursor next{std::move(input), merge_record(entry.record, c.record), c.mode};
            return ks(std::move(next), std::move(value));
        };
        auto on_failure = [entry = cursor, kf](Cursor c, Trace trace, std::string message) {
            Cursor restored{entry.input.append(recorded_bytes(c.record)),
                            merge_record(entry.record, c.record), c.mode};
            return kf(std::move(restored), std::move(trace), std::move(message));
        };
        return d(std::move(inner), on_failure, on_success);
    });
}

} // namespace detail

/**
 * @brief Run `d` and return its value without consuming input
 *
 * Fails if `d` fails.
 */
template <typename T>
[[nodiscard]] Decoder<T> look_ahead(Decoder<T> d) {
    return detail::look_ahead_if(std::move(d), [](const T&) { return true; });
}

/**
 * @brief Like look_ahead(), but keep the consumption when `d` yields a value
 *
 * Rewinds only on std::nullopt. Fails if `d` fails.
 */
template <typename T>
[[nodiscard]] Decoder<std::optional<T>> look_ahead_m(Decoder<std::optional<T>> d) {
    return detail::look_ahead_if(std::move(d),
                                 [](const std::optional<T>& v) { return !v.has_value(); });
}

/**
 * @brief Like look_ahead(), but keep the consumption when `d` yields Right
 *
 * Rewinds only on Left. Fails if `d` fails.
 */
template <typename L, typename R>
[[nodiscard]] Decoder<Either<L, R>> look_ahead_e(Decoder<Either<L, R>> d) {
    return detail::look_ahead_if(std::move(d),
                                 [](const Either<L, R>& v) { return is_left(v); });
}

} // namespace unspool
