#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "byte_string.hpp"
#include "decode_error.hpp"
#include "detail/step.hpp"

namespace unspool {

/// Value of decoders run only for their effect on the input
using Unit = std::monostate;

template <typename T>
class Decoder;

namespace detail {

template <typename T>
struct is_decoder : std::false_type {};

template <typename T>
struct is_decoder<Decoder<T>> : std::true_type {};

} // namespace detail

/**
 * @brief Concept satisfied by Decoder<T> specializations
 */
template <typename D>
concept DecoderType = detail::is_decoder<std::remove_cvref_t<D>>::value;

/**
 * @brief A composable binary decoding computation
 *
 * A Decoder is a value: constructing or composing one does no work. It runs
 * only when a driver (run.hpp) supplies the input cursor together with a
 * failure continuation and a success continuation. Sequencing two decoders
 * means running the first with a success continuation that runs the second;
 * failure anywhere invokes the failure continuation unchanged.
 *
 * Decoders hold no mutable state, so one Decoder can be driven any number of
 * times. Copies share the underlying callable.
 *
 * Example:
 * @code
 *   auto header = unspool::get_word16be().and_then([](uint16_t len) {
 *       return unspool::get_bytes(len);
 *   });
 * @endcode
 *
 * @tparam T Type of the decoded value
 */
template <typename T>
class Decoder {
public:
    using value_type = T;
    using Runner = std::function<detail::Step(detail::Cursor, const detail::Failure&,
                                              const detail::Success<T>&)>;

    explicit Decoder(Runner runner) : runner_(std::make_shared<const Runner>(std::move(runner))) {}

    /**
     * @brief Run against a cursor with explicit continuations (engine entry point)
     */
    detail::Step operator()(detail::Cursor cursor, const detail::Failure& kf,
                            const detail::Success<T>& ks) const {
        return (*runner_)(std::move(cursor), kf, ks);
    }

    /**
     * @brief Sequence: decode T, then run the decoder produced by f
     *
     * @param f Callable T -> Decoder<U>
     */
    template <typename F>
        requires DecoderType<std::invoke_result_t<F, T>>
    [[nodiscard]] auto and_then(F f) const {
        using Next = std::invoke_result_t<F, T>;
        using U = typename Next::value_type;
        return Next([self = *this, f](detail::Cursor cursor, const detail::Failure& kf,
                                      const detail::Success<U>& ks) {
            return self(std::move(cursor), kf, [f, kf, ks](detail::Cursor c, T value) {
                return f(std::move(value))(std::move(c), kf, ks);
            });
        });
    }

    /**
     * @brief Transform the decoded value without touching the input
     */
    template <typename F>
    [[nodiscard]] auto map(F f) const -> Decoder<std::invoke_result_t<F, T>> {
        using U = std::invoke_result_t<F, T>;
        return Decoder<U>([self = *this, f](detail::Cursor cursor, const detail::Failure& kf,
                                            const detail::Success<U>& ks) {
            return self(std::move(cursor), kf, [f, ks](detail::Cursor c, T value) {
                return ks(std::move(c), f(std::move(value)));
            });
        });
    }

    /**
     * @brief Sequence, discarding this decoder's value
     */
    template <typename U>
    [[nodiscard]] Decoder<U> then(Decoder<U> next) const {
        return and_then([next](T) { return next; });
    }

    /**
     * @brief Backtracking choice, see unspool::or_else()
     */
    [[nodiscard]] Decoder<T> or_else(Decoder<T> alternative) const;

private:
    std::shared_ptr<const Runner> runner_;
};

/**
 * @brief Succeed with `value` without consuming input
 */
template <typename T>
[[nodiscard]] Decoder<std::decay_t<T>> pure(T&& value) {
    using V = std::decay_t<T>;
    return Decoder<V>([value = V(std::forward<T>(value))](detail::Cursor cursor,
                                                          const detail::Failure&,
                                                          const detail::Success<V>& ks) {
        return ks(std::move(cursor), value);
    });
}

/**
 * @brief Fail with "Failed reading: <message>" and an empty trace
 */
template <typename T>
[[nodiscard]] Decoder<T> fail(std::string message) {
    return Decoder<T>([msg = failed_reading_prefix + std::move(message)](
                          detail::Cursor cursor, const detail::Failure& kf,
                          const detail::Success<T>&) { return kf(std::move(cursor), {}, msg); });
}

/**
 * @brief Run `first`; if it fails, run `second` from first's entry state
 *
 * Whatever `first` consumed is discarded: `second` sees the buffer as it was
 * when or_else was entered, plus any chunks that arrived while `first` was
 * suspended. The rewind never reaches past this or_else's own entry. If both
 * fail, the failure is `second`'s.
 */
template <typename T>
[[nodiscard]] Decoder<T> or_else(Decoder<T> first, Decoder<T> second) {
    return Decoder<T>([first, second](detail::Cursor cursor, const detail::Failure& kf,
                                      const detail::Success<T>& ks) {
        detail::Cursor inner{cursor.input, detail::ChunkLog{}, cursor.mode};
        auto outer_record = cursor.record;

        auto on_success = [outer_record, ks](detail::Cursor c, T value) {
            c.record = detail::merge_record(outer_record, c.record);
            return ks(std::move(c), std::move(value));
        };
        auto on_failure = [second, entry = std::move(cursor), kf, ks](detail::Cursor c,
                                                                      detail::Trace,
                                                                      std::string) {
            detail::Cursor restart{entry.input.append(detail::recorded_bytes(c.record)),
                                   detail::merge_record(entry.record, c.record), c.mode};
            return second(std::move(restart), kf, ks);
        };
        return first(std::move(inner), on_failure, on_success);
    });
}

template <typename T>
Decoder<T> Decoder<T>::or_else(Decoder<T> alternative) const {
    return unspool::or_else(*this, std::move(alternative));
}

/**
 * @brief Attach a label to failures of `d`
 *
 * As a failure propagates outward each enclosing label adds its name, so the
 * final trace lists labels from the outermost label() down to the one nearest
 * the failure. Labels never appear on success.
 */
template <typename T>
[[nodiscard]] Decoder<T> label(std::string name, Decoder<T> d) {
    return Decoder<T>([name = std::move(name), d](detail::Cursor cursor, const detail::Failure& kf,
                                                  const detail::Success<T>& ks) {
        return d(std::move(cursor),
                 [name, kf](detail::Cursor c, detail::Trace trace, std::string message) {
                     trace.push_back(name);
                     return kf(std::move(c), std::move(trace), std::move(message));
                 },
                 ks);
    });
}

namespace detail {

// Current unconsumed input, without consuming it
[[nodiscard]] inline Decoder<ByteString> get_input() {
    return Decoder<ByteString>(
        [](Cursor cursor, const Failure&, const Success<ByteString>& ks) {
            ByteString input = cursor.input;
            return ks(std::move(cursor), std::move(input));
        });
}

// Replace the unconsumed input
[[nodiscard]] inline Decoder<Unit> put_input(ByteString input) {
    return Decoder<Unit>([input = std::move(input)](Cursor cursor, const Failure&,
                                                    const Success<Unit>& ks) {
        cursor.input = input;
        return ks(std::move(cursor), Unit{});
    });
}

} // namespace detail

} // namespace unspool
