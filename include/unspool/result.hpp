#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "byte_string.hpp"
#include "decode_error.hpp"

namespace unspool {

template <typename T>
class Result;

/**
 * @brief Terminal failure: decoding cannot proceed
 */
struct Fail {
    DecodeError error;
};

/**
 * @brief Suspended decode waiting for the next chunk
 *
 * Pass the next chunk to Result::feed(). An empty chunk tells the decoder no
 * more input will ever arrive. The continuation is single-use: copies of one
 * Partial share a flag, so resuming the same suspension point twice throws.
 */
template <typename T>
struct Partial {
    std::function<Result<T>(ByteString)> resume;
    std::shared_ptr<bool> consumed = std::make_shared<bool>(false);
};

/**
 * @brief Terminal success
 *
 * `leftover` is the exact unconsumed tail of all input supplied so far.
 */
template <typename T>
struct Done {
    T value;
    ByteString leftover;
};

/**
 * @brief Tri-state outcome of driving a decoder: Fail, Partial or Done
 *
 * Returned by run_partial(). Once a Result is Fail or Done it is final.
 *
 * Usage:
 * @code
 *   auto result = unspool::run_partial(unspool::get_word32be(), first_chunk);
 *   while (result.is_partial()) {
 *       result = std::move(result).feed(next_chunk());  // empty chunk = end of input
 *   }
 *   if (result.is_done()) {
 *       use(result.value(), result.leftover());
 *   }
 * @endcode
 *
 * @tparam T Decoded value type
 */
template <typename T>
class Result {
public:
    using value_type = T;

    Result(Fail fail) : state_(std::move(fail)) {}
    Result(Partial<T> partial) : state_(std::move(partial)) {}
    Result(Done<T> done) : state_(std::move(done)) {}

    [[nodiscard]] bool is_fail() const noexcept { return std::holds_alternative<Fail>(state_); }
    [[nodiscard]] bool is_partial() const noexcept {
        return std::holds_alternative<Partial<T>>(state_);
    }
    [[nodiscard]] bool is_done() const noexcept { return std::holds_alternative<Done<T>>(state_); }

    /**
     * @brief Failure details. Requires is_fail().
     */
    [[nodiscard]] const DecodeError& error() const { return std::get<Fail>(state_).error; }

    /**
     * @brief Decoded value. Requires is_done().
     */
    [[nodiscard]] const T& value() const& { return std::get<Done<T>>(state_).value; }
    [[nodiscard]] T&& value() && { return std::move(std::get<Done<T>>(state_).value); }

    /**
     * @brief Unconsumed input. Requires is_done().
     */
    [[nodiscard]] const ByteString& leftover() const {
        return std::get<Done<T>>(state_).leftover;
    }

    /**
     * @brief Resume a suspended decode with the next chunk
     *
     * Fail and Done are final and are returned unchanged.
     *
     * @param chunk Next bytes of the stream, or an empty string for end of input
     * @throws std::logic_error if this suspension point was already resumed
     */
    [[nodiscard]] Result feed(ByteString chunk) && {
        auto* partial = std::get_if<Partial<T>>(&state_);
        if (partial == nullptr) {
            return std::move(*this);
        }
        if (*partial->consumed) {
            throw std::logic_error("Partial continuation resumed more than once");
        }
        *partial->consumed = true;
        return partial->resume(std::move(chunk));
    }

    /**
     * @brief Transform the eventual value, preserving the state
     */
    template <typename F>
    [[nodiscard]] auto map(F f) && -> Result<std::invoke_result_t<F, T>> {
        using U = std::invoke_result_t<F, T>;
        if (auto* done = std::get_if<Done<T>>(&state_)) {
            return Done<U>{f(std::move(done->value)), std::move(done->leftover)};
        }
        if (auto* partial = std::get_if<Partial<T>>(&state_)) {
            return Partial<U>{
                [resume = std::move(partial->resume), f](ByteString chunk) {
                    return resume(std::move(chunk)).map(f);
                },
                partial->consumed};
        }
        return std::get<Fail>(std::move(state_));
    }

private:
    std::variant<Fail, Partial<T>, Done<T>> state_;
};

} // namespace unspool
