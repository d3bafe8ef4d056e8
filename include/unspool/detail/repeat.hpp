#pragma once

#include <memory>
#include <utility>
#include <variant>

#include <cstdint>

#include "../decoder.hpp"
#include "step.hpp"

namespace unspool::detail {

/**
 * Trampolined repetition.
 *
 * Chaining `count` decoders through success continuations would nest one stack
 * frame per element. Instead each element's success continuation stores its
 * value and returns StepYield{owner}, unwinding back to the loop, which then
 * starts the next element. If an element suspends, the Partial is wrapped so
 * that resuming it re-enters the loop when the element completes.
 */
template <typename T, typename Acc, typename Push>
struct RepeatState {
    using element_type = T;

    Decoder<T> element;
    Push push;
    Acc acc;
    std::uint64_t left;
    Cursor cursor;
    Failure kf;
    Success<Acc> ks;
};

/**
 * Route a step back into its loop.
 *
 * A yield of `st` re-enters Loop. A Partial is wrapped so that resuming it
 * routes the resumed step here again. Anything else leaves the loop.
 */
template <typename State, Step (*Loop)(const std::shared_ptr<State>&)>
Step settle(const std::shared_ptr<State>& st, Step step) {
    if (step.is_yield_of(st.get())) {
        return Loop(st);
    }
    if (auto* partial = std::get_if<StepPartial>(&step.state)) {
        return Step{StepPartial{[st, resume = std::move(partial->resume)](ByteString chunk) {
            return settle<State, Loop>(st, resume(std::move(chunk)));
        }}};
    }
    return step;
}

template <typename State>
Step run_repeat(const std::shared_ptr<State>& st) {
    using T = typename State::element_type;
    while (st->left > 0) {
        Step step = st->element(st->cursor, st->kf, [st](Cursor c, T value) {
            st->push(st->acc, std::move(value));
            st->cursor = std::move(c);
            --st->left;
            return Step{StepYield{st.get()}};
        });
        if (!step.is_yield_of(st.get())) {
            return settle<State, run_repeat<State>>(st, std::move(step));
        }
    }
    return st->ks(std::move(st->cursor), std::move(st->acc));
}

/**
 * Decode `element` exactly `count` times, folding each value into `init`
 * with push(acc, value), in input order.
 */
template <typename T, typename Acc, typename Push>
[[nodiscard]] Decoder<Acc> repeat(std::uint64_t count, Decoder<T> element, Acc init, Push push) {
    return Decoder<Acc>([count, element, init, push](Cursor cursor, const Failure& kf,
                                                     const Success<Acc>& ks) {
        using State = RepeatState<T, Acc, Push>;
        auto st = std::make_shared<State>(
            State{element, push, init, count, std::move(cursor), kf, ks});
        return run_repeat(st);
    });
}

} // namespace unspool::detail
