#pragma once

#include <concepts>
#include <deque>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include <cstdint>
#include <cstdio>

#include "detail/repeat.hpp"
#include "either.hpp"
#include "numeric.hpp"

// Container decoders
//
// Every collection is a big-endian uint64 element count followed by that many
// elements, each read with the caller's element decoder:
//
//   list / seq / set      count, element 1 ... element n
//   map                   count, (key 1, value 1) ... (key n, value n)
//   pair                  first, second (no separator)
//   tree                  root value, list of subtrees
//   optional              uint8 tag (0 = absent), element when present
//   either                uint8 tag (0 = left), left or right element
//   indexed array         lower bound, upper bound, list of elements

namespace unspool {

/// Integer-keyed map and set, matching the wire layout of their generic forms
template <typename V>
using IntMap = std::map<std::int64_t, V>;
using IntSet = std::set<std::int64_t>;

/**
 * @brief Rose tree: a value and an ordered list of subtrees
 */
template <typename T>
struct Tree {
    T root;
    std::vector<Tree<T>> children;

    Tree() = default;
    Tree(T root_value, std::vector<Tree<T>> subtrees = {})
        : root(std::move(root_value)),
          children(std::move(subtrees)) {}

    Tree(const Tree&) = default;
    Tree(Tree&&) noexcept = default;
    Tree& operator=(const Tree&) = default;
    Tree& operator=(Tree&&) noexcept = default;

    // Tears down subtrees one at a time, so depth never reaches the call stack
    ~Tree() {
        std::vector<Tree<T>> pending = std::move(children);
        while (!pending.empty()) {
            Tree<T> last = std::move(pending.back());
            pending.pop_back();
            for (auto& child : last.children) {
                pending.push_back(std::move(child));
            }
            last.children.clear();
        }
    }

    friend bool operator==(const Tree&, const Tree&) = default;
};

/**
 * @brief Array indexed over the inclusive range [lower, upper]
 *
 * Holds at most upper - lower + 1 elements. A decoded element list longer
 * than the range is truncated; a shorter one leaves the tail of the range
 * unpopulated, and at() on such an index throws.
 */
template <std::integral I, typename E>
class IndexedArray {
public:
    IndexedArray(I lower, I upper, std::vector<E> elements)
        : lower_(lower),
          upper_(upper),
          elements_(std::move(elements)) {
        if (elements_.size() > range_size()) {
            elements_.resize(range_size());
        }
    }

    [[nodiscard]] I lower() const noexcept { return lower_; }
    [[nodiscard]] I upper() const noexcept { return upper_; }

    /**
     * @brief Number of indices in [lower, upper] (0 when upper < lower)
     */
    [[nodiscard]] std::size_t range_size() const noexcept {
        if (upper_ < lower_) {
            return 0;
        }
        const Unsigned span = distance(lower_, upper_);
        if (span >= std::numeric_limits<std::size_t>::max()) {
            return std::numeric_limits<std::size_t>::max();
        }
        return static_cast<std::size_t>(span) + 1;
    }

    /**
     * @brief Populated elements, in index order starting at lower()
     */
    [[nodiscard]] const std::vector<E>& elements() const noexcept { return elements_; }

    /**
     * @throws std::out_of_range if index is outside the bounds or unpopulated
     */
    [[nodiscard]] const E& at(I index) const {
        if (index < lower_ || index > upper_) {
            throw std::out_of_range("IndexedArray index outside bounds");
        }
        const auto offset = static_cast<std::size_t>(distance(lower_, index));
        if (offset >= elements_.size()) {
            throw std::out_of_range("IndexedArray element undefined");
        }
        return elements_[offset];
    }

private:
    using Unsigned = std::make_unsigned_t<I>;

    // to - from for from <= to, computed without signed overflow
    static Unsigned distance(I from, I to) noexcept {
        return static_cast<Unsigned>(static_cast<Unsigned>(to) - static_cast<Unsigned>(from));
    }

    I lower_;
    I upper_;
    std::vector<E> elements_;
};

namespace detail {

// Debug-build notice when trusted ascending input turns out not to be
template <typename K>
inline void warn_if_not_ascending(const K& previous, const K& next, const char* container) {
#ifndef NDEBUG
    if (!(previous < next)) {
        std::fprintf(stderr,
                     "WARNING: %s decoded with keys not in strictly ascending order. "
                     "Out-of-order keys are re-sorted and duplicates dropped.\n",
                     container);
    }
#else
    (void)previous;
    (void)next;
    (void)container;
#endif
}

template <typename C, typename T, typename Push>
[[nodiscard]] Decoder<C> get_counted(Decoder<T> element, Push push) {
    return get_word64be().and_then([element, push](uint64_t count) {
        return repeat(count, element, C{}, push);
    });
}

/**
 * Tree decoding loop.
 *
 * Open nodes live on a heap stack, each with the number of subtrees it still
 * expects. Every value and count continuation yields back to run_tree(), so
 * nesting depth costs heap, never call stack.
 */
template <typename T>
struct TreeState {
    struct Frame {
        Tree<T> node;
        std::uint64_t left;
    };
    enum class Phase { value, count, close };

    Decoder<T> element;
    std::deque<Frame> open;
    Phase phase{Phase::value};
    Cursor cursor;
    Failure kf;
    Success<Tree<T>> ks;
};

template <typename T>
Step run_tree(const std::shared_ptr<TreeState<T>>& st) {
    using State = TreeState<T>;
    for (;;) {
        if (st->phase == State::Phase::close) {
            while (st->open.back().left == 0) {
                Tree<T> done = std::move(st->open.back().node);
                st->open.pop_back();
                if (st->open.empty()) {
                    return st->ks(std::move(st->cursor), std::move(done));
                }
                auto& parent = st->open.back();
                parent.node.children.push_back(std::move(done));
                --parent.left;
            }
            st->phase = State::Phase::value;
            continue;
        }

        Step step = st->phase == State::Phase::value
                        ? st->element(st->cursor, st->kf,
                                      [st](Cursor c, T value) {
                                          st->cursor = std::move(c);
                                          st->open.push_back(
                                              typename State::Frame{Tree<T>(std::move(value)), 0});
                                          st->phase = State::Phase::count;
                                          return Step{StepYield{st.get()}};
                                      })
                        : get_word64be()(st->cursor, st->kf, [st](Cursor c, std::uint64_t n) {
                              st->cursor = std::move(c);
                              st->open.back().left = n;
                              st->phase = State::Phase::close;
                              return Step{StepYield{st.get()}};
                          });
        if (!step.is_yield_of(st.get())) {
            return settle<State, run_tree<T>>(st, std::move(step));
        }
    }
}

} // namespace detail

/**
 * @brief Two values in sequence
 */
template <typename A, typename B>
[[nodiscard]] Decoder<std::pair<A, B>> get_two_of(Decoder<A> first, Decoder<B> second) {
    return first.and_then([second](A a) {
        return second.map([a](B b) { return std::pair<A, B>{a, std::move(b)}; });
    });
}

/**
 * @brief Count-prefixed list, in encoded order
 */
template <typename T>
[[nodiscard]] Decoder<std::vector<T>> get_list_of(Decoder<T> element) {
    return detail::get_counted<std::vector<T>>(
        std::move(element), [](std::vector<T>& xs, T x) { xs.push_back(std::move(x)); });
}

/**
 * @brief Count-prefixed sequence, in encoded order
 */
template <typename T>
[[nodiscard]] Decoder<std::deque<T>> get_seq_of(Decoder<T> element) {
    return detail::get_counted<std::deque<T>>(
        std::move(element), [](std::deque<T>& xs, T x) { xs.push_back(std::move(x)); });
}

/**
 * @brief Tree: root value, then a list of subtrees
 *
 * Depth is bounded only by the input and the heap; the decoder keeps open
 * nodes on its own stack rather than recursing.
 */
template <typename T>
[[nodiscard]] Decoder<Tree<T>> get_tree_of(Decoder<T> element) {
    return Decoder<Tree<T>>([element](detail::Cursor cursor, const detail::Failure& kf,
                                      const detail::Success<Tree<T>>& ks) {
        using State = detail::TreeState<T>;
        auto st = std::make_shared<State>(
            State{element, {}, State::Phase::value, std::move(cursor), kf, ks});
        return detail::run_tree(st);
    });
}

/**
 * @brief Count-prefixed (key, value) pairs
 *
 * The encoding must list keys in strictly ascending, distinct order. That is
 * trusted, not checked: each pair is appended at the end of the map in O(1)
 * amortized time. Input that breaks the contract is not a decode failure;
 * std::map re-sorts out-of-order keys and keeps the first of duplicate keys.
 * Debug builds print a warning. Use get_map_of_checked() to reject such input.
 */
template <typename K, typename V>
[[nodiscard]] Decoder<std::map<K, V>> get_map_of(Decoder<K> key, Decoder<V> value) {
    return detail::get_counted<std::map<K, V>>(
        get_two_of(std::move(key), std::move(value)),
        [](std::map<K, V>& m, std::pair<K, V> kv) {
            if (!m.empty()) {
                detail::warn_if_not_ascending(std::prev(m.end())->first, kv.first, "map");
            }
            m.emplace_hint(m.end(), std::move(kv.first), std::move(kv.second));
        });
}

/**
 * @brief get_map_of() with int64 keys
 */
template <typename V>
[[nodiscard]] Decoder<IntMap<V>> get_int_map_of(Decoder<std::int64_t> key, Decoder<V> value) {
    return get_map_of(std::move(key), std::move(value));
}

/**
 * @brief Count-prefixed elements in strictly ascending, distinct order
 *
 * Same trusted-order contract as get_map_of().
 */
template <typename T>
[[nodiscard]] Decoder<std::set<T>> get_set_of(Decoder<T> element) {
    return detail::get_counted<std::set<T>>(std::move(element), [](std::set<T>& s, T x) {
        if (!s.empty()) {
            detail::warn_if_not_ascending(*std::prev(s.end()), x, "set");
        }
        s.emplace_hint(s.end(), std::move(x));
    });
}

/**
 * @brief get_set_of() with int64 elements
 */
[[nodiscard]] inline Decoder<IntSet> get_int_set_of(Decoder<std::int64_t> element) {
    return get_set_of(std::move(element));
}

/**
 * @brief get_map_of() that fails unless keys are strictly ascending
 */
template <typename K, typename V>
[[nodiscard]] Decoder<std::map<K, V>> get_map_of_checked(Decoder<K> key, Decoder<V> value) {
    using Map = std::map<K, V>;
    return get_list_of(get_two_of(std::move(key), std::move(value)))
        .and_then([](std::vector<std::pair<K, V>> pairs) {
            for (std::size_t i = 1; i < pairs.size(); ++i) {
                if (!(pairs[i - 1].first < pairs[i].first)) {
                    return fail<Map>("keys not in strictly ascending order");
                }
            }
            Map m;
            for (auto& kv : pairs) {
                m.emplace_hint(m.end(), std::move(kv.first), std::move(kv.second));
            }
            return pure(std::move(m));
        });
}

/**
 * @brief get_set_of() that fails unless elements are strictly ascending
 */
template <typename T>
[[nodiscard]] Decoder<std::set<T>> get_set_of_checked(Decoder<T> element) {
    using Set = std::set<T>;
    return get_list_of(std::move(element)).and_then([](std::vector<T> xs) {
        for (std::size_t i = 1; i < xs.size(); ++i) {
            if (!(xs[i - 1] < xs[i])) {
                return fail<Set>("keys not in strictly ascending order");
            }
        }
        return pure(Set(std::make_move_iterator(xs.begin()), std::make_move_iterator(xs.end())));
    });
}

/**
 * @brief Tag byte (0 = absent), then the element when present
 */
template <typename T>
[[nodiscard]] Decoder<std::optional<T>> get_maybe_of(Decoder<T> element) {
    return get_word8().and_then([element](uint8_t tag) {
        if (tag == 0) {
            return pure(std::optional<T>{});
        }
        return element.map([](T x) { return std::optional<T>{std::move(x)}; });
    });
}

/**
 * @brief Tag byte (0 = left, anything else = right), then that side
 */
template <typename A, typename B>
[[nodiscard]] Decoder<Either<A, B>> get_either_of(Decoder<A> left, Decoder<B> right) {
    return get_word8().and_then([left, right](uint8_t tag) {
        if (tag == 0) {
            return left.map([](A a) { return Either<A, B>{Left<A>{std::move(a)}}; });
        }
        return right.map([](B b) { return Either<A, B>{Right<B>{std::move(b)}}; });
    });
}

/**
 * @brief Lower bound, upper bound, then a list body
 *
 * The bounds are not cross-checked against the list length; see IndexedArray.
 */
template <std::integral I, typename E>
[[nodiscard]] Decoder<IndexedArray<I, E>> get_iarray_of(Decoder<I> index, Decoder<E> element) {
    return get_two_of(index, index).and_then([element](std::pair<I, I> bounds) {
        return get_list_of(element).map([bounds](std::vector<E> xs) {
            return IndexedArray<I, E>(bounds.first, bounds.second, std::move(xs));
        });
    });
}

} // namespace unspool
