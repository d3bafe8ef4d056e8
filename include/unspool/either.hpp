#pragma once

#include <variant>

namespace unspool {

/// Left alternative of an Either
template <typename T>
struct Left {
    T value;

    friend bool operator==(const Left&, const Left&) = default;
};

/// Right alternative of an Either
template <typename T>
struct Right {
    T value;

    friend bool operator==(const Right&, const Right&) = default;
};

/**
 * @brief Sum of two types, tagged by side
 *
 * Wrapping each side keeps Either<T, T> unambiguous.
 */
template <typename L, typename R>
using Either = std::variant<Left<L>, Right<R>>;

template <typename L, typename R>
[[nodiscard]] constexpr bool is_left(const Either<L, R>& e) noexcept {
    return e.index() == 0;
}

template <typename L, typename R>
[[nodiscard]] constexpr bool is_right(const Either<L, R>& e) noexcept {
    return e.index() == 1;
}

} // namespace unspool
