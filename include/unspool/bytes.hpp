#pragma once

#include <utility>
#include <vector>

#include <cstddef>

#include "byte_string.hpp"
#include "primitives.hpp"

namespace unspool {

/**
 * @brief Consume exactly n bytes
 *
 * The result aliases the input's storage (no copy). Use get_byte_string() when
 * the bytes must not keep the decoder's buffer alive.
 */
[[nodiscard]] inline Decoder<ByteString> get_bytes(std::size_t n) {
    return ensure(n).and_then([n](ByteString input) {
        return detail::put_input(input.drop(n)).then(pure(input.take(n)));
    });
}

/**
 * @brief Consume exactly n bytes into independently owned storage
 */
[[nodiscard]] inline Decoder<ByteString> get_byte_string(std::size_t n) {
    return get_bytes(n).map([](ByteString bytes) { return bytes.copy(); });
}

/**
 * @brief get_byte_string() as a single-chunk LazyByteString
 */
[[nodiscard]] inline Decoder<LazyByteString> get_lazy_byte_string(std::size_t n) {
    return get_byte_string(n).map(
        [](ByteString bytes) { return LazyByteString(std::vector<ByteString>{std::move(bytes)}); });
}

} // namespace unspool
