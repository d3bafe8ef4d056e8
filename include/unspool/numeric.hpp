#pragma once

#include <cstddef>
#include <cstdint>

#include "bytes.hpp"
#include "detail/endian.hpp"

namespace unspool {

/**
 * @brief Fixed-width unsigned integer in an explicit byte order
 *
 * Consumes exactly sizeof(T) bytes or nothing: if fewer bytes are ever
 * available the decoder fails like get_bytes().
 *
 * @tparam T uint8_t, uint16_t, uint32_t or uint64_t
 * @tparam Order Wire byte order
 */
template <detail::UnsignedWord T, ByteOrder Order>
[[nodiscard]] Decoder<T> get_word() {
    return get_bytes(sizeof(T)).map(
        [](ByteString bytes) { return detail::combine_bytes<T, Order>(bytes.data()); });
}

/**
 * @brief Fixed-width value in host byte order and representation
 *
 * Reads the bytes as they lie in memory, without byte swapping.
 *
 * @warning Not portable: the result depends on the endianness (and for
 *          get_word_host() the word size) of the machine doing the decoding.
 *          Use only for data produced and consumed on the same architecture.
 */
template <typename T>
[[nodiscard]] Decoder<T> get_host() {
    return get_bytes(sizeof(T)).map(
        [](ByteString bytes) { return detail::load_host<T>(bytes.data()); });
}

[[nodiscard]] inline Decoder<uint8_t> get_word8() {
    return get_bytes(1).map([](ByteString bytes) { return bytes[0]; });
}

// Big-endian reads
[[nodiscard]] inline Decoder<uint16_t> get_word16be() { return get_word<uint16_t, ByteOrder::big>(); }
[[nodiscard]] inline Decoder<uint32_t> get_word32be() { return get_word<uint32_t, ByteOrder::big>(); }
[[nodiscard]] inline Decoder<uint64_t> get_word64be() { return get_word<uint64_t, ByteOrder::big>(); }

// Little-endian reads
[[nodiscard]] inline Decoder<uint16_t> get_word16le() {
    return get_word<uint16_t, ByteOrder::little>();
}
[[nodiscard]] inline Decoder<uint32_t> get_word32le() {
    return get_word<uint32_t, ByteOrder::little>();
}
[[nodiscard]] inline Decoder<uint64_t> get_word64le() {
    return get_word<uint64_t, ByteOrder::little>();
}

// Host-endian, unaligned reads (non-portable, see get_host())

/// Native machine word: 8 bytes on 64-bit targets, 4 on 32-bit targets
[[nodiscard]] inline Decoder<std::uintptr_t> get_word_host() { return get_host<std::uintptr_t>(); }
[[nodiscard]] inline Decoder<uint16_t> get_word16host() { return get_host<uint16_t>(); }
[[nodiscard]] inline Decoder<uint32_t> get_word32host() { return get_host<uint32_t>(); }
[[nodiscard]] inline Decoder<uint64_t> get_word64host() { return get_host<uint64_t>(); }

} // namespace unspool
