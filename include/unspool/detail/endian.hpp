#pragma once

#include <concepts>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace unspool {

/**
 * @brief Wire byte order of a fixed-width integer
 */
enum class ByteOrder : uint8_t {
    big,    ///< Most significant byte first (network order)
    little, ///< Least significant byte first
};

namespace detail {

#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__)
inline constexpr bool is_little_endian = (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__);
#else
// Fallback assumption: most modern systems are little-endian
inline constexpr bool is_little_endian = true;
#endif

inline constexpr bool is_big_endian = !is_little_endian;

template <typename T>
concept UnsignedWord =
    std::unsigned_integral<T> && (std::same_as<T, uint8_t> || std::same_as<T, uint16_t> ||
                                  std::same_as<T, uint32_t> || std::same_as<T, uint64_t>);

/**
 * Combine sizeof(T) bytes into T with successive 8-bit shifts.
 *
 * big:    bytes[0] << 8*(N-1) | ... | bytes[N-1]
 * little: bytes[N-1] << 8*(N-1) | ... | bytes[0]
 */
template <UnsignedWord T, ByteOrder Order>
[[nodiscard]] constexpr T combine_bytes(const uint8_t* bytes) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        const std::size_t index = (Order == ByteOrder::big) ? i : sizeof(T) - 1 - i;
        value = static_cast<T>((static_cast<uint64_t>(value) << 8) | bytes[index]);
    }
    return value;
}

/**
 * Reinterpret sizeof(T) bytes in host byte order. No alignment requirement.
 */
template <typename T>
[[nodiscard]] inline T load_host(const uint8_t* bytes) noexcept {
    T value;
    std::memcpy(&value, bytes, sizeof(T));
    return value;
}

} // namespace detail
} // namespace unspool
