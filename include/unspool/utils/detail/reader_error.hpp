#pragma once

#include <string>
#include <type_traits>
#include <variant>

#include <cstddef>
#include <cstdint>

#include "../../decode_error.hpp"

namespace unspool::utils {

/**
 * @brief Represents end-of-stream (no error, just no more records)
 *
 * Returned when a reader reaches EOF exactly at a record boundary.
 */
struct EndOfStream {};

/**
 * @brief I/O-level error (distinct from decode errors)
 *
 * Represents system-level read failures and records cut short by EOF.
 */
struct IOError {
    enum class Kind : uint8_t {
        read_error,       ///< File read failed
        truncated_record, ///< EOF in the middle of a record
        stream_halted     ///< An earlier decode failure lost the record boundary
    };

    Kind kind;
    int errno_value{0};

    std::size_t buffered_bytes{0}; ///< Bytes of the unfinished record, for diagnostics

    /**
     * @brief Get human-readable error message
     */
    [[nodiscard]] const char* message() const noexcept {
        switch (kind) {
            case Kind::read_error:
                return "I/O read error";
            case Kind::truncated_record:
                return "Truncated record";
            case Kind::stream_halted:
                return "Stream halted after decode failure";
        }
        return "Unknown I/O error";
    }
};

/**
 * @brief Unified reader error type
 *
 * A variant that can represent:
 * - EndOfStream: Normal end of data
 * - IOError: System-level I/O failure or truncated input
 * - DecodeError: Bytes were available but did not decode
 */
using ReaderError = std::variant<EndOfStream, IOError, DecodeError>;

/**
 * @brief Check if error represents end of stream
 */
[[nodiscard]] inline bool is_eof(const ReaderError& e) noexcept {
    return std::holds_alternative<EndOfStream>(e);
}

/**
 * @brief Check if error is an I/O error
 */
[[nodiscard]] inline bool is_io_error(const ReaderError& e) noexcept {
    return std::holds_alternative<IOError>(e);
}

/**
 * @brief Check if error is a decode error
 */
[[nodiscard]] inline bool is_decode_error(const ReaderError& e) noexcept {
    return std::holds_alternative<DecodeError>(e);
}

/**
 * @brief Get human-readable error message from any ReaderError
 */
[[nodiscard]] inline std::string error_message(const ReaderError& e) {
    return std::visit(
        [](auto&& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, EndOfStream>) {
                return "End of stream";
            } else {
                // IOError and DecodeError both describe themselves
                return err.message();
            }
        },
        e);
}

} // namespace unspool::utils
