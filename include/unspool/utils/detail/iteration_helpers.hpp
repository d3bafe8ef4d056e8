#pragma once

#include <concepts>
#include <utility>

#include <cstddef>

#include "../../expected.hpp"
#include "reader_error.hpp"

namespace unspool::utils::detail {

/**
 * @brief Concept for record readers that provide read_next()
 *
 * Any reader that returns expected<record_type, ReaderError> from read_next()
 * can use these iteration helpers.
 */
template <typename R>
concept RecordReader = requires(R& reader) {
    typename R::record_type;
    {
        reader.read_next()
    } -> std::same_as<unspool::expected<typename R::record_type, ReaderError>>;
};

/**
 * @brief Iterate over all records until the stream ends or fails
 *
 * Error handling contract:
 * - EndOfStream: Stop iteration (normal termination)
 * - IOError: Stop iteration (unrecoverable)
 * - DecodeError: Stop iteration (record boundary is lost)
 *
 * @tparam Reader Type satisfying RecordReader concept
 * @tparam Callback Function type with signature: bool(const record_type&)
 * @param reader Reader providing read_next()
 * @param callback Function called for each record. Return false to stop iteration.
 * @return Number of records passed to the callback
 */
template <RecordReader Reader, typename Callback>
size_t for_each_record(Reader& reader, Callback&& callback) {
    size_t count = 0;

    while (true) {
        auto result = reader.read_next();
        if (!result.has_value()) {
            break;
        }

        ++count;
        if (!callback(*result)) {
            break; // Callback requested stop
        }
    }

    return count;
}

} // namespace unspool::utils::detail
