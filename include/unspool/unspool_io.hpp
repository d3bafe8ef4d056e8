#pragma once

/**
 * @file unspool_io.hpp
 * @brief Convenience header for stream reading utilities
 *
 * Primary types:
 * - DecoderFileReader: decodes a file record by record, chunk by chunk
 * - ReaderError: EndOfStream, IOError or DecodeError
 */

#include "utils/detail/iteration_helpers.hpp"
#include "utils/detail/reader_error.hpp"
#include "utils/fileio/decoder_file_reader.hpp"

namespace unspool {

template <typename T, std::size_t ChunkSize = 4096>
using DecoderFileReader = utils::fileio::DecoderFileReader<T, ChunkSize>;

} // namespace unspool
