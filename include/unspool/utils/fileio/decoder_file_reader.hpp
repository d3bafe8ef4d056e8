#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "../../byte_string.hpp"
#include "../../decoder.hpp"
#include "../../expected.hpp"
#include "../../run.hpp"
#include "../detail/iteration_helpers.hpp"
#include "../detail/reader_error.hpp"

namespace unspool::utils::fileio {

/**
 * @brief Decode a file as a sequence of records, one chunk at a time
 *
 * Each read_next() drives the record decoder with run_partial(), feeding it
 * fixed-size chunks from the file while it reports Partial. Bytes left over
 * after one record are the start of the next, so records may straddle chunk
 * boundaries freely. At end of file the decoder receives the empty
 * end-of-input chunk.
 *
 * Return type: expected<T, ReaderError>
 * - Value = One decoded record
 * - unexpected(EndOfStream{}) = End of file on a record boundary
 * - unexpected(IOError{...}) = Read failure, or a record cut short by EOF
 * - unexpected(DecodeError{...}) = The record bytes did not decode
 *
 * A decode failure leaves the position of the next record unknown, so the
 * reader halts: later reads return IOError::Kind::stream_halted.
 *
 * @tparam T Record type
 * @tparam ChunkSize Bytes read from the file per chunk (default: 4096)
 *
 * @warning This class is MOVE-ONLY (owns a FILE*).
 *
 * Example usage:
 * @code
 * auto record = unspool::get_two_of(unspool::get_word32be(), unspool::get_word16le());
 * unspool::utils::fileio::DecoderFileReader reader("records.bin", record);
 *
 * reader.for_each_record([](const auto& r) {
 *     // Process record...
 *     return true; // continue
 * });
 * @endcode
 */
template <typename T, std::size_t ChunkSize = 4096>
class DecoderFileReader {
    static_assert(ChunkSize > 0, "ChunkSize must be positive");

public:
    using record_type = T;

    /// Result type for read operations
    using ReadResult = unspool::expected<T, utils::ReaderError>;

    /**
     * @brief Open a file for record decoding
     *
     * @param filepath Path to the binary file
     * @param decoder Decoder for one record
     * @throws std::runtime_error if file cannot be opened
     */
    DecoderFileReader(const char* filepath, Decoder<T> decoder)
        : file_(std::fopen(filepath, "rb")),
          decoder_(std::move(decoder)) {
        if (!file_) {
            throw std::runtime_error(std::string("Failed to open file: ") + filepath);
        }
    }

    /**
     * @brief Open a file for record decoding
     *
     * @param filepath Path to the binary file
     * @param decoder Decoder for one record
     * @throws std::runtime_error if file cannot be opened
     */
    DecoderFileReader(const std::string& filepath, Decoder<T> decoder)
        : DecoderFileReader(filepath.c_str(), std::move(decoder)) {}

    ~DecoderFileReader() noexcept {
        if (file_) {
            std::fclose(file_);
        }
    }

    // Non-copyable due to FILE* ownership
    DecoderFileReader(const DecoderFileReader&) = delete;
    DecoderFileReader& operator=(const DecoderFileReader&) = delete;

    // Move-only semantics
    DecoderFileReader(DecoderFileReader&& other) noexcept
        : file_(std::exchange(other.file_, nullptr)),
          decoder_(std::move(other.decoder_)),
          pending_(std::move(other.pending_)),
          at_eof_(other.at_eof_),
          halted_(other.halted_),
          records_read_(other.records_read_) {}

    DecoderFileReader& operator=(DecoderFileReader&& other) noexcept {
        if (this != &other) {
            if (file_) {
                std::fclose(file_);
            }
            file_ = std::exchange(other.file_, nullptr);
            decoder_ = std::move(other.decoder_);
            pending_ = std::move(other.pending_);
            at_eof_ = other.at_eof_;
            halted_ = other.halted_;
            records_read_ = other.records_read_;
        }
        return *this;
    }

    /**
     * @brief Decode the next record
     *
     * @return expected<T, ReaderError>, see class documentation
     */
    ReadResult read_next() {
        if (halted_) {
            return unexpected(
                utils::ReaderError{utils::IOError{utils::IOError::Kind::stream_halted}});
        }

        // Only start a record once at least one byte of it exists
        if (pending_.empty()) {
            auto first = read_chunk();
            if (!first) {
                return unexpected(utils::ReaderError{first.error()});
            }
            if (first->empty()) {
                return unexpected(utils::ReaderError{utils::EndOfStream{}});
            }
            pending_ = *std::move(first);
        }

        std::size_t buffered = pending_.size();
        bool fed_end = false;
        auto result = run_partial(decoder_, pending_);
        while (result.is_partial()) {
            auto chunk = read_chunk();
            if (!chunk) {
                halted_ = true;
                chunk.error().buffered_bytes = buffered;
                return unexpected(utils::ReaderError{chunk.error()});
            }
            buffered += chunk->size();
            fed_end = chunk->empty();
            result = std::move(result).feed(*std::move(chunk));
        }

        if (result.is_done()) {
            pending_ = result.leftover();
            ++records_read_;
            return std::move(result).value();
        }

        halted_ = true;
        pending_ = ByteString{};
        // Truncated only when the decoder was still waiting on the file at EOF
        if (fed_end && ran_out_of_input(result.error())) {
            return unexpected(utils::ReaderError{utils::IOError{
                utils::IOError::Kind::truncated_record, 0, buffered}});
        }
        return unexpected(utils::ReaderError{result.error()});
    }

    /**
     * @brief Iterate over all records
     *
     * @tparam Callback Function type with signature: bool(const T&)
     * @param callback Function called for each record. Return false to stop iteration.
     * @return Number of records processed
     */
    template <typename Callback>
    size_t for_each_record(Callback&& callback) {
        return utils::detail::for_each_record(*this, std::forward<Callback>(callback));
    }

    /**
     * @brief Get number of records decoded so far
     */
    size_t records_read() const noexcept { return records_read_; }

    /**
     * @brief Check if file is still open
     */
    bool is_open() const noexcept { return file_ != nullptr; }

private:
    // Next chunk of the file; empty once the file is exhausted
    expected<ByteString, utils::IOError> read_chunk() {
        if (at_eof_) {
            return ByteString{};
        }
        std::vector<uint8_t> buffer(ChunkSize);
        const std::size_t n = std::fread(buffer.data(), 1, ChunkSize, file_);
        if (n < ChunkSize) {
            if (std::ferror(file_)) {
                return unexpected(utils::IOError{utils::IOError::Kind::read_error, errno, 0});
            }
            at_eof_ = true;
        }
        buffer.resize(n);
        return ByteString(std::move(buffer));
    }

    static bool ran_out_of_input(const DecodeError& error) {
        return !error.trace.empty() && error.trace.back() == "demandInput";
    }

    std::FILE* file_{nullptr};
    Decoder<T> decoder_;
    ByteString pending_;
    bool at_eof_{false};
    bool halted_{false};
    size_t records_read_{0};
};

} // namespace unspool::utils::fileio
