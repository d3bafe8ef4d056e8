#pragma once

#include <algorithm>
#include <initializer_list>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace unspool {

/**
 * @brief Immutable, cheaply sliceable byte sequence
 *
 * The decoder's input buffer. Slicing (take/drop/split_at) shares the underlying
 * storage and never copies; append() and copy() allocate fresh storage. A
 * ByteString never changes after construction, so every primitive that consumes
 * input produces a new ByteString describing the remainder.
 *
 * This is a small value type (shared pointer + offset + length).
 */
class ByteString {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;
    using const_iterator = const uint8_t*;

    ByteString() noexcept = default;

    /**
     * @brief Take ownership of a byte vector
     */
    explicit ByteString(std::vector<uint8_t> bytes)
        : storage_(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))),
          offset_(0),
          size_(storage_->size()) {}

    /**
     * @brief Copy bytes from a caller-owned span
     */
    explicit ByteString(std::span<const uint8_t> bytes)
        : ByteString(std::vector<uint8_t>(bytes.begin(), bytes.end())) {}

    ByteString(std::initializer_list<uint8_t> bytes) : ByteString(std::vector<uint8_t>(bytes)) {}

    [[nodiscard]] size_type size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] const uint8_t* data() const noexcept {
        return storage_ ? storage_->data() + offset_ : nullptr;
    }

    [[nodiscard]] const_iterator begin() const noexcept { return data(); }
    [[nodiscard]] const_iterator end() const noexcept { return data() + size_; }

    /**
     * @brief Byte at position (unchecked). Must be < size().
     */
    [[nodiscard]] uint8_t operator[](size_type index) const noexcept { return data()[index]; }

    [[nodiscard]] std::span<const uint8_t> view() const noexcept { return {data(), size_}; }

    /**
     * @brief First n bytes (fewer if the string is shorter). Shares storage.
     */
    [[nodiscard]] ByteString take(size_type n) const noexcept {
        return ByteString(storage_, offset_, std::min(n, size_));
    }

    /**
     * @brief Everything after the first n bytes (empty if n >= size()). Shares storage.
     */
    [[nodiscard]] ByteString drop(size_type n) const noexcept {
        const size_type k = std::min(n, size_);
        return ByteString(storage_, offset_ + k, size_ - k);
    }

    [[nodiscard]] std::pair<ByteString, ByteString> split_at(size_type n) const noexcept {
        return {take(n), drop(n)};
    }

    /**
     * @brief Concatenate into fresh storage
     *
     * Appending to or from an empty string returns the other operand unchanged.
     */
    [[nodiscard]] ByteString append(const ByteString& tail) const {
        if (tail.empty()) {
            return *this;
        }
        if (empty()) {
            return tail;
        }
        std::vector<uint8_t> joined;
        joined.reserve(size_ + tail.size_);
        joined.insert(joined.end(), begin(), end());
        joined.insert(joined.end(), tail.begin(), tail.end());
        return ByteString(std::move(joined));
    }

    /**
     * @brief Independently owned copy of these bytes
     */
    [[nodiscard]] ByteString copy() const { return ByteString(std::vector<uint8_t>(begin(), end())); }

    [[nodiscard]] std::vector<uint8_t> to_vector() const { return {begin(), end()}; }

    /**
     * @brief True when both strings reference the same underlying allocation
     */
    [[nodiscard]] bool shares_storage_with(const ByteString& other) const noexcept {
        return storage_ != nullptr && storage_ == other.storage_;
    }

    friend bool operator==(const ByteString& lhs, const ByteString& rhs) noexcept {
        return lhs.size_ == rhs.size_ &&
               (lhs.size_ == 0 || std::memcmp(lhs.data(), rhs.data(), lhs.size_) == 0);
    }

private:
    ByteString(std::shared_ptr<const std::vector<uint8_t>> storage, size_type offset,
               size_type size) noexcept
        : storage_(std::move(storage)),
          offset_(offset),
          size_(size) {}

    std::shared_ptr<const std::vector<uint8_t>> storage_;
    size_type offset_{0};
    size_type size_{0};
};

/**
 * @brief Chunked byte sequence for streaming consumers
 *
 * get_lazy_byte_string() produces a single chunk; consumers that splice several
 * decoded pieces together can keep them as separate chunks without copying.
 */
class LazyByteString {
public:
    LazyByteString() = default;

    explicit LazyByteString(std::vector<ByteString> chunks) {
        for (auto& chunk : chunks) {
            if (!chunk.empty()) {
                chunks_.push_back(std::move(chunk));
            }
        }
    }

    [[nodiscard]] const std::vector<ByteString>& chunks() const noexcept { return chunks_; }

    [[nodiscard]] std::size_t size() const noexcept {
        std::size_t total = 0;
        for (const auto& chunk : chunks_) {
            total += chunk.size();
        }
        return total;
    }

    [[nodiscard]] bool empty() const noexcept { return chunks_.empty(); }

    /**
     * @brief Flatten into one contiguous ByteString
     */
    [[nodiscard]] ByteString to_strict() const {
        if (chunks_.size() == 1) {
            return chunks_.front();
        }
        std::vector<uint8_t> flat;
        flat.reserve(size());
        for (const auto& chunk : chunks_) {
            flat.insert(flat.end(), chunk.begin(), chunk.end());
        }
        return ByteString(std::move(flat));
    }

private:
    std::vector<ByteString> chunks_;
};

} // namespace unspool
