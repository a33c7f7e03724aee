#pragma once

/// @file pine_buffer.hpp
/// @brief Little-endian buffers for PINE frame serialization
///
/// PINE puts every multi-byte integer on the wire in little-endian order.
/// Unlike a plain memcpy, these helpers assemble and split integers byte by
/// byte, so frames are identical on big-endian hosts.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace woody::pine {

/// Thrown by buffer_view/buffer_writer on out-of-bounds access.
/// The codec converts it into a malformed_frame error at its boundary.
class frame_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Store an unsigned integer little-endian into dst[0..sizeof(T))
template<std::unsigned_integral T>
constexpr void store_le(uint8_t* dst, T value) noexcept {
    for (size_t i = 0; i < sizeof(T); ++i) {
        dst[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

/// Load an unsigned little-endian integer from src[0..sizeof(T))
template<std::unsigned_integral T>
constexpr T load_le(const uint8_t* src) noexcept {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(static_cast<T>(src[i]) << (8 * i));
    }
    return value;
}

/// A bounds-checked read cursor over a received frame
class buffer_view {
public:
    buffer_view() noexcept = default;

    buffer_view(const void* data, size_t size) noexcept
        : data_(static_cast<const uint8_t*>(data))
        , size_(size) {}

    buffer_view(std::span<const uint8_t> span) noexcept
        : data_(span.data()), size_(span.size()) {}

    /// Get raw data pointer
    const uint8_t* data() const noexcept { return data_; }

    /// Get size in bytes
    size_t size() const noexcept { return size_; }

    /// Get remaining bytes from current position
    size_t remaining() const noexcept { return size_ - pos_; }

    /// Get current read position
    size_t position() const noexcept { return pos_; }

    /// Skip bytes
    void skip(size_t n) {
        if (n > remaining()) {
            throw frame_error("skip past end of frame");
        }
        pos_ += n;
    }

    /// Read a little-endian unsigned integer
    template<std::unsigned_integral T>
    T read_le() {
        if (sizeof(T) > remaining()) {
            throw frame_error("read past end of frame");
        }
        T value = load_le<T>(data_ + pos_);
        pos_ += sizeof(T);
        return value;
    }

    /// Peek at a little-endian value without advancing position
    template<std::unsigned_integral T>
    T peek_le() const {
        if (sizeof(T) > remaining()) {
            throw frame_error("peek past end of frame");
        }
        return load_le<T>(data_ + pos_);
    }

    /// Read raw bytes as a string view (zero-copy)
    std::string_view read_chars(size_t n) {
        if (n > remaining()) {
            throw frame_error("string length exceeds frame");
        }
        std::string_view result(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return result;
    }

    /// Get a span of all data
    std::span<const uint8_t> span() const noexcept {
        return {data_, size_};
    }

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t pos_ = 0;
};

/// A growable buffer for building request frames
class buffer_writer {
public:
    /// Construct with initial capacity
    explicit buffer_writer(size_t initial_capacity = 32) {
        data_.reserve(initial_capacity);
    }

    /// Get current size
    size_t size() const noexcept { return data_.size(); }

    /// Check if empty
    bool empty() const noexcept { return data_.empty(); }

    /// Get as span
    std::span<const uint8_t> span() const noexcept { return data_; }

    /// Write an unsigned integer little-endian
    template<std::unsigned_integral T>
    void write_le(T value) {
        size_t old_size = data_.size();
        data_.resize(old_size + sizeof(T));
        store_le<T>(data_.data() + old_size, value);
    }

    /// Write a single byte
    void write_byte(uint8_t value) {
        data_.push_back(value);
    }

    /// Reserve space and return offset (for back-patching the length prefix)
    size_t reserve_space(size_t n) {
        size_t offset = data_.size();
        data_.resize(offset + n);
        return offset;
    }

    /// Write a little-endian value at a specific offset (for back-patching)
    template<std::unsigned_integral T>
    void write_le_at(size_t offset, T value) {
        if (offset + sizeof(T) > data_.size()) {
            throw frame_error("write_at past end of buffer");
        }
        store_le<T>(data_.data() + offset, value);
    }

    /// Move the internal buffer out
    std::vector<uint8_t> release() noexcept {
        return std::move(data_);
    }

private:
    std::vector<uint8_t> data_;
};

} // namespace woody::pine
