/**
 * @file bytereader.hpp
 * @brief Sequential little-endian reading from archive data.
 *
 * The byte reader provides bounds-checked access to the fixed-layout
 * records of a zip archive, which store all integers little-endian.
 */

#ifndef EVENTWIRE_BYTEREADER_HPP
#define EVENTWIRE_BYTEREADER_HPP

#include "config.hpp"

namespace eventwire {

/**
 * @brief Load a little-endian 16-bit value.
 * @param p Pointer to at least 2 readable bytes
 */
inline std::uint16_t load_le16(const std::uint8_t* p) noexcept {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

/**
 * @brief Load a little-endian 32-bit value.
 * @param p Pointer to at least 4 readable bytes
 */
inline std::uint32_t load_le32(const std::uint8_t* p) noexcept {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

/**
 * @brief Sequential byte reader over a borrowed buffer.
 *
 * Reads past the end return zero and latch the overrun flag, so a parser
 * can read a whole record and check for truncation once.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer
     * @param size Number of valid bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0), overrun_(false) {}

    /**
     * @brief Read one byte.
     *
     * @return Byte value, or 0 if no bytes remaining
     */
    inline std::uint8_t read_u8() noexcept {
        if (!require(1)) [[unlikely]] {
            return 0;
        }
        return data_[pos_++];
    }

    /**
     * @brief Read a little-endian 16-bit value.
     */
    inline std::uint16_t read_u16() noexcept {
        if (!require(2)) [[unlikely]] {
            return 0;
        }
        std::uint16_t value = load_le16(data_ + pos_);
        pos_ += 2;
        return value;
    }

    /**
     * @brief Read a little-endian 32-bit value.
     */
    inline std::uint32_t read_u32() noexcept {
        if (!require(4)) [[unlikely]] {
            return 0;
        }
        std::uint32_t value = load_le32(data_ + pos_);
        pos_ += 4;
        return value;
    }

    /**
     * @brief Advance over bytes without reading them.
     *
     * @param count Number of bytes to skip
     * @return true if the bytes were available
     */
    bool skip(std::size_t count) noexcept {
        if (!require(count)) {
            return false;
        }
        pos_ += count;
        return true;
    }

    /**
     * @brief Move to an absolute position.
     *
     * @param pos Byte offset from the start of the buffer
     * @return true if pos lies inside the buffer (or at its end)
     */
    bool seek(std::size_t pos) noexcept {
        if (pos > size_) {
            overrun_ = true;
            return false;
        }
        pos_ = pos;
        return true;
    }

    /**
     * @brief Pointer to the current position.
     */
    [[nodiscard]] const std::uint8_t* current() const noexcept {
        return data_ + pos_;
    }

    /**
     * @brief Get current byte position.
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

    /**
     * @brief Whether any read or skip ran past the end of the buffer.
     */
    [[nodiscard]] bool overrun() const noexcept {
        return overrun_;
    }

private:
    bool require(std::size_t count) noexcept {
        if (count > size_ - pos_) {
            overrun_ = true;
            return false;
        }
        return true;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
    bool overrun_;
};

} // namespace eventwire

#endif // EVENTWIRE_BYTEREADER_HPP
