/**
 * @file gzip.hpp
 * @brief gzip payload detection and decompression.
 *
 * Format sniffing is separate from decompression, so callers can branch on
 * content type before committing to a decode attempt.
 *
 * @see https://www.rfc-editor.org/rfc/rfc1952 RFC 1952 GZIP file format
 */

#ifndef EVENTWIRE_GZIP_HPP
#define EVENTWIRE_GZIP_HPP

#include "config.hpp"
#include "error.hpp"

#include <vector>

namespace eventwire {

/**
 * @brief Check for the gzip member magic.
 *
 * @param data Buffer to check
 * @param size Buffer size in bytes
 * @return true iff the first two bytes are 0x1F 0x8B
 */
[[nodiscard]] bool is_gzip(const std::uint8_t* data, std::size_t size) noexcept;

/// @overload
[[nodiscard]] bool is_gzip(const std::vector<std::uint8_t>& data) noexcept;

/**
 * @brief Decompress gzip data.
 *
 * Concatenated members are decoded in order and their outputs joined.
 * Zero padding after the last member is ignored.
 *
 * @param data gzip-compressed bytes
 * @param size Number of bytes
 * @param[out] output Decompressed bytes (replaced, cleared on failure)
 * @return Error::Ok on success, Error::InvalidFormat if the buffer is not
 *         gzip or any member is corrupt, truncated or followed by garbage
 */
Error decompress_gzip(const std::uint8_t* data, std::size_t size,
                      std::vector<std::uint8_t>& output);

/**
 * @brief Decompress gzip data, throwing on failure.
 *
 * @param data gzip-compressed bytes
 * @return Decompressed bytes
 * @throws FormatException
 */
std::vector<std::uint8_t> decompress_gzip(const std::vector<std::uint8_t>& data);

} // namespace eventwire

#endif // EVENTWIRE_GZIP_HPP
