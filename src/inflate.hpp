/**
 * @file inflate.hpp
 * @brief Internal zlib inflate helper shared by the gzip and zip decoders.
 */

#ifndef EVENTWIRE_SRC_INFLATE_HPP
#define EVENTWIRE_SRC_INFLATE_HPP

#include <eventwire/config.hpp>

#include <limits>
#include <vector>

namespace eventwire::detail {

/**
 * @brief Outcome of inflating one deflate stream.
 */
enum class InflateStatus {
    Done,         ///< Stream end reached
    Corrupt,      ///< zlib rejected the stream (bad header, data or checksum)
    Truncated,    ///< Input ran out before the stream end
    LimitExceeded ///< Output would grow past the caller's limit
};

struct InflateResult {
    InflateStatus status;
    std::size_t consumed; ///< Input bytes used up to the stream end
};

/**
 * @brief Inflate a single stream and append its output.
 *
 * Stops at the first stream end, so trailing input is left for the caller
 * (consumed tells where it starts).
 *
 * @param input Compressed bytes
 * @param input_size Number of compressed bytes
 * @param window_bits zlib window bits (GZIP_WINDOW_BITS or RAW_DEFLATE_WINDOW_BITS)
 * @param max_output Maximum number of bytes this call may append
 * @param output Destination, appended to
 * @return Status and consumed input length
 *
 * @throws std::bad_alloc if zlib cannot allocate its state
 */
InflateResult inflate_stream(const std::uint8_t* input, std::size_t input_size, int window_bits,
                             std::size_t max_output, std::vector<std::uint8_t>& output);

/**
 * @brief CRC-32 (ISO-HDLC, as used by gzip and zip) of a buffer.
 */
std::uint32_t crc32_of(const std::uint8_t* data, std::size_t size) noexcept;

inline constexpr std::size_t UNLIMITED_OUTPUT = std::numeric_limits<std::size_t>::max();

} // namespace eventwire::detail

#endif // EVENTWIRE_SRC_INFLATE_HPP
