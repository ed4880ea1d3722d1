/**
 * @file config.hpp
 * @brief eventwire compile-time configuration.
 *
 * Version information, container format constants and the default batching
 * limits used by the wire formatters.
 */

#ifndef EVENTWIRE_CONFIG_HPP
#define EVENTWIRE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace eventwire {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Default HEC batch limit in bytes (receiving side default event length)
#ifndef EVENTWIRE_MAX_HEC_BATCH_BYTES
#define EVENTWIRE_MAX_HEC_BATCH_BYTES 1000000U
#endif

inline constexpr std::size_t DEFAULT_MAX_HEC_BATCH_BYTES = EVENTWIRE_MAX_HEC_BATCH_BYTES;

/// gzip member magic (RFC 1952, section 2.3.1)
inline constexpr std::uint8_t GZIP_MAGIC[2] = {0x1FU, 0x8BU};

/// zlib window bits selecting the gzip wrapper
inline constexpr int GZIP_WINDOW_BITS = 16 + 15;

/// zlib window bits selecting a raw deflate stream (zip method 8)
inline constexpr int RAW_DEFLATE_WINDOW_BITS = -15;

/// Zip record signatures (APPNOTE.TXT 4.3.7, 4.3.12, 4.3.16)
inline constexpr std::uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034B50U;
inline constexpr std::uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014B50U;
inline constexpr std::uint32_t ZIP_EOCD_SIG = 0x06054B50U;
inline constexpr std::uint32_t ZIP64_EOCD_LOCATOR_SIG = 0x07064B50U;

/// Fixed record sizes in bytes, excluding variable-length fields
inline constexpr std::size_t ZIP_LOCAL_HEADER_SIZE = 30U;
inline constexpr std::size_t ZIP_CENTRAL_HEADER_SIZE = 46U;
inline constexpr std::size_t ZIP_EOCD_SIZE = 22U;
inline constexpr std::size_t ZIP64_EOCD_LOCATOR_SIZE = 20U;

/// Maximum archive comment length, bounds the EOCD search window
inline constexpr std::size_t ZIP_MAX_COMMENT = 0xFFFFU;

/// Inflate output chunk size
inline constexpr std::size_t INFLATE_CHUNK = 16U * 1024U;

/** @} */

} // namespace eventwire

#endif // EVENTWIRE_CONFIG_HPP
