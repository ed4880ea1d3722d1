/**
 * @file zip.hpp
 * @brief Single-file zip archive validation and extraction.
 *
 * Validation is layered: central directory structure, then entry count,
 * then extraction, then size check. Each layer reports its own Error tag.
 * Only stored (method 0) and deflated (method 8) entries can be extracted;
 * multi-disk, Zip64 and encrypted archives are not supported.
 *
 * @see https://pkware.cachefly.net/webdocs/casestudies/APPNOTE.TXT PKWARE APPNOTE
 */

#ifndef EVENTWIRE_ZIP_HPP
#define EVENTWIRE_ZIP_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>
#include <vector>

namespace eventwire {

/// Compression methods understood by the extractor
enum class ZipMethod : std::uint16_t {
    Stored = 0,
    Deflated = 8
};

/**
 * @brief One central directory record.
 */
struct ZipEntry {
    std::string name;
    std::uint16_t flags = 0;
    std::uint16_t method = 0;
    std::uint32_t crc32 = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t local_header_offset = 0; ///< Absolute offset in the buffer

    [[nodiscard]] bool is_encrypted() const noexcept {
        return (flags & 0x0001U) != 0;
    }

    [[nodiscard]] bool is_directory() const noexcept {
        return !name.empty() && name.back() == '/';
    }
};

/**
 * @brief Check whether a buffer holds a valid zip central directory.
 *
 * @param data Buffer to check
 * @param size Buffer size in bytes
 * @return true if the end record and every directory record parse
 */
[[nodiscard]] bool is_zip(const std::uint8_t* data, std::size_t size) noexcept;

/// @overload
[[nodiscard]] bool is_zip(const std::vector<std::uint8_t>& data) noexcept;

/**
 * @brief Read the central directory.
 *
 * @param data Archive bytes
 * @param size Number of bytes
 * @param[out] entries Directory records in archive order
 * @return Error::Ok, or Error::InvalidFormat if the directory does not parse
 */
Error list_zip_entries(const std::uint8_t* data, std::size_t size,
                       std::vector<ZipEntry>& entries);

/**
 * @brief Read the central directory, throwing on failure.
 * @throws FormatException
 */
std::vector<ZipEntry> list_zip_entries(const std::vector<std::uint8_t>& data);

/**
 * @brief Extract the only file of a single-entry archive.
 *
 * @param data Archive bytes
 * @param size Number of bytes
 * @param[out] output Entry contents (replaced, cleared on failure)
 * @return Error::Ok on success;
 *         Error::InvalidFormat if not a zip or the archive is empty;
 *         Error::MultipleEntries if it holds more than one entry;
 *         Error::ExtractFailed if the entry cannot be decoded;
 *         Error::SizeMismatch if the decoded length differs from the record
 */
Error decompress_zip(const std::uint8_t* data, std::size_t size,
                     std::vector<std::uint8_t>& output);

/**
 * @brief Extract the only file of a single-entry archive, throwing on failure.
 *
 * @throws FormatException, MultiEntryException, ExtractionException,
 *         SizeMismatchException
 */
std::vector<std::uint8_t> decompress_zip(const std::vector<std::uint8_t>& data);

} // namespace eventwire

#endif // EVENTWIRE_ZIP_HPP
