/**
 * @file zip.cpp
 * @brief Zip central directory parsing and single-entry extraction.
 */

#include <eventwire/bytereader.hpp>
#include <eventwire/logging.hpp>
#include <eventwire/zip.hpp>

#include "inflate.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

namespace eventwire {

namespace {

/// Marker for a 32-bit field whose real value lives in a Zip64 extra field
constexpr std::uint32_t ZIP64_SENTINEL = 0xFFFFFFFFU;

struct EndRecord {
    std::size_t position = 0; ///< Offset of the EOCD signature
    std::uint16_t disk = 0;
    std::uint16_t directory_disk = 0;
    std::uint16_t entries_on_disk = 0;
    std::uint16_t total_entries = 0;
    std::uint32_t directory_size = 0;
    std::uint32_t directory_offset = 0;
};

/**
 * @brief Locate the End Of Central Directory record.
 *
 * Searches backwards from the end of the buffer over the longest possible
 * archive comment. A candidate whose comment would run past the buffer is
 * signature-like comment data and is skipped.
 */
bool find_end_record(const std::uint8_t* data, std::size_t size, EndRecord& record) noexcept {
    if (data == nullptr || size < ZIP_EOCD_SIZE) {
        return false;
    }

    std::size_t last = size - ZIP_EOCD_SIZE;
    std::size_t first = (last > ZIP_MAX_COMMENT) ? last - ZIP_MAX_COMMENT : 0;

    for (std::size_t pos = last + 1; pos-- > first;) {
        if (load_le32(data + pos) != ZIP_EOCD_SIG) {
            continue;
        }

        ByteReader reader(data + pos + 4, ZIP_EOCD_SIZE - 4);
        record.position = pos;
        record.disk = reader.read_u16();
        record.directory_disk = reader.read_u16();
        record.entries_on_disk = reader.read_u16();
        record.total_entries = reader.read_u16();
        record.directory_size = reader.read_u32();
        record.directory_offset = reader.read_u32();
        std::uint16_t comment_len = reader.read_u16();

        if (comment_len <= size - pos - ZIP_EOCD_SIZE) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Walk the central directory.
 *
 * @param entries Receives the records, or nullptr to validate only
 */
Error read_directory(const std::uint8_t* data, std::size_t size, std::vector<ZipEntry>* entries) {
    EndRecord end;
    if (!find_end_record(data, size, end)) {
        return Error::InvalidFormat;
    }

    // Spanned archives
    if (end.disk != 0 || end.directory_disk != 0 || end.entries_on_disk != end.total_entries) {
        return Error::InvalidFormat;
    }

    // Zip64 archives
    if (end.position >= ZIP64_EOCD_LOCATOR_SIZE &&
        load_le32(data + end.position - ZIP64_EOCD_LOCATOR_SIZE) == ZIP64_EOCD_LOCATOR_SIG) {
        return Error::InvalidFormat;
    }

    if (end.directory_size > end.position ||
        end.directory_offset > end.position - end.directory_size) {
        return Error::InvalidFormat;
    }

    // The directory sits right before the end record. Anything in front of
    // the recorded offset is data prepended to the archive (e.g. a stub).
    std::size_t directory_start = end.position - end.directory_size;
    std::size_t prefix = directory_start - end.directory_offset;

    ByteReader reader(data + directory_start, end.directory_size);
    std::size_t count = 0;

    while (reader.remaining() > 0) {
        if (reader.read_u32() != ZIP_CENTRAL_HEADER_SIG) {
            return Error::InvalidFormat;
        }
        reader.skip(4); // version made by, version needed
        std::uint16_t flags = reader.read_u16();
        std::uint16_t method = reader.read_u16();
        reader.skip(4); // modification time and date
        std::uint32_t crc = reader.read_u32();
        std::uint32_t compressed_size = reader.read_u32();
        std::uint32_t uncompressed_size = reader.read_u32();
        std::uint16_t name_len = reader.read_u16();
        std::uint16_t extra_len = reader.read_u16();
        std::uint16_t comment_len = reader.read_u16();
        reader.skip(8); // disk number, internal and external attributes
        std::uint32_t local_offset = reader.read_u32();

        const std::uint8_t* name = reader.current();
        reader.skip(name_len);
        reader.skip(extra_len);
        reader.skip(comment_len);

        if (reader.overrun()) {
            return Error::InvalidFormat;
        }
        if (compressed_size == ZIP64_SENTINEL || uncompressed_size == ZIP64_SENTINEL ||
            local_offset == ZIP64_SENTINEL) {
            return Error::InvalidFormat;
        }

        ++count;
        if (entries != nullptr) {
            ZipEntry entry;
            entry.name.assign(reinterpret_cast<const char*>(name), name_len);
            entry.flags = flags;
            entry.method = method;
            entry.crc32 = crc;
            entry.compressed_size = compressed_size;
            entry.uncompressed_size = uncompressed_size;
            entry.local_header_offset = static_cast<std::uint64_t>(prefix) + local_offset;
            entries->push_back(std::move(entry));
        }
    }

    if (count != end.total_entries) {
        return Error::InvalidFormat;
    }
    return Error::Ok;
}

/**
 * @brief Decode one entry through its local header.
 */
Error extract_entry(const std::uint8_t* data, std::size_t size, const ZipEntry& entry,
                    std::vector<std::uint8_t>& output) {
    if (entry.is_encrypted()) {
        return Error::ExtractFailed;
    }
    if (entry.method != static_cast<std::uint16_t>(ZipMethod::Stored) &&
        entry.method != static_cast<std::uint16_t>(ZipMethod::Deflated)) {
        return Error::ExtractFailed;
    }

    ByteReader reader(data, size);
    if (entry.local_header_offset > size ||
        !reader.seek(static_cast<std::size_t>(entry.local_header_offset))) {
        return Error::ExtractFailed;
    }

    if (reader.read_u32() != ZIP_LOCAL_HEADER_SIG) {
        return Error::ExtractFailed;
    }
    reader.skip(22); // versions, flags, method, time, date, crc, sizes
    std::uint16_t name_len = reader.read_u16();
    std::uint16_t extra_len = reader.read_u16();
    const std::uint8_t* name = reader.current();
    if (!reader.skip(name_len)) {
        return Error::ExtractFailed;
    }
    if (std::string_view(reinterpret_cast<const char*>(name), name_len) != entry.name) {
        return Error::ExtractFailed;
    }
    reader.skip(extra_len);
    if (reader.overrun() || entry.compressed_size > reader.remaining()) {
        return Error::ExtractFailed;
    }

    const std::uint8_t* payload = reader.current();
    auto payload_size = static_cast<std::size_t>(entry.compressed_size);

    if (entry.method == static_cast<std::uint16_t>(ZipMethod::Stored)) {
        output.assign(payload, payload + payload_size);
    } else {
        // Stop right past the recorded size instead of inflating a bomb
        auto limit = static_cast<std::size_t>(
            std::min<std::uint64_t>(entry.uncompressed_size, detail::UNLIMITED_OUTPUT));
        auto result = detail::inflate_stream(payload, payload_size, RAW_DEFLATE_WINDOW_BITS,
                                             limit, output);
        if (result.status == detail::InflateStatus::LimitExceeded) {
            return Error::SizeMismatch;
        }
        if (result.status != detail::InflateStatus::Done) {
            return Error::ExtractFailed;
        }
    }

    if (detail::crc32_of(output.data(), output.size()) != entry.crc32) {
        return Error::ExtractFailed;
    }
    if (output.size() != entry.uncompressed_size) {
        return Error::SizeMismatch;
    }
    return Error::Ok;
}

Error reject(std::vector<std::uint8_t>& output, Error error, const char* reason) {
    output.clear();
    logger()->debug("zip payload rejected ({}): {}", error_string(error), reason);
    return error;
}

} // namespace

bool is_zip(const std::uint8_t* data, std::size_t size) noexcept {
    return read_directory(data, size, nullptr) == Error::Ok;
}

bool is_zip(const std::vector<std::uint8_t>& data) noexcept {
    return is_zip(data.data(), data.size());
}

Error list_zip_entries(const std::uint8_t* data, std::size_t size,
                       std::vector<ZipEntry>& entries) {
    entries.clear();
    Error status = read_directory(data, size, &entries);
    if (status != Error::Ok) {
        entries.clear();
    }
    return status;
}

std::vector<ZipEntry> list_zip_entries(const std::vector<std::uint8_t>& data) {
    std::vector<ZipEntry> entries;
    throw_on_error(list_zip_entries(data.data(), data.size(), entries));
    return entries;
}

Error decompress_zip(const std::uint8_t* data, std::size_t size,
                     std::vector<std::uint8_t>& output) {
    output.clear();

    std::vector<ZipEntry> entries;
    if (list_zip_entries(data, size, entries) != Error::Ok) {
        return reject(output, Error::InvalidFormat, "central directory does not parse");
    }
    if (entries.empty()) {
        return reject(output, Error::InvalidFormat, "archive has no entries");
    }
    if (entries.size() > 1) {
        return reject(output, Error::MultipleEntries, "archive has more than one entry");
    }

    const ZipEntry& entry = entries.front();
    Error status = extract_entry(data, size, entry, output);
    if (status != Error::Ok) {
        return reject(output, status, entry.name.c_str());
    }

    logger()->trace("zip entry '{}' extracted: {} -> {} bytes", entry.name,
                    entry.compressed_size, output.size());
    return Error::Ok;
}

std::vector<std::uint8_t> decompress_zip(const std::vector<std::uint8_t>& data) {
    std::vector<std::uint8_t> output;
    throw_on_error(decompress_zip(data.data(), data.size(), output));
    return output;
}

} // namespace eventwire
