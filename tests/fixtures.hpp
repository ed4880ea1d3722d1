/**
 * @file fixtures.hpp
 * @brief In-memory gzip and zip builders for the tests.
 */

#ifndef EVENTWIRE_TESTS_FIXTURES_HPP
#define EVENTWIRE_TESTS_FIXTURES_HPP

#include <zlib.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fixtures {

inline std::vector<std::uint8_t> bytes(std::string_view text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

inline std::string text(const std::vector<std::uint8_t>& data) {
    return std::string(data.begin(), data.end());
}

/**
 * @brief Deflate with zlib.
 *
 * @param window_bits 31 for a gzip member, -15 for a raw stream
 */
inline std::vector<std::uint8_t> deflate_with(std::string_view input, int window_bits) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    std::vector<std::uint8_t> out(deflateBound(&zs, static_cast<uLong>(input.size())) + 32);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate did not finish");
    }
    return out;
}

inline std::vector<std::uint8_t> gzip(std::string_view input) {
    return deflate_with(input, 31);
}

inline std::vector<std::uint8_t> raw_deflate(std::string_view input) {
    return deflate_with(input, -15);
}

inline void put_le16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
}

inline void put_le32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFU));
    }
}

inline void patch_le16(std::vector<std::uint8_t>& data, std::size_t pos, std::uint16_t value) {
    data.at(pos) = static_cast<std::uint8_t>(value & 0xFFU);
    data.at(pos + 1) = static_cast<std::uint8_t>(value >> 8);
}

inline void patch_le32(std::vector<std::uint8_t>& data, std::size_t pos, std::uint32_t value) {
    for (std::size_t i = 0; i < 4; ++i) {
        data.at(pos + i) = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFU);
    }
}

inline std::uint32_t read_le32(const std::vector<std::uint8_t>& data, std::size_t pos) {
    return static_cast<std::uint32_t>(data.at(pos)) |
           (static_cast<std::uint32_t>(data.at(pos + 1)) << 8) |
           (static_cast<std::uint32_t>(data.at(pos + 2)) << 16) |
           (static_cast<std::uint32_t>(data.at(pos + 3)) << 24);
}

/**
 * @brief One file to put in a test archive.
 *
 * Method 8 deflates the contents; any other method stores them as is but
 * records the given method number.
 */
struct ZipFile {
    std::string name;
    std::string contents;
    std::uint16_t method = 8;
    std::uint16_t flags = 0;
};

/// Offsets of central directory fields relative to the record start
inline constexpr std::size_t CD_FLAGS = 8;
inline constexpr std::size_t CD_METHOD = 10;
inline constexpr std::size_t CD_CRC = 16;
inline constexpr std::size_t CD_COMPRESSED_SIZE = 20;
inline constexpr std::size_t CD_UNCOMPRESSED_SIZE = 24;

/// Offsets of end record fields relative to the record start
inline constexpr std::size_t EOCD_ENTRIES_ON_DISK = 8;
inline constexpr std::size_t EOCD_TOTAL_ENTRIES = 10;

/// Size of a local header, excluding name and extra field
inline constexpr std::size_t LOCAL_HEADER_SIZE = 30;

/**
 * @brief Build a zip archive the way a stock archiver lays it out.
 */
inline std::vector<std::uint8_t> build_zip(const std::vector<ZipFile>& files,
                                           std::string_view comment = {}) {
    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> directory;

    for (const auto& file : files) {
        auto crc = static_cast<std::uint32_t>(
            crc32(0L, reinterpret_cast<const Bytef*>(file.contents.data()),
                  static_cast<uInt>(file.contents.size())));
        std::vector<std::uint8_t> payload =
            (file.method == 8) ? raw_deflate(file.contents) : bytes(file.contents);
        auto offset = static_cast<std::uint32_t>(out.size());
        auto name_len = static_cast<std::uint16_t>(file.name.size());

        put_le32(out, 0x04034B50U);
        put_le16(out, 20);
        put_le16(out, file.flags);
        put_le16(out, file.method);
        put_le16(out, 0);      // time
        put_le16(out, 0x0021); // 1980-01-01
        put_le32(out, crc);
        put_le32(out, static_cast<std::uint32_t>(payload.size()));
        put_le32(out, static_cast<std::uint32_t>(file.contents.size()));
        put_le16(out, name_len);
        put_le16(out, 0);
        out.insert(out.end(), file.name.begin(), file.name.end());
        out.insert(out.end(), payload.begin(), payload.end());

        put_le32(directory, 0x02014B50U);
        put_le16(directory, 20);
        put_le16(directory, 20);
        put_le16(directory, file.flags);
        put_le16(directory, file.method);
        put_le16(directory, 0);
        put_le16(directory, 0x0021);
        put_le32(directory, crc);
        put_le32(directory, static_cast<std::uint32_t>(payload.size()));
        put_le32(directory, static_cast<std::uint32_t>(file.contents.size()));
        put_le16(directory, name_len);
        put_le16(directory, 0); // extra
        put_le16(directory, 0); // comment
        put_le16(directory, 0); // disk
        put_le16(directory, 0); // internal attributes
        put_le32(directory, 0); // external attributes
        put_le32(directory, offset);
        directory.insert(directory.end(), file.name.begin(), file.name.end());
    }

    auto directory_offset = static_cast<std::uint32_t>(out.size());
    out.insert(out.end(), directory.begin(), directory.end());

    put_le32(out, 0x06054B50U);
    put_le16(out, 0);
    put_le16(out, 0);
    put_le16(out, static_cast<std::uint16_t>(files.size()));
    put_le16(out, static_cast<std::uint16_t>(files.size()));
    put_le32(out, static_cast<std::uint32_t>(directory.size()));
    put_le32(out, directory_offset);
    put_le16(out, static_cast<std::uint16_t>(comment.size()));
    out.insert(out.end(), comment.begin(), comment.end());
    return out;
}

/// Offset of the end record in an archive built without a comment
inline std::size_t end_record_offset(const std::vector<std::uint8_t>& zip) {
    return zip.size() - 22;
}

/// Offset of the first central directory record in an archive built without a comment
inline std::size_t central_directory_offset(const std::vector<std::uint8_t>& zip) {
    return read_le32(zip, end_record_offset(zip) + 16);
}

/// Offset of the first file's data in an archive from build_zip()
inline std::size_t first_payload_offset(const ZipFile& file) {
    return LOCAL_HEADER_SIZE + file.name.size();
}

} // namespace fixtures

#endif // EVENTWIRE_TESTS_FIXTURES_HPP
