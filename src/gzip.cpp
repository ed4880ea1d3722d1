/**
 * @file gzip.cpp
 * @brief gzip decompression on top of zlib.
 */

#include <eventwire/gzip.hpp>
#include <eventwire/logging.hpp>

#include "inflate.hpp"

#include <algorithm>

namespace eventwire {

namespace {

bool all_zero(const std::uint8_t* data, std::size_t size) noexcept {
    return std::all_of(data, data + size, [](std::uint8_t b) { return b == 0; });
}

Error reject(std::vector<std::uint8_t>& output, const char* reason) {
    output.clear();
    logger()->debug("gzip payload rejected: {}", reason);
    return Error::InvalidFormat;
}

} // namespace

bool is_gzip(const std::uint8_t* data, std::size_t size) noexcept {
    return data != nullptr && size >= 2 && data[0] == GZIP_MAGIC[0] && data[1] == GZIP_MAGIC[1];
}

bool is_gzip(const std::vector<std::uint8_t>& data) noexcept {
    return is_gzip(data.data(), data.size());
}

Error decompress_gzip(const std::uint8_t* data, std::size_t size,
                      std::vector<std::uint8_t>& output) {
    output.clear();
    if (!is_gzip(data, size)) {
        return reject(output, "missing gzip magic");
    }

    std::size_t pos = 0;
    std::size_t members = 0;
    while (pos < size) {
        if (members > 0) {
            if (all_zero(data + pos, size - pos)) {
                break;
            }
            if (!is_gzip(data + pos, size - pos)) {
                return reject(output, "trailing garbage after gzip member");
            }
        }

        auto result = detail::inflate_stream(data + pos, size - pos, GZIP_WINDOW_BITS,
                                             detail::UNLIMITED_OUTPUT, output);
        if (result.status == detail::InflateStatus::Truncated) {
            return reject(output, "truncated gzip member");
        }
        if (result.status != detail::InflateStatus::Done) {
            return reject(output, "corrupt gzip member");
        }

        pos += result.consumed;
        ++members;
    }

    logger()->trace("gzip payload decoded: {} member(s), {} -> {} bytes", members, size,
                    output.size());
    return Error::Ok;
}

std::vector<std::uint8_t> decompress_gzip(const std::vector<std::uint8_t>& data) {
    std::vector<std::uint8_t> output;
    throw_on_error(decompress_gzip(data.data(), data.size(), output));
    return output;
}

} // namespace eventwire
