/**
 * @file inflate.cpp
 * @brief zlib inflate wrapper.
 */

#include "inflate.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <new>

namespace eventwire::detail {

namespace {

constexpr std::size_t MAX_ZLIB_CHUNK = std::numeric_limits<uInt>::max();

/// Owns a z_stream initialized for inflation.
class InflateContext {
public:
    explicit InflateContext(int window_bits) : stream_{} {
        if (::inflateInit2(&stream_, window_bits) != Z_OK) {
            throw std::bad_alloc();
        }
    }

    ~InflateContext() {
        ::inflateEnd(&stream_);
    }

    InflateContext(const InflateContext&) = delete;
    InflateContext& operator=(const InflateContext&) = delete;

    z_stream& get() noexcept {
        return stream_;
    }

private:
    z_stream stream_;
};

} // namespace

InflateResult inflate_stream(const std::uint8_t* input, std::size_t input_size, int window_bits,
                             std::size_t max_output, std::vector<std::uint8_t>& output) {
    InflateContext context(window_bits);
    z_stream& zs = context.get();

    std::array<std::uint8_t, INFLATE_CHUNK> chunk;
    std::size_t fed = 0;
    std::size_t produced_total = 0;

    for (;;) {
        // zlib counts in uInt, feed large inputs in slices
        if (zs.avail_in == 0 && fed < input_size) {
            std::size_t slice = std::min(input_size - fed, MAX_ZLIB_CHUNK);
            zs.next_in = const_cast<Bytef*>(input + fed);
            zs.avail_in = static_cast<uInt>(slice);
            fed += slice;
        }

        zs.next_out = chunk.data();
        zs.avail_out = static_cast<uInt>(chunk.size());

        int ret = ::inflate(&zs, Z_NO_FLUSH);
        std::size_t produced = chunk.size() - zs.avail_out;
        std::size_t consumed = fed - zs.avail_in;

        if (produced > max_output - produced_total) {
            return {InflateStatus::LimitExceeded, consumed};
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
        produced_total += produced;

        switch (ret) {
        case Z_OK:
            break;
        case Z_STREAM_END:
            return {InflateStatus::Done, consumed};
        case Z_BUF_ERROR:
            // Fresh output space every round, so no progress means no input
            return {InflateStatus::Truncated, consumed};
        case Z_MEM_ERROR:
            throw std::bad_alloc();
        default:
            return {InflateStatus::Corrupt, consumed};
        }
    }
}

std::uint32_t crc32_of(const std::uint8_t* data, std::size_t size) noexcept {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    while (size > 0) {
        std::size_t slice = std::min(size, MAX_ZLIB_CHUNK);
        crc = ::crc32(crc, data, static_cast<uInt>(slice));
        data += slice;
        size -= slice;
    }
    return static_cast<std::uint32_t>(crc);
}

} // namespace eventwire::detail
