/**
 * Mnemonic - Compression Implementation
 */

#include "mnemonic/compression.hpp"
#include <zlib.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace mnemonic {

// Helper to convert zlib error code to string
static const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

std::vector<uint8_t> decompress_zlib(const uint8_t* data, size_t size, size_t expected_size) {
    // One spare byte lets inflate report an oversized stream instead of stopping at the limit
    std::vector<uint8_t> result(expected_size + 1);

    z_stream strm = {};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(result.size());

    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Failed to initialize zlib decompression: ") + zlib_error_string(ret));
    }

    ret = inflate(&strm, Z_FINISH);
    uLong produced = strm.total_out;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error(std::string("Zlib decompression failed: ") + zlib_error_string(ret) +
                                 " (input=" + std::to_string(size) + ", expected=" + std::to_string(expected_size) + ")");
    }

    result.resize(produced);
    return result;
}

std::vector<uint8_t> decompress_zlib(const std::vector<uint8_t>& data, size_t expected_size) {
    return decompress_zlib(data.data(), data.size(), expected_size);
}

std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level) {
    uLongf bound = compressBound(static_cast<uLong>(size));
    std::vector<uint8_t> result(bound);

    int ret = compress2(
        result.data(), &bound,
        data, static_cast<uLong>(size),
        level
    );

    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Zlib compression failed: ") + zlib_error_string(ret));
    }

    result.resize(bound);
    return result;
}

std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level) {
    return compress_zlib(data.data(), data.size(), level);
}

uint32_t adler32_checksum(const uint8_t* data, size_t size) {
    uLong value = adler32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large buffers in slices
    while (size > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(size, 1u << 30));
        value = adler32(value, data, chunk);
        data += chunk;
        size -= chunk;
    }
    return static_cast<uint32_t>(value);
}

uint32_t adler32_checksum(const std::vector<uint8_t>& data) {
    return adler32_checksum(data.data(), data.size());
}

} // namespace mnemonic
