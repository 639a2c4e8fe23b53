/**
 * Mnemonic - Compression utilities
 *
 * XP3 stores both its index and entry segments as raw or zlib streams.
 */

#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace mnemonic {

/**
 * Decompress zlib data. Throws std::runtime_error on a damaged stream or
 * when the output does not fit in expected_size bytes.
 */
std::vector<uint8_t> decompress_zlib(const uint8_t* data, size_t size, size_t expected_size);
std::vector<uint8_t> decompress_zlib(const std::vector<uint8_t>& data, size_t expected_size);

/**
 * Compress data with zlib.
 */
std::vector<uint8_t> compress_zlib(const uint8_t* data, size_t size, int level = 6);
std::vector<uint8_t> compress_zlib(const std::vector<uint8_t>& data, int level = 6);

/**
 * Adler-32 checksum as stored in the XP3 "adlr" chunk.
 */
uint32_t adler32_checksum(const uint8_t* data, size_t size);
uint32_t adler32_checksum(const std::vector<uint8_t>& data);

} // namespace mnemonic
