/**
 * Mnemonic - File utilities
 */

#pragma once

#include "mnemonic/result.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace mnemonic {

namespace fs = std::filesystem;

/**
 * Read entire file into memory.
 */
Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

/**
 * Write data to file, creating parent directories.
 */
bool write_file(const std::filesystem::path& path, const uint8_t* data, size_t size);
bool write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data);

/**
 * Format file size for display.
 */
std::string format_file_size(size_t bytes);

/**
 * Read-only file descriptor with positioned reads.
 *
 * pread() leaves the shared file offset untouched, so one instance can
 * serve several reader threads at once.
 */
class ReadOnlyFile {
public:
    ReadOnlyFile() = default;
    ~ReadOnlyFile();

    ReadOnlyFile(const ReadOnlyFile&) = delete;
    ReadOnlyFile& operator=(const ReadOnlyFile&) = delete;
    ReadOnlyFile(ReadOnlyFile&& other) noexcept;
    ReadOnlyFile& operator=(ReadOnlyFile&& other) noexcept;

    Result<void> open(const std::filesystem::path& path);
    void close();

    bool is_open() const { return fd_ >= 0; }
    uint64_t size() const { return size_; }

    /**
     * Read exactly `length` bytes at `offset` into `out`.
     * Fails if the range lies outside the file or the read comes up short.
     */
    Result<void> read_at(uint64_t offset, uint8_t* out, size_t length) const;
    Result<std::vector<uint8_t>> read_at(uint64_t offset, size_t length) const;

private:
    int fd_ = -1;
    uint64_t size_ = 0;
    std::filesystem::path path_;
};

/**
 * Scratch directory removed with everything in it on destruction.
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix);
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    bool valid() const { return !path_.empty(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace mnemonic
