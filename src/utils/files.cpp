/**
 * Mnemonic - File Utilities Implementation
 */

#include "mnemonic/files.hpp"
#include "mnemonic/logging.hpp"

#include <fstream>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mnemonic {

Result<std::vector<uint8_t>> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::file_not_found(path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Failed to open file", path.string());
    }

    file.seekg(0, std::ios::end);
    auto size = static_cast<size_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(size);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (file.gcount() != static_cast<std::streamsize>(size)) {
        return Error::io_error("Short read (" + std::to_string(file.gcount()) + " of " +
                               std::to_string(size) + " bytes)", path.string());
    }
    return data;
}

bool write_file(const std::filesystem::path& path, const uint8_t* data, size_t size) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return file.good();
}

bool write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    return write_file(path, data.data(), data.size());
}

std::string format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 3) {
        size /= 1024.0;
        unit++;
    }

    char buf[64];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%zu B", bytes);
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    }
    return buf;
}

// ReadOnlyFile

ReadOnlyFile::~ReadOnlyFile() {
    close();
}

ReadOnlyFile::ReadOnlyFile(ReadOnlyFile&& other) noexcept
    : fd_(other.fd_), size_(other.size_), path_(std::move(other.path_)) {
    other.fd_ = -1;
    other.size_ = 0;
}

ReadOnlyFile& ReadOnlyFile::operator=(ReadOnlyFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        size_ = other.size_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

Result<void> ReadOnlyFile::open(const std::filesystem::path& path) {
    close();

    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        if (errno == ENOENT) {
            return Error::file_not_found(path.string());
        }
        return Error::io_error(std::string("Failed to open file: ") + std::strerror(errno), path.string());
    }

    struct stat st;
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        close();
        return Error::io_error(std::string("Failed to stat file: ") + std::strerror(err), path.string());
    }
    if (!S_ISREG(st.st_mode)) {
        close();
        return Error::io_error("Not a regular file", path.string());
    }

    size_ = static_cast<uint64_t>(st.st_size);
    path_ = path;
    return Result<void>::success();
}

void ReadOnlyFile::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_ = 0;
}

Result<void> ReadOnlyFile::read_at(uint64_t offset, uint8_t* out, size_t length) const {
    if (fd_ < 0) {
        return Error::io_error("File is not open", path_.string());
    }
    if (offset > size_ || length > size_ - offset) {
        return Error::io_error("Read of " + std::to_string(length) + " bytes at offset " +
                               std::to_string(offset) + " exceeds file size " + std::to_string(size_),
                               path_.string());
    }

    size_t done = 0;
    while (done < length) {
        ssize_t n = ::pread(fd_, out + done, length - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Error::io_error(std::string("pread failed: ") + std::strerror(errno), path_.string());
        }
        if (n == 0) {
            return Error::io_error("Unexpected end of file at offset " + std::to_string(offset + done),
                                   path_.string());
        }
        done += static_cast<size_t>(n);
    }
    return Result<void>::success();
}

Result<std::vector<uint8_t>> ReadOnlyFile::read_at(uint64_t offset, size_t length) const {
    std::vector<uint8_t> data(length);
    MNEMONIC_TRY(read_at(offset, data.data(), length));
    return data;
}

// TempDirectory

TempDirectory::TempDirectory(const std::string& prefix) {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        LOG_ERROR("Files", "No temporary directory available: " << ec.message());
        return;
    }

    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        LOG_ERROR("Files", "mkdtemp failed for " << pattern << ": " << std::strerror(errno));
        return;
    }
    path_ = buffer.data();
}

TempDirectory::~TempDirectory() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARNING("Files", "Failed to remove " << path_.string() << ": " << ec.message());
    }
}

} // namespace mnemonic
