/**
 * Mnemonic - XP3 Archive Reader
 */

#pragma once

#include "mnemonic/files.hpp"
#include "mnemonic/result.hpp"
#include <array>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <cstdint>

namespace mnemonic {

// "XP3\r\n \n\x1A\x8B\x67\x01"
constexpr std::array<uint8_t, 11> XP3_MAGIC = {
    0x58, 0x50, 0x33, 0x0D, 0x0A, 0x20, 0x0A, 0x1A, 0x8B, 0x67, 0x01
};

// Index block flags
constexpr uint8_t XP3_INDEX_ENCODE_MASK = 0x07;
constexpr uint8_t XP3_INDEX_ENCODE_RAW = 0x00;
constexpr uint8_t XP3_INDEX_ENCODE_ZLIB = 0x01;
constexpr uint8_t XP3_INDEX_CONTINUE = 0x80;

// Segment flags
constexpr uint32_t XP3_SEGM_ENCODE_MASK = 0x07;
constexpr uint32_t XP3_SEGM_ENCODE_RAW = 0x00;
constexpr uint32_t XP3_SEGM_ENCODE_ZLIB = 0x01;

// "info" flags; set by encrypting archivers
constexpr uint32_t XP3_FILE_PROTECTED = 0x80000000u;

/**
 * Compression method of an entry, derived from its segments.
 */
enum class Xp3Compression : uint32_t {
    None = 0,
    Zlib = 1
};

/**
 * One stored run of an entry's bytes.
 */
struct Xp3Segment {
    uint32_t flags = 0;
    uint64_t offset = 0;          // Absolute offset in the archive
    uint64_t original_size = 0;   // Size after decompression
    uint64_t archived_size = 0;   // Size as stored

    bool is_compressed() const { return (flags & XP3_SEGM_ENCODE_MASK) == XP3_SEGM_ENCODE_ZLIB; }
};

/**
 * Entry in an XP3 index.
 */
struct Xp3Entry {
    std::string name;                 // UTF-8, as stored
    size_t index = 0;                 // Position in on-disk index order
    uint32_t flags = 0;
    uint64_t original_size = 0;
    uint64_t archived_size = 0;
    std::vector<Xp3Segment> segments;
    std::optional<uint32_t> adler32;  // From the "adlr" chunk when present

    bool is_compressed() const;
    Xp3Compression compression() const;
    uint64_t offset() const { return segments.empty() ? 0 : segments.front().offset; }
};

enum class EncryptionType {
    None,
    Custom,   // Game-specific scheme (hashed name tables)
    Unknown   // Entries flagged protected, scheme not identified
};

const char* encryption_type_name(EncryptionType type);

struct EncryptionInfo {
    bool is_encrypted = false;
    EncryptionType type = EncryptionType::None;
    std::string details;
};

/**
 * Read-only view of an XP3 archive.
 *
 * open() decides once whether the archive is readable or encrypted. An
 * encrypted archive exposes no entries; every enumeration or extraction
 * call fails with EncryptedArchive. The archive keeps one descriptor open
 * for its lifetime; extract() uses positioned reads and may be called from
 * several threads.
 */
class Xp3Archive {
public:
    using ProgressCallback = std::function<bool(const std::string& name, size_t current, size_t total)>;

    static Result<std::unique_ptr<Xp3Archive>> open(const std::filesystem::path& path);

    ~Xp3Archive();

    Xp3Archive(const Xp3Archive&) = delete;
    Xp3Archive& operator=(const Xp3Archive&) = delete;

    bool is_encrypted() const;
    EncryptionInfo encryption() const;

    /**
     * Entries in on-disk index order.
     */
    Result<std::vector<Xp3Entry>> list_entries() const;

    /**
     * First entry with this exact name, in index order.
     */
    Result<Xp3Entry> find_entry(const std::string& name) const;

    Result<std::vector<uint8_t>> extract(const Xp3Entry& entry) const;
    Result<std::vector<uint8_t>> extract(const std::string& name) const;

    Result<void> extract_file(const std::string& name, const std::filesystem::path& output_path) const;
    Result<void> extract_all(const std::filesystem::path& output_dir, ProgressCallback callback = nullptr) const;

    size_t file_count() const;
    uint64_t total_size() const;
    const std::filesystem::path& path() const { return archive_path_; }

private:
    struct Readable {
        std::vector<Xp3Entry> entries;
    };

    struct Encrypted {
        EncryptionInfo info;
    };

    using State = std::variant<Readable, Encrypted>;

    Xp3Archive(std::filesystem::path path, ReadOnlyFile file, State state);

    static Result<uint64_t> read_header(const ReadOnlyFile& file, const std::filesystem::path& path);
    static Result<std::vector<uint8_t>> read_index(const ReadOnlyFile& file, uint64_t offset,
                                                   const std::filesystem::path& path);
    static Result<State> parse_index(const std::vector<uint8_t>& index, uint64_t archive_size,
                                     const std::filesystem::path& path);

    Result<const Readable*> readable() const;
    Error encrypted_error() const;

    std::filesystem::path archive_path_;
    ReadOnlyFile file_;
    State state_;
};

} // namespace mnemonic
