/**
 * Mnemonic - XP3 Reader Implementation
 *
 * KiriKiri XP3 layout:
 * - 11-byte magic, then uint64 LE offset of the first index block
 * - Index blocks: flag byte (encoding + continue bit), sizes, raw or zlib data.
 *   A block with the continue bit is followed by the uint64 offset of the next
 *   one; the 2.29+ "cushion" header is such a block with an empty body.
 * - Index data: top-level chunks (tag + uint64 size); "File" chunks carry
 *   "info", "segm" and "adlr" sub-chunks.
 */

#include "mnemonic/xp3_reader.hpp"
#include "mnemonic/compression.hpp"
#include "mnemonic/logging.hpp"
#include "mnemonic/path_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <new>
#include <set>
#include <stdexcept>
#include <unordered_set>

namespace mnemonic {

namespace {

constexpr std::array<char, 4> FILE_CHUNK = {'F', 'i', 'l', 'e'};
constexpr std::array<char, 4> INFO_CHUNK = {'i', 'n', 'f', 'o'};
constexpr std::array<char, 4> SEGM_CHUNK = {'s', 'e', 'g', 'm'};
constexpr std::array<char, 4> ADLR_CHUNK = {'a', 'd', 'l', 'r'};

// Hashed-name tables written by encrypting archivers
constexpr std::array<char, 4> HNFN_CHUNK = {'h', 'n', 'f', 'n'};
constexpr std::array<char, 4> HXV4_CHUNK = {'H', 'x', 'v', '4'};

constexpr size_t SEGMENT_RECORD_SIZE = 28;
constexpr size_t MAX_INDEX_BLOCKS = 64;
// Decoded index larger than this is treated as damage, not data
constexpr uint64_t MAX_INDEX_SIZE = 256ull * 1024 * 1024;
// Deflate cannot expand input by more than about 1032:1
constexpr uint64_t MAX_INFLATE_RATIO = 1032;
constexpr uint64_t INFLATE_SLACK = 1024;

struct FormatError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Bounds-checked little-endian cursor over a byte buffer.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    size_t remaining() const { return size_ - pos_; }
    size_t position() const { return pos_; }
    bool at_end() const { return pos_ >= size_; }

    uint8_t read_u8() {
        require(1);
        return data_[pos_++];
    }

    uint16_t read_u16() {
        require(2);
        uint16_t value = static_cast<uint16_t>(data_[pos_]) |
                         static_cast<uint16_t>(data_[pos_ + 1]) << 8;
        pos_ += 2;
        return value;
    }

    uint32_t read_u32() {
        require(4);
        uint32_t value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | data_[pos_ + i];
        }
        pos_ += 4;
        return value;
    }

    uint64_t read_u64() {
        require(8);
        uint64_t value = 0;
        for (int i = 7; i >= 0; --i) {
            value = (value << 8) | data_[pos_ + i];
        }
        pos_ += 8;
        return value;
    }

    std::array<char, 4> read_tag() {
        require(4);
        std::array<char, 4> tag;
        std::memcpy(tag.data(), data_ + pos_, 4);
        pos_ += 4;
        return tag;
    }

    /**
     * Reader over the next `length` bytes; advances past them.
     */
    ByteReader sub(uint64_t length) {
        if (length > remaining()) {
            throw FormatError("chunk of " + std::to_string(length) + " bytes overruns its parent (" +
                              std::to_string(remaining()) + " left)");
        }
        ByteReader child(data_ + pos_, static_cast<size_t>(length));
        pos_ += static_cast<size_t>(length);
        return child;
    }

    const uint8_t* current() const { return data_ + pos_; }

    void skip(size_t length) {
        require(length);
        pos_ += length;
    }

private:
    void require(size_t n) const {
        if (n > remaining()) {
            throw FormatError("unexpected end of data at byte " + std::to_string(pos_));
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

std::string tag_string(const std::array<char, 4>& tag) {
    return std::string(tag.data(), tag.size());
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string read_utf16_name(ByteReader& reader, uint16_t units) {
    std::string name;
    name.reserve(units);
    for (uint16_t i = 0; i < units; ++i) {
        uint32_t unit = reader.read_u16();
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units) {
            uint32_t low = reader.read_u16();
            ++i;
            if (low < 0xDC00 || low > 0xDFFF) {
                throw FormatError("invalid UTF-16 surrogate pair in entry name");
            }
            unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
        } else if (unit >= 0xD800 && unit <= 0xDFFF) {
            throw FormatError("unpaired UTF-16 surrogate in entry name");
        }
        append_utf8(name, unit);
    }
    return name;
}

/**
 * Parse one "File" chunk. Returns false if the entry is flagged protected.
 */
bool parse_file_chunk(ByteReader& chunk, uint64_t archive_size, Xp3Entry& entry) {
    bool have_info = false;
    bool have_segm = false;

    while (!chunk.at_end()) {
        auto tag = chunk.read_tag();
        uint64_t size = chunk.read_u64();
        ByteReader body = chunk.sub(size);

        if (tag == INFO_CHUNK) {
            entry.flags = body.read_u32();
            entry.original_size = body.read_u64();
            entry.archived_size = body.read_u64();
            uint16_t name_len = body.read_u16();
            entry.name = read_utf16_name(body, name_len);
            have_info = true;
            if (entry.flags & XP3_FILE_PROTECTED) {
                return false;
            }
        } else if (tag == SEGM_CHUNK) {
            if (size == 0 || size % SEGMENT_RECORD_SIZE != 0) {
                throw FormatError("segm chunk size " + std::to_string(size) +
                                  " is not a multiple of " + std::to_string(SEGMENT_RECORD_SIZE));
            }
            while (!body.at_end()) {
                Xp3Segment seg;
                seg.flags = body.read_u32();
                seg.offset = body.read_u64();
                seg.original_size = body.read_u64();
                seg.archived_size = body.read_u64();

                uint32_t method = seg.flags & XP3_SEGM_ENCODE_MASK;
                if (method != XP3_SEGM_ENCODE_RAW && method != XP3_SEGM_ENCODE_ZLIB) {
                    throw FormatError("unknown segment encoding " + std::to_string(method));
                }
                if (seg.offset > archive_size || seg.archived_size > archive_size - seg.offset) {
                    throw FormatError("segment at " + std::to_string(seg.offset) + " (+" +
                                      std::to_string(seg.archived_size) + ") lies outside the archive");
                }
                if (!seg.is_compressed() && seg.archived_size != seg.original_size) {
                    throw FormatError("stored segment sizes disagree");
                }
                if (seg.is_compressed() && seg.original_size > INFLATE_SLACK &&
                    (seg.original_size - INFLATE_SLACK) / MAX_INFLATE_RATIO > seg.archived_size) {
                    throw FormatError("segment claims " + std::to_string(seg.original_size) +
                                      " bytes from " + std::to_string(seg.archived_size) + " compressed");
                }
                entry.segments.push_back(seg);
            }
            have_segm = true;
        } else if (tag == ADLR_CHUNK) {
            entry.adler32 = body.read_u32();
        }
        // "time" and vendor chunks carry nothing the pipeline needs
    }

    if (!have_info) throw FormatError("File chunk without info");
    if (!have_segm) throw FormatError("File chunk without segm (" + entry.name + ")");

    uint64_t original = 0;
    uint64_t archived = 0;
    for (const auto& seg : entry.segments) {
        if (seg.original_size > UINT64_MAX - original || seg.archived_size > UINT64_MAX - archived) {
            throw FormatError("segment sizes overflow for " + entry.name);
        }
        original += seg.original_size;
        archived += seg.archived_size;
    }
    if (original != entry.original_size || archived != entry.archived_size) {
        throw FormatError("segment sizes do not add up for " + entry.name);
    }
    return true;
}

} // namespace

// Xp3Entry

bool Xp3Entry::is_compressed() const {
    return std::any_of(segments.begin(), segments.end(),
                       [](const Xp3Segment& s) { return s.is_compressed(); });
}

Xp3Compression Xp3Entry::compression() const {
    return is_compressed() ? Xp3Compression::Zlib : Xp3Compression::None;
}

const char* encryption_type_name(EncryptionType type) {
    switch (type) {
        case EncryptionType::None:    return "none";
        case EncryptionType::Custom:  return "custom";
        case EncryptionType::Unknown: return "unknown";
        default:                      return "unknown";
    }
}

// Xp3Archive

Xp3Archive::Xp3Archive(std::filesystem::path path, ReadOnlyFile file, State state)
    : archive_path_(std::move(path)), file_(std::move(file)), state_(std::move(state)) {}

Xp3Archive::~Xp3Archive() = default;

Result<std::unique_ptr<Xp3Archive>> Xp3Archive::open(const std::filesystem::path& path) {
    LOG_DEBUG("Xp3Reader", "Opening: " << path.string());

    ReadOnlyFile file;
    auto opened = file.open(path);
    if (!opened) {
        LOG_ERROR("Xp3Reader", opened.error().full_message());
        return opened.error();
    }

    // A bare signature is an archive with no index at all
    if (file.size() == XP3_MAGIC.size()) {
        MNEMONIC_TRY_ASSIGN(magic, file.read_at(0, XP3_MAGIC.size()));
        if (!std::equal(magic.begin(), magic.end(), XP3_MAGIC.begin())) {
            return Error::malformed_header("Invalid XP3 signature", path.string());
        }
        LOG_INFO("Xp3Reader", "Opened: " << path.filename().string() << " (empty archive)");
        return std::unique_ptr<Xp3Archive>(
            new Xp3Archive(path, std::move(file), State{Readable{}}));
    }

    MNEMONIC_TRY_ASSIGN(index_offset, read_header(file, path));
    MNEMONIC_TRY_ASSIGN(index, read_index(file, index_offset, path));
    MNEMONIC_TRY_ASSIGN(state, parse_index(index, file.size(), path));

    if (auto* enc = std::get_if<Encrypted>(&state)) {
        LOG_WARNING("Xp3Reader", "Encrypted archive: " << path.filename().string()
                    << " (" << encryption_type_name(enc->info.type) << ": " << enc->info.details << ")");
    } else {
        const auto& entries = std::get<Readable>(state).entries;
        LOG_INFO("Xp3Reader", "Opened: " << path.filename().string()
                 << " (" << entries.size() << " files, index@" << index_offset << ")");
    }

    return std::unique_ptr<Xp3Archive>(
        new Xp3Archive(path, std::move(file), std::move(state)));
}

Result<uint64_t> Xp3Archive::read_header(const ReadOnlyFile& file, const std::filesystem::path& path) {
    constexpr size_t header_size = XP3_MAGIC.size() + 8;
    if (file.size() < header_size) {
        return Error::malformed_header("File too small for an XP3 header (" +
                                       std::to_string(file.size()) + " bytes)", path.string());
    }

    MNEMONIC_TRY_ASSIGN(header, file.read_at(0, header_size));
    if (!std::equal(XP3_MAGIC.begin(), XP3_MAGIC.end(), header.begin())) {
        LOG_ERROR("Xp3Reader", "Invalid XP3 signature in: " << path.filename().string());
        return Error::malformed_header("Invalid XP3 signature", path.string());
    }

    ByteReader reader(header.data() + XP3_MAGIC.size(), 8);
    uint64_t offset = reader.read_u64();
    if (offset < header_size) {
        return Error::malformed_header("Index offset " + std::to_string(offset) +
                                       " points into the header", path.string());
    }
    return offset;
}

Result<std::vector<uint8_t>> Xp3Archive::read_index(const ReadOnlyFile& file, uint64_t offset,
                                                    const std::filesystem::path& path) {
    std::vector<uint8_t> index;
    std::set<uint64_t> visited;

    for (size_t block = 0; ; ++block) {
        if (block >= MAX_INDEX_BLOCKS || !visited.insert(offset).second) {
            return Error::corrupt_index("Index block chain does not terminate", path.string());
        }

        auto flag_bytes = file.read_at(offset, 1);
        if (!flag_bytes) {
            return Error::corrupt_index("Index offset " + std::to_string(offset) +
                                        " lies outside the archive", path.string());
        }
        uint8_t flag = flag_bytes.value()[0];
        uint8_t method = flag & XP3_INDEX_ENCODE_MASK;
        uint64_t cursor = offset + 1;

        std::vector<uint8_t> block_data;
        if (method == XP3_INDEX_ENCODE_ZLIB) {
            auto sizes = file.read_at(cursor, 16);
            if (!sizes) {
                return Error::corrupt_index("Truncated compressed index header", path.string());
            }
            ByteReader reader(sizes.value().data(), 16);
            uint64_t compressed_size = reader.read_u64();
            uint64_t index_size = reader.read_u64();
            cursor += 16;

            if (index_size > MAX_INDEX_SIZE || compressed_size > file.size()) {
                return Error::corrupt_index("Implausible index size " + std::to_string(index_size),
                                            path.string());
            }
            auto compressed = file.read_at(cursor, static_cast<size_t>(compressed_size));
            if (!compressed) {
                return Error::corrupt_index("Truncated compressed index", path.string());
            }
            cursor += compressed_size;

            try {
                block_data = decompress_zlib(compressed.value(), static_cast<size_t>(index_size));
            } catch (const std::exception& e) {
                LOG_ERROR("Xp3Reader", "Index decompression failed: " << e.what());
                return Error::corrupt_index(std::string("Index decompression failed: ") + e.what(),
                                            path.string());
            }
            if (block_data.size() != index_size) {
                return Error::corrupt_index("Index decoded to " + std::to_string(block_data.size()) +
                                            " bytes, header says " + std::to_string(index_size),
                                            path.string());
            }
        } else if (method == XP3_INDEX_ENCODE_RAW) {
            auto size_bytes = file.read_at(cursor, 8);
            if (!size_bytes) {
                return Error::corrupt_index("Truncated index header", path.string());
            }
            uint64_t index_size = ByteReader(size_bytes.value().data(), 8).read_u64();
            cursor += 8;

            if (index_size > MAX_INDEX_SIZE) {
                return Error::corrupt_index("Implausible index size " + std::to_string(index_size),
                                            path.string());
            }
            auto raw = file.read_at(cursor, static_cast<size_t>(index_size));
            if (!raw) {
                return Error::corrupt_index("Truncated index", path.string());
            }
            cursor += index_size;
            block_data = std::move(raw.value());
        } else {
            return Error::corrupt_index("Unknown index encoding " + std::to_string(method), path.string());
        }

        index.insert(index.end(), block_data.begin(), block_data.end());

        if (!(flag & XP3_INDEX_CONTINUE)) {
            break;
        }

        auto next = file.read_at(cursor, 8);
        if (!next) {
            return Error::corrupt_index("Missing offset of continued index block", path.string());
        }
        offset = ByteReader(next.value().data(), 8).read_u64();
        LOG_DEBUG("Xp3Reader", "Index continues at " << offset);
    }

    return index;
}

Result<Xp3Archive::State> Xp3Archive::parse_index(const std::vector<uint8_t>& index, uint64_t archive_size,
                                                  const std::filesystem::path& path) {
    Readable readable;
    std::unordered_set<std::string> names;

    try {
        ByteReader reader(index.data(), index.size());
        while (!reader.at_end()) {
            auto tag = reader.read_tag();
            uint64_t size = reader.read_u64();
            ByteReader chunk = reader.sub(size);

            if (tag == HNFN_CHUNK || tag == HXV4_CHUNK) {
                EncryptionInfo info;
                info.is_encrypted = true;
                info.type = EncryptionType::Custom;
                info.details = "hashed name table (" + tag_string(tag) + ")";
                return State{Encrypted{std::move(info)}};
            }

            if (tag != FILE_CHUNK) {
                LOG_DEBUG("Xp3Reader", "Skipping index chunk '" << tag_string(tag) << "'");
                continue;
            }

            Xp3Entry entry;
            entry.index = readable.entries.size();
            if (!parse_file_chunk(chunk, archive_size, entry)) {
                EncryptionInfo info;
                info.is_encrypted = true;
                info.type = EncryptionType::Unknown;
                info.details = "entry '" + entry.name + "' is flagged protected";
                return State{Encrypted{std::move(info)}};
            }

            if (!names.insert(entry.name).second) {
                return Error::corrupt_index("Duplicate entry name '" + entry.name + "'", path.string());
            }
            readable.entries.push_back(std::move(entry));
        }
    } catch (const FormatError& e) {
        LOG_ERROR("Xp3Reader", "Corrupt index in " << path.filename().string() << ": " << e.what());
        return Error::corrupt_index(e.what(), path.string());
    }

    return State{std::move(readable)};
}

bool Xp3Archive::is_encrypted() const {
    return std::holds_alternative<Encrypted>(state_);
}

EncryptionInfo Xp3Archive::encryption() const {
    if (auto* enc = std::get_if<Encrypted>(&state_)) {
        return enc->info;
    }
    return EncryptionInfo{};
}

Error Xp3Archive::encrypted_error() const {
    return Error::encrypted_archive(std::get<Encrypted>(state_).info.details, archive_path_.string());
}

Result<const Xp3Archive::Readable*> Xp3Archive::readable() const {
    if (auto* r = std::get_if<Readable>(&state_)) {
        return r;
    }
    return encrypted_error();
}

Result<std::vector<Xp3Entry>> Xp3Archive::list_entries() const {
    MNEMONIC_TRY_ASSIGN(r, readable());
    return r->entries;
}

Result<Xp3Entry> Xp3Archive::find_entry(const std::string& name) const {
    MNEMONIC_TRY_ASSIGN(r, readable());
    for (const auto& entry : r->entries) {
        if (entry.name == name) {
            return entry;
        }
    }
    LOG_DEBUG("Xp3Reader", "File not found in archive: " << name);
    return Error::file_not_found(name);
}

Result<std::vector<uint8_t>> Xp3Archive::extract(const Xp3Entry& entry) const {
    MNEMONIC_TRY_ASSIGN(r, readable());

    // Entries are only valid against the archive that produced them
    if (entry.index >= r->entries.size() || r->entries[entry.index].name != entry.name) {
        return Error::invalid_argument("Entry '" + entry.name + "' does not belong to " +
                                       archive_path_.filename().string());
    }
    const Xp3Entry& own = r->entries[entry.index];

    std::vector<uint8_t> data;
    try {
        data.reserve(static_cast<size_t>(own.original_size));
    } catch (const std::bad_alloc&) {
        LOG_ERROR("Xp3Reader", "Cannot allocate " << own.original_size << " bytes for " << own.name);
        return Error::corrupt_entry("Declared size " + std::to_string(own.original_size) +
                                    " cannot be allocated", own.name);
    } catch (const std::length_error&) {
        return Error::corrupt_entry("Declared size " + std::to_string(own.original_size) +
                                    " exceeds the addressable size", own.name);
    }

    for (const auto& seg : own.segments) {
        auto stored = file_.read_at(seg.offset, static_cast<size_t>(seg.archived_size));
        if (!stored) {
            LOG_ERROR("Xp3Reader", "Failed to read segment of " << own.name << ": "
                      << stored.error().full_message());
            return Error::corrupt_entry("Failed to read segment: " + stored.error().message, own.name);
        }

        if (seg.is_compressed()) {
            std::vector<uint8_t> inflated;
            try {
                inflated = decompress_zlib(stored.value(), static_cast<size_t>(seg.original_size));
            } catch (const std::bad_alloc&) {
                LOG_ERROR("Xp3Reader", "Cannot allocate segment of " << own.name);
                return Error::corrupt_entry("Segment size " + std::to_string(seg.original_size) +
                                            " cannot be allocated", own.name);
            } catch (const std::exception& e) {
                LOG_ERROR("Xp3Reader", "Decompression failed for: " << own.name << " - " << e.what());
                return Error::corrupt_entry(std::string("Segment decompression failed: ") + e.what(), own.name);
            }
            if (inflated.size() != seg.original_size) {
                return Error::corrupt_entry("Segment decoded to " + std::to_string(inflated.size()) +
                                            " bytes, expected " + std::to_string(seg.original_size),
                                            own.name);
            }
            data.insert(data.end(), inflated.begin(), inflated.end());
        } else {
            data.insert(data.end(), stored.value().begin(), stored.value().end());
        }
    }

    if (data.size() != own.original_size) {
        return Error::corrupt_entry("Length mismatch: " + std::to_string(data.size()) + " of " +
                                    std::to_string(own.original_size) + " bytes", own.name);
    }

    if (own.adler32) {
        uint32_t actual = adler32_checksum(data);
        if (actual != *own.adler32) {
            LOG_ERROR("Xp3Reader", "Checksum mismatch for: " << own.name);
            return Error::corrupt_entry("Adler-32 mismatch", own.name);
        }
    }

    LOG_DEBUG("Xp3Reader", "Extracted " << own.name << " (" << own.archived_size
              << " -> " << own.original_size << ")");
    return data;
}

Result<std::vector<uint8_t>> Xp3Archive::extract(const std::string& name) const {
    MNEMONIC_TRY_ASSIGN(entry, find_entry(name));
    return extract(entry);
}

Result<void> Xp3Archive::extract_file(const std::string& name, const std::filesystem::path& output_path) const {
    MNEMONIC_TRY_ASSIGN(data, extract(name));
    if (!write_file(output_path, data)) {
        return Error::io_error("Failed to write extracted file", output_path.string());
    }
    return Result<void>::success();
}

Result<void> Xp3Archive::extract_all(const std::filesystem::path& output_dir, ProgressCallback callback) const {
    MNEMONIC_TRY_ASSIGN(r, readable());

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return Error::io_error("Failed to create output directory: " + ec.message(), output_dir.string());
    }

    size_t total = r->entries.size();
    size_t current = 0;

    for (const auto& entry : r->entries) {
        std::filesystem::path relative = contained_relative_path(entry.name);
        if (relative.empty()) {
            return Error::invalid_argument("Entry name escapes the output directory: " + entry.name);
        }

        MNEMONIC_TRY_ASSIGN(data, extract(entry));
        if (!write_file(output_dir / relative, data)) {
            return Error::io_error("Failed to write extracted file", (output_dir / relative).string());
        }

        ++current;
        if (callback && !callback(entry.name, current, total)) {
            return Error::cancelled();
        }
    }

    return Result<void>::success();
}

size_t Xp3Archive::file_count() const {
    if (auto* r = std::get_if<Readable>(&state_)) {
        return r->entries.size();
    }
    return 0;
}

uint64_t Xp3Archive::total_size() const {
    uint64_t total = 0;
    if (auto* r = std::get_if<Readable>(&state_)) {
        for (const auto& entry : r->entries) {
            total += entry.original_size;
        }
    }
    return total;
}

} // namespace mnemonic
