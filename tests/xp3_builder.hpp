/**
 * Mnemonic - XP3 archive writer for tests
 *
 * Produces archives in the layout the reader accepts, with knobs for the
 * variants the tests exercise: zlib or raw index, cushion header, split and
 * compressed segments, protected entries and vendor index chunks.
 */

#pragma once

#include "mnemonic/compression.hpp"
#include "mnemonic/xp3_reader.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace mnemonic_test {

struct Xp3FileSpec {
    std::string name;
    std::vector<uint8_t> data;
    bool compress = false;
    bool checksum = true;
    uint32_t flags = 0;
    size_t segments = 1;
    // Original size written to the index instead of data.size() (single segment only)
    std::optional<uint64_t> declared_size;
};

inline std::vector<uint8_t> bytes_of(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

class Xp3Builder {
public:
    Xp3Builder& add(const std::string& name, const std::string& content, bool compress = false) {
        return add(Xp3FileSpec{name, bytes_of(content), compress});
    }

    Xp3Builder& add(Xp3FileSpec spec) {
        files_.push_back(std::move(spec));
        return *this;
    }

    Xp3Builder& compress_index(bool enabled) {
        compress_index_ = enabled;
        return *this;
    }

    Xp3Builder& cushion(bool enabled) {
        cushion_ = enabled;
        return *this;
    }

    /**
     * Top-level index chunk written ahead of the File chunks.
     */
    Xp3Builder& index_chunk(const std::string& tag, std::vector<uint8_t> body) {
        chunks_.push_back({tag, std::move(body)});
        return *this;
    }

    size_t header_size() const { return cushion_ ? 40 : 19; }

    std::vector<uint8_t> build() const {
        std::vector<uint8_t> out(mnemonic::XP3_MAGIC.begin(), mnemonic::XP3_MAGIC.end());
        size_t offset_field = out.size();
        put_u64(out, 0);

        if (cushion_) {
            patch_u64(out, offset_field, 0x17);
            put_u32(out, 1);
            out.push_back(mnemonic::XP3_INDEX_CONTINUE);
            put_u64(out, 0);
            offset_field = out.size();
            put_u64(out, 0);
        }

        std::vector<uint8_t> index;
        for (const auto& chunk : chunks_) {
            put_tag(index, chunk.first);
            put_u64(index, chunk.second.size());
            index.insert(index.end(), chunk.second.begin(), chunk.second.end());
        }

        for (const auto& file : files_) {
            std::vector<uint8_t> segm;
            uint64_t archived_total = 0;

            size_t parts = std::max<size_t>(1, file.segments);
            size_t step = (file.data.size() + parts - 1) / parts;
            size_t pos = 0;
            for (size_t p = 0; p < parts; ++p) {
                size_t len = std::min(step, file.data.size() - pos);
                std::vector<uint8_t> piece(file.data.begin() + pos, file.data.begin() + pos + len);
                pos += len;

                std::vector<uint8_t> stored = file.compress ? mnemonic::compress_zlib(piece) : piece;
                put_u32(segm, file.compress ? mnemonic::XP3_SEGM_ENCODE_ZLIB : mnemonic::XP3_SEGM_ENCODE_RAW);
                put_u64(segm, out.size());
                put_u64(segm, parts == 1 && file.declared_size ? *file.declared_size : piece.size());
                put_u64(segm, stored.size());
                archived_total += stored.size();
                out.insert(out.end(), stored.begin(), stored.end());
            }

            std::vector<uint16_t> units = utf16(file.name);
            std::vector<uint8_t> info;
            put_u32(info, file.flags);
            put_u64(info, parts == 1 && file.declared_size ? *file.declared_size : file.data.size());
            put_u64(info, archived_total);
            put_u16(info, static_cast<uint16_t>(units.size()));
            for (uint16_t unit : units) {
                put_u16(info, unit);
            }

            std::vector<uint8_t> body;
            put_tag(body, "info");
            put_u64(body, info.size());
            body.insert(body.end(), info.begin(), info.end());
            put_tag(body, "segm");
            put_u64(body, segm.size());
            body.insert(body.end(), segm.begin(), segm.end());
            if (file.checksum) {
                put_tag(body, "adlr");
                put_u64(body, 4);
                put_u32(body, mnemonic::adler32_checksum(file.data));
            }

            put_tag(index, "File");
            put_u64(index, body.size());
            index.insert(index.end(), body.begin(), body.end());
        }

        patch_u64(out, offset_field, out.size());
        if (compress_index_) {
            std::vector<uint8_t> packed = mnemonic::compress_zlib(index);
            out.push_back(mnemonic::XP3_INDEX_ENCODE_ZLIB);
            put_u64(out, packed.size());
            put_u64(out, index.size());
            out.insert(out.end(), packed.begin(), packed.end());
        } else {
            out.push_back(mnemonic::XP3_INDEX_ENCODE_RAW);
            put_u64(out, index.size());
            out.insert(out.end(), index.begin(), index.end());
        }
        return out;
    }

    std::filesystem::path write(const std::filesystem::path& path) const {
        write_bytes(path, build());
        return path;
    }

    static void write_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    static void put_u16(std::vector<uint8_t>& out, uint16_t v) {
        out.push_back(static_cast<uint8_t>(v));
        out.push_back(static_cast<uint8_t>(v >> 8));
    }

    static void put_u32(std::vector<uint8_t>& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    static void put_u64(std::vector<uint8_t>& out, uint64_t v) {
        for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }

    static void patch_u64(std::vector<uint8_t>& out, size_t at, uint64_t v) {
        for (int i = 0; i < 8; ++i) out[at + i] = static_cast<uint8_t>(v >> (8 * i));
    }

private:
    static void put_tag(std::vector<uint8_t>& out, const std::string& tag) {
        out.insert(out.end(), tag.begin(), tag.begin() + 4);
    }

    static std::vector<uint16_t> utf16(const std::string& text) {
        std::vector<uint16_t> units;
        for (size_t i = 0; i < text.size();) {
            auto c = static_cast<unsigned char>(text[i]);
            uint32_t cp = 0;
            size_t len = 1;
            if (c < 0x80) { cp = c; }
            else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
            else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
            else { cp = c & 0x07; len = 4; }
            for (size_t k = 1; k < len; ++k) {
                cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
            }
            i += len;
            if (cp >= 0x10000) {
                cp -= 0x10000;
                units.push_back(static_cast<uint16_t>(0xD800 + (cp >> 10)));
                units.push_back(static_cast<uint16_t>(0xDC00 + (cp & 0x3FF)));
            } else {
                units.push_back(static_cast<uint16_t>(cp));
            }
        }
        return units;
    }

    std::vector<Xp3FileSpec> files_;
    std::vector<std::pair<std::string, std::vector<uint8_t>>> chunks_;
    bool compress_index_ = true;
    bool cushion_ = false;
};

} // namespace mnemonic_test
