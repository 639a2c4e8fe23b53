/**
 * Mnemonic - Common types and definitions
 */

#pragma once

#include "mnemonic/xp3_reader.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <functional>

namespace mnemonic {

/**
 * Asset category, decided from the entry extension.
 */
enum class AssetKind {
    Script,
    Image,
    Audio,
    Video,
    Other
};

const char* asset_kind_name(AssetKind kind);

/**
 * Routing decision for one archive entry.
 */
enum class Route {
    PassThrough,   // Copied into the manifest unchanged
    Convert,       // Sent through the transcoder
    Skip           // Excluded by configuration
};

const char* route_name(Route route);

/**
 * Archive entry plus its routing decision. Produced once per entry.
 */
struct ClassifiedEntry {
    Xp3Entry entry;
    AssetKind kind = AssetKind::Other;
    Route route = Route::PassThrough;
    std::string source_format;   // Extension without the dot, "" if none
    std::string target_format;   // Set for Route::Convert
    std::string output_name;     // Name the asset takes in the manifest

    bool needs_conversion() const { return route == Route::Convert; }
};

enum class FailureReason {
    None,
    NonZeroExit,
    Timeout,
    OutputUnreadable,
    SpawnFailed,
    ExtractionFailed,
    Cancelled
};

const char* failure_reason_name(FailureReason reason);

/**
 * Outcome of converting one entry: Converted(bytes, format) or Failed(reason).
 */
struct ConversionResult {
    enum class Status { Converted, Failed };

    Status status = Status::Failed;
    std::vector<uint8_t> data;
    std::string format;
    FailureReason reason = FailureReason::None;
    std::string message;
    int attempts = 0;

    bool ok() const { return status == Status::Converted; }

    static ConversionResult converted(std::vector<uint8_t> bytes, std::string fmt) {
        ConversionResult r;
        r.status = Status::Converted;
        r.data = std::move(bytes);
        r.format = std::move(fmt);
        return r;
    }

    static ConversionResult failed(FailureReason why, std::string msg) {
        ConversionResult r;
        r.status = Status::Failed;
        r.reason = why;
        r.message = std::move(msg);
        return r;
    }
};

/**
 * Progress callback for long operations.
 */
using ProgressCallback = std::function<void(size_t current, size_t total, const std::string& item)>;

} // namespace mnemonic
