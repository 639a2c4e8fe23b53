/**
 * Mnemonic - Asset Converter
 *
 * Turns classified archive entries into final asset bytes. Pass-through
 * entries are returned as-is; the rest go through a Transcoder. Failures are
 * per entry and never abort the batch.
 */

#pragma once

#include "mnemonic/config.hpp"
#include "mnemonic/transcoder.hpp"
#include "mnemonic/types.hpp"
#include "mnemonic/xp3_reader.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mnemonic {

/**
 * Outcome of convert_all. `results` is indexed like the classified input;
 * skipped entries and entries that were never reached stay empty.
 */
struct ConversionBatch {
    struct ExtractionFailure {
        size_t position = 0;
        std::string name;
        Error error;
    };

    std::vector<std::optional<ConversionResult>> results;
    std::vector<ExtractionFailure> extraction_failures;   // Index order
    std::vector<std::string> failed_entries;               // Index order
    bool cancelled = false;

    size_t converted_count() const;
};

class AssetConverter {
public:
    AssetConverter(Transcoder& transcoder, const ProjectConfig& config);

    /**
     * Convert one entry. Never throws; every failure is a Failed result.
     */
    ConversionResult convert(const ClassifiedEntry& entry, std::vector<uint8_t> raw,
                             const CancellationToken& cancel) const;

    /**
     * Extract and convert every non-skipped entry on a bounded worker pool.
     * Workers share the archive read-only. `progress` is called from the
     * workers, outside the results lock, and may run concurrently.
     */
    ConversionBatch convert_all(const Xp3Archive& archive, const std::vector<ClassifiedEntry>& entries,
                                const CancellationToken& cancel,
                                ProgressCallback progress = nullptr) const;

private:
    ConversionResult transcode(const ClassifiedEntry& entry, const std::vector<uint8_t>& raw,
                               const CancellationToken& cancel) const;
    bool wait_backoff(int attempt, const CancellationToken& cancel) const;

    Transcoder& transcoder_;
    const ProjectConfig& config_;
};

} // namespace mnemonic
