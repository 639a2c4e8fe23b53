/**
 * Mnemonic - Entry Classifier
 *
 * Decides per archive entry whether it passes through, is transcoded, or is
 * excluded. Pure function of the entry name and the project config.
 */

#pragma once

#include "mnemonic/config.hpp"
#include "mnemonic/types.hpp"
#include <string>
#include <vector>

namespace mnemonic {

/**
 * Asset kind from a lowercase extension with the dot (".ogg").
 */
AssetKind asset_kind_for_extension(const std::string& extension);

class EntryClassifier {
public:
    explicit EntryClassifier(const ProjectConfig& config);

    /**
     * Total and deterministic: every entry gets exactly one route.
     * Precedence: exclude patterns, then conversion_rules (first match),
     * then the audio/video defaults.
     */
    ClassifiedEntry classify(const Xp3Entry& entry) const;

    std::vector<ClassifiedEntry> classify_all(const std::vector<Xp3Entry>& entries) const;

private:
    std::string default_target(AssetKind kind) const;

    std::string audio_target_;
    std::string video_target_;
    std::vector<std::string> exclude_;
    std::vector<ConversionRule> rules_;
};

} // namespace mnemonic
