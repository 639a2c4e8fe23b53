/**
 * Mnemonic - Build Manifest
 *
 * The ordered asset list handed to the packaging stage: archive assets in
 * index order, then the configured extra assets in document order.
 */

#pragma once

#include "mnemonic/config.hpp"
#include "mnemonic/result.hpp"
#include "mnemonic/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mnemonic {

constexpr const char* MANIFEST_FILENAME = "manifest.json";
constexpr int MANIFEST_VERSION = 1;

enum class AssetOrigin {
    Archive,     // Passed through unchanged
    Converted,   // Produced by the transcoder
    Extra        // Declared in extra_assets
};

const char* asset_origin_name(AssetOrigin origin);

struct ManifestAsset {
    std::string name;
    std::vector<uint8_t> data;
    std::string format;
    AssetOrigin origin = AssetOrigin::Archive;
    std::string source;   // Entry name, or the extra asset's file path
};

/**
 * An extra asset that replaced an archive asset of the same name.
 */
struct AssetOverride {
    std::string name;
    std::string replaced_entry;
    std::filesystem::path extra_path;
};

/**
 * A later archive entry whose output name was already taken.
 */
struct ShadowedAsset {
    std::string name;
    std::string entry;
    std::string kept_entry;
};

struct BuildManifest {
    std::vector<ManifestAsset> assets;
    ProjectConfig config;
    std::vector<AssetOverride> overrides;
    std::vector<ShadowedAsset> shadowed;
    std::vector<std::string> skipped;   // Entries excluded by configuration

    const ManifestAsset* find(const std::string& name) const;
    std::vector<std::string> names() const;
    uint64_t total_size() const;
};

class ManifestAssembler {
public:
    /**
     * `results` must be indexed like `classified`. Every non-skipped entry
     * needs a result (MissingConversion otherwise) and every result must be
     * Converted (ConversionFailed otherwise). Unreadable extra assets are a
     * ConfigError.
     */
    static Result<BuildManifest> assemble(const std::vector<ClassifiedEntry>& classified,
                                          std::vector<std::optional<ConversionResult>> results,
                                          const ProjectConfig& config);
};

/**
 * Manifest metadata (no asset bytes) as written to manifest.json.
 */
nlohmann::json manifest_to_json(const BuildManifest& manifest);

/**
 * Stage every asset under `staging_dir/assets/` and write manifest.json.
 */
Result<void> write_manifest(const BuildManifest& manifest, const std::filesystem::path& staging_dir);

} // namespace mnemonic
