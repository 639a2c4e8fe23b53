/**
 * Mnemonic - Build Manifest assembly and staging
 */

#include "mnemonic/manifest.hpp"
#include "mnemonic/compression.hpp"
#include "mnemonic/files.hpp"
#include "mnemonic/logging.hpp"
#include "mnemonic/path_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <unordered_map>

namespace mnemonic {

namespace {

std::string format_of(const std::string& name, const std::filesystem::path& fallback) {
    std::string ext = get_extension_lower(name);
    if (ext.empty()) {
        ext = get_extension_lower(fallback.filename().string());
    }
    return ext.empty() ? "" : ext.substr(1);
}

} // namespace

const char* asset_origin_name(AssetOrigin origin) {
    switch (origin) {
        case AssetOrigin::Archive:   return "archive";
        case AssetOrigin::Converted: return "converted";
        case AssetOrigin::Extra:     return "extra";
        default:                     return "unknown";
    }
}

const ManifestAsset* BuildManifest::find(const std::string& name) const {
    for (const auto& asset : assets) {
        if (asset.name == name) return &asset;
    }
    return nullptr;
}

std::vector<std::string> BuildManifest::names() const {
    std::vector<std::string> result;
    result.reserve(assets.size());
    for (const auto& asset : assets) {
        result.push_back(asset.name);
    }
    return result;
}

uint64_t BuildManifest::total_size() const {
    uint64_t total = 0;
    for (const auto& asset : assets) {
        total += asset.data.size();
    }
    return total;
}

Result<BuildManifest> ManifestAssembler::assemble(const std::vector<ClassifiedEntry>& classified,
                                                  std::vector<std::optional<ConversionResult>> results,
                                                  const ProjectConfig& config) {
    if (results.size() != classified.size()) {
        return Error::invalid_argument("Result count " + std::to_string(results.size()) +
                                       " does not match entry count " + std::to_string(classified.size()));
    }

    std::vector<std::string> missing;
    std::vector<std::string> failed;
    for (size_t i = 0; i < classified.size(); ++i) {
        if (classified[i].route == Route::Skip) continue;
        if (!results[i]) {
            missing.push_back(classified[i].entry.name);
        } else if (!results[i]->ok()) {
            failed.push_back(classified[i].entry.name);
        }
    }
    if (!missing.empty()) {
        return Error::missing_conversion(std::move(missing));
    }
    if (!failed.empty()) {
        return Error::conversion_failed(std::move(failed));
    }

    BuildManifest manifest;
    manifest.config = config;

    // Archive section, first output name in index order wins
    std::unordered_map<std::string, std::string> owner;
    std::vector<ManifestAsset> archive_assets;
    for (size_t i = 0; i < classified.size(); ++i) {
        const auto& entry = classified[i];
        if (entry.route == Route::Skip) {
            manifest.skipped.push_back(entry.entry.name);
            continue;
        }

        auto [it, inserted] = owner.emplace(entry.output_name, entry.entry.name);
        if (!inserted) {
            LOG_WARNING("Manifest", "'" << entry.entry.name << "' shadowed by '" << it->second
                        << "' (both produce " << entry.output_name << ")");
            manifest.shadowed.push_back({entry.output_name, entry.entry.name, it->second});
            continue;
        }

        ManifestAsset asset;
        asset.name = entry.output_name;
        asset.data = std::move(results[i]->data);
        asset.format = results[i]->format;
        asset.origin = entry.route == Route::Convert ? AssetOrigin::Converted : AssetOrigin::Archive;
        asset.source = entry.entry.name;
        archive_assets.push_back(std::move(asset));
    }

    // Extras section, document order
    std::vector<ManifestAsset> extra_assets;
    for (const auto& extra : config.extra_assets) {
        auto bytes = read_file(extra.path);
        if (!bytes) {
            return Error::config_error("Cannot read extra asset '" + extra.name + "': " + bytes.error().message,
                                       extra.path.string());
        }

        auto owned = owner.find(extra.name);
        if (owned != owner.end()) {
            LOG_INFO("Manifest", "Extra asset '" << extra.name << "' overrides archive entry '"
                     << owned->second << "'");
            manifest.overrides.push_back({extra.name, owned->second, extra.path});
        }

        ManifestAsset asset;
        asset.name = extra.name;
        asset.data = std::move(bytes.value());
        asset.format = format_of(extra.name, extra.path);
        asset.origin = AssetOrigin::Extra;
        asset.source = extra.path.string();
        extra_assets.push_back(std::move(asset));
    }

    for (auto& asset : archive_assets) {
        bool overridden = std::any_of(manifest.overrides.begin(), manifest.overrides.end(),
            [&](const AssetOverride& o) { return o.name == asset.name; });
        if (!overridden) {
            manifest.assets.push_back(std::move(asset));
        }
    }
    for (auto& asset : extra_assets) {
        manifest.assets.push_back(std::move(asset));
    }

    LOG_INFO("Manifest", manifest.assets.size() << " assets (" << format_file_size(manifest.total_size())
             << "), " << manifest.overrides.size() << " overrides, " << manifest.shadowed.size() << " shadowed, "
             << manifest.skipped.size() << " excluded");
    return manifest;
}

nlohmann::json manifest_to_json(const BuildManifest& manifest) {
    nlohmann::json j;
    j["version"] = MANIFEST_VERSION;

    const auto& config = manifest.config;
    j["package"] = {
        {"package_name", config.package_name},
        {"app_name", config.app_name},
        {"version_code", config.version_code},
        {"version_name", config.version_name}
    };

    nlohmann::json assets = nlohmann::json::array();
    for (const auto& asset : manifest.assets) {
        assets.push_back({
            {"name", asset.name},
            {"format", asset.format},
            {"size", asset.data.size()},
            {"adler32", adler32_checksum(asset.data)},
            {"origin", asset_origin_name(asset.origin)},
            {"source", asset.source}
        });
    }
    j["assets"] = std::move(assets);

    nlohmann::json overrides = nlohmann::json::array();
    for (const auto& o : manifest.overrides) {
        overrides.push_back({
            {"name", o.name},
            {"replaced_entry", o.replaced_entry},
            {"path", o.extra_path.string()}
        });
    }
    j["overrides"] = std::move(overrides);

    nlohmann::json shadowed = nlohmann::json::array();
    for (const auto& s : manifest.shadowed) {
        shadowed.push_back({{"name", s.name}, {"entry", s.entry}, {"kept_entry", s.kept_entry}});
    }
    j["shadowed"] = std::move(shadowed);
    j["skipped"] = manifest.skipped;

    return j;
}

Result<void> write_manifest(const BuildManifest& manifest, const std::filesystem::path& staging_dir) {
    const auto asset_dir = staging_dir / "assets";

    std::error_code ec;
    std::filesystem::create_directories(asset_dir, ec);
    if (ec) {
        return Error::io_error("Failed to create staging directory: " + ec.message(), asset_dir.string());
    }

    for (const auto& asset : manifest.assets) {
        auto relative = contained_relative_path(asset.name);
        if (relative.empty()) {
            return Error::invalid_argument("Asset name escapes the staging directory: " + asset.name);
        }
        if (!write_file(asset_dir / relative, asset.data)) {
            return Error::io_error("Failed to stage asset", (asset_dir / relative).string());
        }
    }

    const auto manifest_path = staging_dir / MANIFEST_FILENAME;
    std::string text;
    try {
        text = manifest_to_json(manifest).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        return Error::io_error(std::string("Failed to serialize manifest: ") + e.what(), manifest_path.string());
    }

    std::ofstream file(manifest_path, std::ios::out | std::ios::trunc);
    if (!file) {
        return Error::io_error("Failed to open manifest for writing", manifest_path.string());
    }
    file << text << '\n';
    if (!file) {
        return Error::io_error("Failed to write manifest", manifest_path.string());
    }

    LOG_INFO("Manifest", "Staged " << manifest.assets.size() << " assets to " << staging_dir.string());
    return Result<void>::success();
}

} // namespace mnemonic
