/**
 * Mnemonic - Project configuration (mnemonic.yml)
 */

#pragma once

#include "mnemonic/result.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace mnemonic {

constexpr const char* PROJECT_CONFIG_FILENAME = "mnemonic.yml";

/**
 * Asset declared in `extra_assets`; path is resolved against the
 * directory holding the config file.
 */
struct ExtraAsset {
    std::string name;
    std::filesystem::path path;
};

/**
 * `conversion_rules` item. format "copy" forces pass-through.
 */
struct ConversionRule {
    std::string pattern;
    std::string format;
};

struct RetryConfig {
    int max_attempts = 1;
    std::chrono::milliseconds backoff_base{1000};
    double backoff_multiplier = 2.0;
};

/**
 * Immutable build options. Defaults apply to every key the document omits.
 */
struct ProjectConfig {
    std::string convert_audio_to = "ogg";
    std::string convert_video_to = "mp4";
    std::vector<ExtraAsset> extra_assets;    // Document order
    unsigned int worker_count = 0;           // 0 = hardware concurrency

    std::vector<std::string> exclude;
    std::vector<ConversionRule> conversion_rules;
    std::chrono::seconds transcode_timeout{300};
    RetryConfig retry;

    // Packaging profile, passed through to the manifest
    std::string package_name;
    std::string app_name;
    int version_code = 1;
    std::string version_name = "1.0.0";

    std::filesystem::path source_path;       // Empty when defaults were used

    /**
     * Worker count with 0 resolved to the number of processing units.
     */
    unsigned int effective_workers() const;
};

ProjectConfig default_project_config();

/**
 * Load and validate a config document. A missing file, invalid YAML, a
 * non-mapping root or a value of the wrong type is a ConfigError.
 */
Result<ProjectConfig> load_project_config(const std::filesystem::path& path);

/**
 * Parse a config document from memory. `base_dir` anchors relative
 * extra asset paths.
 */
Result<ProjectConfig> parse_project_config(const std::string& text,
                                           const std::filesystem::path& base_dir);

/**
 * Explicit path if given (must exist), else mnemonic.yml beside the
 * archive, else defaults.
 */
Result<ProjectConfig> resolve_project_config(const std::filesystem::path& explicit_path,
                                             const std::filesystem::path& archive_path);

} // namespace mnemonic
