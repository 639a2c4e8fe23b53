/**
 * Mnemonic - Project configuration loading
 */

#include "mnemonic/config.hpp"
#include "mnemonic/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <thread>

namespace mnemonic {

namespace {

constexpr long long MAX_WORKERS = 256;
constexpr long long MAX_TIMEOUT_SECONDS = 24 * 60 * 60;
constexpr long long MAX_ATTEMPTS = 100;
constexpr long long MAX_BACKOFF_MS = 60 * 60 * 1000;
// Google Play's upper limit for versionCode
constexpr long long MAX_VERSION_CODE = 2100000000;

const std::set<std::string> KNOWN_KEYS = {
    "convert_audio_to", "convert_video_to", "extra_assets", "worker_count",
    "exclude", "conversion_rules", "timeouts", "retry",
    "package_name", "app_name", "version_code", "version_name"
};

std::string where(const YAML::Node& node) {
    const auto mark = node.Mark();
    if (mark.is_null()) return "";
    return " (line " + std::to_string(mark.line + 1) + ")";
}

/**
 * Formats are file extensions: lowercase alphanumerics, leading dot dropped.
 */
Result<std::string> read_format(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        return Error::config_error("'" + key + "' must be a format name" + where(node));
    }
    std::string value = node.as<std::string>();
    if (!value.empty() && value.front() == '.') {
        value.erase(0, 1);
    }
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value.empty() || value.size() > 16 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isalnum(c); })) {
        return Error::config_error("'" + key + "' is not a valid format: '" + node.as<std::string>() + "'" +
                                   where(node));
    }
    return value;
}

Result<std::string> read_string(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        return Error::config_error("'" + key + "' must be a string" + where(node));
    }
    return node.as<std::string>();
}

Result<long long> read_integer(const YAML::Node& node, const std::string& key,
                               long long min_value, long long max_value) {
    if (!node.IsScalar()) {
        return Error::config_error("'" + key + "' must be an integer" + where(node));
    }
    long long value = 0;
    try {
        value = node.as<long long>();
    } catch (const YAML::BadConversion&) {
        return Error::config_error("'" + key + "' must be an integer, got '" + node.as<std::string>() + "'" +
                                   where(node));
    }
    if (value < min_value) {
        return Error::config_error("'" + key + "' must be at least " + std::to_string(min_value) + where(node));
    }
    if (value > max_value) {
        return Error::config_error("'" + key + "' must be at most " + std::to_string(max_value) + where(node));
    }
    return value;
}

Result<std::vector<std::string>> read_string_list(const YAML::Node& node, const std::string& key) {
    if (node.IsNull()) {
        return std::vector<std::string>{};
    }
    if (!node.IsSequence()) {
        return Error::config_error("'" + key + "' must be a list" + where(node));
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        MNEMONIC_TRY_ASSIGN(value, read_string(item, key));
        values.push_back(std::move(value));
    }
    return values;
}

Result<std::vector<ExtraAsset>> read_extra_assets(const YAML::Node& node, const std::filesystem::path& base_dir) {
    std::vector<ExtraAsset> assets;
    if (node.IsNull()) {
        return assets;
    }
    if (!node.IsMap()) {
        return Error::config_error("'extra_assets' must be a mapping of asset name to path" + where(node));
    }

    std::set<std::string> seen;
    for (const auto& kv : node) {
        MNEMONIC_TRY_ASSIGN(name, read_string(kv.first, "extra_assets"));
        MNEMONIC_TRY_ASSIGN(path, read_string(kv.second, "extra_assets." + name));
        if (name.empty() || path.empty()) {
            return Error::config_error("'extra_assets' entries need a name and a path" + where(kv.first));
        }
        if (!seen.insert(name).second) {
            return Error::config_error("'extra_assets' declares '" + name + "' twice" + where(kv.first));
        }

        std::filesystem::path resolved(path);
        if (resolved.is_relative()) {
            resolved = base_dir / resolved;
        }
        assets.push_back(ExtraAsset{name, resolved.lexically_normal()});
    }
    return assets;
}

Result<std::vector<ConversionRule>> read_conversion_rules(const YAML::Node& node) {
    std::vector<ConversionRule> rules;
    if (node.IsNull()) {
        return rules;
    }
    if (!node.IsSequence()) {
        return Error::config_error("'conversion_rules' must be a list" + where(node));
    }
    for (const auto& item : node) {
        if (!item.IsMap() || !item["pattern"]) {
            return Error::config_error("'conversion_rules' items need 'pattern' and 'format'" + where(item));
        }
        YAML::Node format = item["format"] ? item["format"] : item["converter"];
        if (!format) {
            return Error::config_error("'conversion_rules' items need 'pattern' and 'format'" + where(item));
        }
        ConversionRule rule;
        MNEMONIC_TRY_ASSIGN(pattern, read_string(item["pattern"], "conversion_rules.pattern"));
        MNEMONIC_TRY_ASSIGN(target, read_format(format, "conversion_rules.format"));
        rule.pattern = std::move(pattern);
        rule.format = std::move(target);
        rules.push_back(std::move(rule));
    }
    return rules;
}

Result<ProjectConfig> build_config(const YAML::Node& root, const std::filesystem::path& base_dir) {
    ProjectConfig config = default_project_config();

    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return Error::config_error("Config document must be a YAML mapping" + where(root));
    }

    for (const auto& kv : root) {
        auto key = kv.first.as<std::string>();
        if (KNOWN_KEYS.count(key) == 0) {
            LOG_WARNING("Config", "Ignoring unknown key '" << key << "'" << where(kv.first));
        }
    }

    if (auto node = root["convert_audio_to"]) {
        MNEMONIC_TRY_ASSIGN(value, read_format(node, "convert_audio_to"));
        config.convert_audio_to = std::move(value);
    }
    if (auto node = root["convert_video_to"]) {
        MNEMONIC_TRY_ASSIGN(value, read_format(node, "convert_video_to"));
        config.convert_video_to = std::move(value);
    }
    if (auto node = root["extra_assets"]) {
        MNEMONIC_TRY_ASSIGN(value, read_extra_assets(node, base_dir));
        config.extra_assets = std::move(value);
    }
    if (auto node = root["worker_count"]) {
        MNEMONIC_TRY_ASSIGN(value, read_integer(node, "worker_count", 0, MAX_WORKERS));
        config.worker_count = static_cast<unsigned int>(value);
    }
    if (auto node = root["exclude"]) {
        MNEMONIC_TRY_ASSIGN(value, read_string_list(node, "exclude"));
        config.exclude = std::move(value);
    }
    if (auto node = root["conversion_rules"]) {
        MNEMONIC_TRY_ASSIGN(value, read_conversion_rules(node));
        config.conversion_rules = std::move(value);
    }
    if (auto node = root["timeouts"]) {
        if (!node.IsMap()) {
            return Error::config_error("'timeouts' must be a mapping" + where(node));
        }
        if (auto ffmpeg = node["ffmpeg"]) {
            MNEMONIC_TRY_ASSIGN(value, read_integer(ffmpeg, "timeouts.ffmpeg", 1, MAX_TIMEOUT_SECONDS));
            config.transcode_timeout = std::chrono::seconds(value);
        }
    }
    if (auto node = root["retry"]) {
        if (!node.IsMap()) {
            return Error::config_error("'retry' must be a mapping" + where(node));
        }
        if (auto attempts = node["max_attempts"]) {
            MNEMONIC_TRY_ASSIGN(value, read_integer(attempts, "retry.max_attempts", 1, MAX_ATTEMPTS));
            config.retry.max_attempts = static_cast<int>(value);
        }
        if (auto backoff = node["backoff_ms"]) {
            MNEMONIC_TRY_ASSIGN(value, read_integer(backoff, "retry.backoff_ms", 0, MAX_BACKOFF_MS));
            config.retry.backoff_base = std::chrono::milliseconds(value);
        }
    }
    if (auto node = root["package_name"]) {
        MNEMONIC_TRY_ASSIGN(value, read_string(node, "package_name"));
        config.package_name = std::move(value);
    }
    if (auto node = root["app_name"]) {
        MNEMONIC_TRY_ASSIGN(value, read_string(node, "app_name"));
        config.app_name = std::move(value);
    }
    if (auto node = root["version_code"]) {
        MNEMONIC_TRY_ASSIGN(value, read_integer(node, "version_code", 1, MAX_VERSION_CODE));
        config.version_code = static_cast<int>(value);
    }
    if (auto node = root["version_name"]) {
        MNEMONIC_TRY_ASSIGN(value, read_string(node, "version_name"));
        config.version_name = std::move(value);
    }

    return config;
}

} // namespace

unsigned int ProjectConfig::effective_workers() const {
    if (worker_count > 0) {
        return worker_count;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

ProjectConfig default_project_config() {
    return ProjectConfig{};
}

Result<ProjectConfig> parse_project_config(const std::string& text, const std::filesystem::path& base_dir) {
    try {
        YAML::Node root = YAML::Load(text);
        return build_config(root, base_dir);
    } catch (const YAML::ParserException& e) {
        return Error::config_error(std::string("YAML parse error: ") + e.what());
    } catch (const YAML::Exception& e) {
        return Error::config_error(std::string("Invalid config document: ") + e.what());
    }
}

Result<ProjectConfig> load_project_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::config_error("Config file not found", path.string());
    }

    std::ifstream file(path);
    if (!file) {
        return Error::config_error("Failed to open config file", path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto base_dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    auto config = parse_project_config(buffer.str(), base_dir);
    if (!config) {
        Error err = config.error();
        err.context = path.string();
        LOG_ERROR("Config", err.full_message());
        return err;
    }

    config.value().source_path = path;
    LOG_INFO("Config", "Loaded " << path.filename().string()
             << " (audio->" << config.value().convert_audio_to
             << ", video->" << config.value().convert_video_to
             << ", " << config.value().extra_assets.size() << " extra assets)");
    return config;
}

Result<ProjectConfig> resolve_project_config(const std::filesystem::path& explicit_path,
                                             const std::filesystem::path& archive_path) {
    if (!explicit_path.empty()) {
        return load_project_config(explicit_path);
    }

    auto candidate = archive_path.parent_path() / PROJECT_CONFIG_FILENAME;
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
        return load_project_config(candidate);
    }

    LOG_DEBUG("Config", "No " << PROJECT_CONFIG_FILENAME << " beside " << archive_path.string()
              << ", using defaults");
    return default_project_config();
}

} // namespace mnemonic
