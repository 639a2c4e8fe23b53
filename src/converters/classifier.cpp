/**
 * Mnemonic - Entry Classifier Implementation
 */

#include "mnemonic/classifier.hpp"
#include "mnemonic/logging.hpp"
#include "mnemonic/path_utils.hpp"

#include <unordered_map>

namespace mnemonic {

namespace {

const std::unordered_map<std::string, AssetKind>& extension_table() {
    static const std::unordered_map<std::string, AssetKind> table = {
        // KAG scenario and TJS sources
        {".ks", AssetKind::Script}, {".tjs", AssetKind::Script}, {".txt", AssetKind::Script},
        {".csv", AssetKind::Script}, {".ini", AssetKind::Script}, {".func", AssetKind::Script},
        {".tlg", AssetKind::Image}, {".bmp", AssetKind::Image}, {".jpg", AssetKind::Image},
        {".jpeg", AssetKind::Image}, {".png", AssetKind::Image}, {".webp", AssetKind::Image},
        {".wav", AssetKind::Audio}, {".ogg", AssetKind::Audio}, {".mp3", AssetKind::Audio},
        {".opus", AssetKind::Audio}, {".m4a", AssetKind::Audio}, {".aac", AssetKind::Audio},
        {".flac", AssetKind::Audio},
        {".mpg", AssetKind::Video}, {".mpeg", AssetKind::Video}, {".wmv", AssetKind::Video},
        {".avi", AssetKind::Video}, {".mp4", AssetKind::Video}, {".webm", AssetKind::Video},
        {".ogv", AssetKind::Video},
    };
    return table;
}

constexpr const char* COPY_FORMAT = "copy";

} // namespace

const char* asset_kind_name(AssetKind kind) {
    switch (kind) {
        case AssetKind::Script: return "script";
        case AssetKind::Image:  return "image";
        case AssetKind::Audio:  return "audio";
        case AssetKind::Video:  return "video";
        default:                return "other";
    }
}

const char* route_name(Route route) {
    switch (route) {
        case Route::PassThrough: return "pass-through";
        case Route::Convert:     return "convert";
        case Route::Skip:        return "skip";
        default:                 return "unknown";
    }
}

AssetKind asset_kind_for_extension(const std::string& extension) {
    const auto& table = extension_table();
    auto it = table.find(extension);
    return it != table.end() ? it->second : AssetKind::Other;
}

EntryClassifier::EntryClassifier(const ProjectConfig& config)
    : audio_target_(config.convert_audio_to),
      video_target_(config.convert_video_to),
      exclude_(config.exclude),
      rules_(config.conversion_rules) {}

std::string EntryClassifier::default_target(AssetKind kind) const {
    switch (kind) {
        case AssetKind::Audio: return audio_target_;
        case AssetKind::Video: return video_target_;
        default:               return "";
    }
}

ClassifiedEntry EntryClassifier::classify(const Xp3Entry& entry) const {
    ClassifiedEntry result;
    result.entry = entry;
    result.output_name = entry.name;

    std::string ext = get_extension_lower(entry.name);
    result.kind = asset_kind_for_extension(ext);
    result.source_format = ext.empty() ? "" : ext.substr(1);

    for (const auto& pattern : exclude_) {
        if (glob_match(entry.name, pattern)) {
            result.route = Route::Skip;
            return result;
        }
    }

    std::string target = default_target(result.kind);
    for (const auto& rule : rules_) {
        if (glob_match(entry.name, rule.pattern)) {
            target = rule.format == COPY_FORMAT ? "" : rule.format;
            break;
        }
    }

    if (target.empty() || target == result.source_format) {
        result.route = Route::PassThrough;
        return result;
    }

    result.route = Route::Convert;
    result.target_format = target;
    result.output_name = replace_extension(entry.name, target);
    return result;
}

std::vector<ClassifiedEntry> EntryClassifier::classify_all(const std::vector<Xp3Entry>& entries) const {
    std::vector<ClassifiedEntry> classified;
    classified.reserve(entries.size());

    size_t convert = 0, skipped = 0;
    for (const auto& entry : entries) {
        classified.push_back(classify(entry));
        if (classified.back().route == Route::Convert) ++convert;
        if (classified.back().route == Route::Skip) ++skipped;
    }

    LOG_INFO("Classifier", entries.size() << " entries: " << convert << " to convert, "
             << skipped << " excluded, " << (entries.size() - convert - skipped) << " pass-through");
    return classified;
}

} // namespace mnemonic
