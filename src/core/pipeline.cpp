/**
 * Mnemonic - Pipeline Orchestrator
 */

#include "mnemonic/pipeline.hpp"
#include "mnemonic/asset_converter.hpp"
#include "mnemonic/classifier.hpp"
#include "mnemonic/logging.hpp"
#include "mnemonic/xp3_reader.hpp"

#include <string>
#include <unordered_set>

namespace mnemonic {

const char* pipeline_state_name(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:        return "Idle";
        case PipelineState::Opening:     return "Opening";
        case PipelineState::Classifying: return "Classifying";
        case PipelineState::Converting:  return "Converting";
        case PipelineState::Assembling:  return "Assembling";
        case PipelineState::Done:        return "Done";
        case PipelineState::Failed:      return "Failed";
        default:                         return "Unknown";
    }
}

Pipeline::Pipeline(PipelineOptions options, Transcoder& transcoder)
    : options_(std::move(options)), transcoder_(transcoder) {}

void Pipeline::transition(PipelineState next) {
    LOG_DEBUG("Pipeline", pipeline_state_name(state_) << " -> " << pipeline_state_name(next));
    state_ = next;
    if (observer_) {
        observer_(next);
    }
}

Error Pipeline::fail(Error error) {
    if (error.context.empty()) {
        error.context = options_.archive_path.string();
    }
    LOG_ERROR("Pipeline", "Failed in " << pipeline_state_name(state_) << ": "
              << error_code_name(error.code) << ": " << error.full_message());
    failure_ = error;
    transition(PipelineState::Failed);
    return error;
}

Result<BuildManifest> Pipeline::run(const CancellationToken& cancel) {
    failure_ = Error();
    state_ = PipelineState::Idle;

    // Config is validated before the archive is touched
    auto config_result = resolve_project_config(options_.config_path, options_.archive_path);
    if (!config_result) {
        return fail(config_result.error());
    }
    ProjectConfig config = std::move(config_result.value());
    if (options_.worker_count) {
        config.worker_count = *options_.worker_count;
    }

    if (cancel.is_cancelled()) return fail(Error::cancelled());

    transition(PipelineState::Opening);
    auto opened = Xp3Archive::open(options_.archive_path);
    if (!opened) {
        return fail(opened.error());
    }
    std::unique_ptr<Xp3Archive> archive = std::move(opened.value());
    if (archive->is_encrypted()) {
        return fail(Error::encrypted_archive(archive->encryption().details, options_.archive_path.string()));
    }

    if (cancel.is_cancelled()) return fail(Error::cancelled());

    transition(PipelineState::Classifying);
    auto entries = archive->list_entries();
    if (!entries) {
        return fail(entries.error());
    }
    EntryClassifier classifier(config);
    std::vector<ClassifiedEntry> classified = classifier.classify_all(entries.value());

    if (cancel.is_cancelled()) return fail(Error::cancelled());

    transition(PipelineState::Converting);
    AssetConverter converter(transcoder_, config);
    ConversionBatch batch = converter.convert_all(*archive, classified, cancel, progress_);

    if (batch.cancelled) {
        return fail(Error::cancelled());
    }
    if (!batch.extraction_failures.empty()) {
        // First error keeps its code and message; the names cover every failed entry in index order
        Error error = batch.extraction_failures.front().error;
        std::unordered_set<std::string> failed(batch.failed_entries.begin(), batch.failed_entries.end());
        for (const auto& failure : batch.extraction_failures) {
            failed.insert(failure.name);
        }
        if (!batch.failed_entries.empty()) {
            error.message += " (" + std::to_string(batch.extraction_failures.size()) +
                             " unreadable, " + std::to_string(batch.failed_entries.size()) +
                             " conversion(s) failed)";
        }
        error.entries.clear();
        for (const auto& item : classified) {
            if (failed.count(item.entry.name)) {
                error.entries.push_back(item.entry.name);
            }
        }
        return fail(std::move(error));
    }
    if (!batch.failed_entries.empty()) {
        return fail(Error::conversion_failed(batch.failed_entries));
    }

    transition(PipelineState::Assembling);
    auto manifest = ManifestAssembler::assemble(classified, std::move(batch.results), config);
    if (!manifest) {
        return fail(manifest.error());
    }

    transition(PipelineState::Done);
    LOG_INFO("Pipeline", "Build manifest ready: " << manifest.value().assets.size() << " assets from "
             << options_.archive_path.filename().string());
    return manifest;
}

} // namespace mnemonic
