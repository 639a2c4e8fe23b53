/**
 * Mnemonic - Pipeline Orchestrator
 *
 * Idle -> Opening -> Classifying -> Converting -> Assembling -> Done | Failed
 *
 * Stages run one after another on the calling thread; only conversion fans
 * out to workers. The first failing stage ends the run.
 */

#pragma once

#include "mnemonic/config.hpp"
#include "mnemonic/manifest.hpp"
#include "mnemonic/result.hpp"
#include "mnemonic/transcoder.hpp"
#include "mnemonic/types.hpp"

#include <filesystem>
#include <functional>
#include <optional>

namespace mnemonic {

enum class PipelineState {
    Idle,
    Opening,
    Classifying,
    Converting,
    Assembling,
    Done,
    Failed
};

const char* pipeline_state_name(PipelineState state);

struct PipelineOptions {
    std::filesystem::path archive_path;
    std::filesystem::path config_path;          // Empty: mnemonic.yml beside the archive, if any
    std::optional<unsigned int> worker_count;   // Overrides the config value
};

class Pipeline {
public:
    using StateObserver = std::function<void(PipelineState)>;

    Pipeline(PipelineOptions options, Transcoder& transcoder);

    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }
    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    /**
     * Run every stage. On failure the Error carries the code and every
     * affected entry name; no partial manifest is returned.
     */
    Result<BuildManifest> run(const CancellationToken& cancel);

    PipelineState state() const { return state_; }
    const Error& failure() const { return failure_; }

private:
    void transition(PipelineState next);
    Error fail(Error error);

    PipelineOptions options_;
    Transcoder& transcoder_;
    StateObserver observer_;
    ProgressCallback progress_;
    PipelineState state_ = PipelineState::Idle;
    Error failure_;
};

} // namespace mnemonic
