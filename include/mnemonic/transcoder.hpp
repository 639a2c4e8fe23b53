/**
 * Mnemonic - Transcoder boundary
 *
 * The media transcoder runs out of process: (input file, target format,
 * timeout) in, (output file, exit status) out.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace mnemonic {

/**
 * Cooperative cancellation flag shared between the caller and workers.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

struct TranscodeRequest {
    std::filesystem::path input;
    std::filesystem::path output;
    std::string target_format;
    std::chrono::milliseconds timeout{300000};
    const CancellationToken* cancel = nullptr;
};

enum class TranscodeStatus {
    Success,
    NonZeroExit,
    Signaled,
    Timeout,
    Cancelled,
    SpawnFailed
};

const char* transcode_status_name(TranscodeStatus status);

struct TranscodeResponse {
    TranscodeStatus status = TranscodeStatus::SpawnFailed;
    int exit_code = -1;
    std::string diagnostics;   // Tail of the tool's stdout/stderr

    bool ok() const { return status == TranscodeStatus::Success; }
};

/**
 * Implementations must be callable from several worker threads at once.
 */
class Transcoder {
public:
    virtual ~Transcoder() = default;

    virtual TranscodeResponse transcode(const TranscodeRequest& request) = 0;
    virtual bool is_available() const = 0;
    virtual std::string name() const = 0;
};

/**
 * Runs an external program per request. Arguments may contain the
 * placeholders {input}, {output} and {format}.
 */
class FfmpegTranscoder : public Transcoder {
public:
    static std::vector<std::string> default_arguments();

    explicit FfmpegTranscoder(std::string program = "ffmpeg",
                              std::vector<std::string> arguments = default_arguments());

    TranscodeResponse transcode(const TranscodeRequest& request) override;
    bool is_available() const override;
    std::string name() const override { return program_; }

    const std::vector<std::string>& arguments() const { return arguments_; }

private:
    std::vector<std::string> expand_arguments(const TranscodeRequest& request) const;

    std::string program_;
    std::vector<std::string> arguments_;
};

} // namespace mnemonic
