/**
 * Mnemonic - Asset Converter
 */

#include "mnemonic/asset_converter.hpp"
#include "mnemonic/files.hpp"
#include "mnemonic/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <future>
#include <mutex>
#include <thread>

namespace mnemonic {

namespace {

constexpr auto BACKOFF_SLICE = std::chrono::milliseconds(20);

FailureReason reason_for(TranscodeStatus status) {
    switch (status) {
        case TranscodeStatus::NonZeroExit: return FailureReason::NonZeroExit;
        case TranscodeStatus::Signaled:    return FailureReason::NonZeroExit;
        case TranscodeStatus::Timeout:     return FailureReason::Timeout;
        case TranscodeStatus::Cancelled:   return FailureReason::Cancelled;
        case TranscodeStatus::SpawnFailed: return FailureReason::SpawnFailed;
        default:                           return FailureReason::None;
    }
}

std::string scratch_name(const std::string& stem, const std::string& format) {
    return format.empty() ? stem : stem + "." + format;
}

} // namespace

const char* failure_reason_name(FailureReason reason) {
    switch (reason) {
        case FailureReason::None:             return "none";
        case FailureReason::NonZeroExit:      return "non-zero exit";
        case FailureReason::Timeout:          return "timeout";
        case FailureReason::OutputUnreadable: return "output unreadable";
        case FailureReason::SpawnFailed:      return "spawn failed";
        case FailureReason::ExtractionFailed: return "extraction failed";
        case FailureReason::Cancelled:        return "cancelled";
        default:                              return "unknown";
    }
}

size_t ConversionBatch::converted_count() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](const std::optional<ConversionResult>& r) { return r && r->ok(); }));
}

AssetConverter::AssetConverter(Transcoder& transcoder, const ProjectConfig& config)
    : transcoder_(transcoder), config_(config) {}

ConversionResult AssetConverter::convert(const ClassifiedEntry& entry, std::vector<uint8_t> raw,
                                         const CancellationToken& cancel) const {
    if (cancel.is_cancelled()) {
        return ConversionResult::failed(FailureReason::Cancelled, "cancelled before conversion");
    }

    switch (entry.route) {
        case Route::PassThrough:
            return ConversionResult::converted(std::move(raw), entry.source_format);
        case Route::Convert:
            return transcode(entry, raw, cancel);
        case Route::Skip:
        default:
            return ConversionResult::failed(FailureReason::None, "entry is excluded from the build");
    }
}

ConversionResult AssetConverter::transcode(const ClassifiedEntry& entry, const std::vector<uint8_t>& raw,
                                           const CancellationToken& cancel) const {
    TempDirectory scratch("mnemonic-convert-");
    if (!scratch.valid()) {
        return ConversionResult::failed(FailureReason::SpawnFailed, "cannot create scratch directory");
    }

    TranscodeRequest request;
    request.input = scratch.path() / scratch_name("input", entry.source_format);
    request.output = scratch.path() / scratch_name("output", entry.target_format);
    request.target_format = entry.target_format;
    request.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.transcode_timeout);
    request.cancel = &cancel;

    if (!write_file(request.input, raw)) {
        return ConversionResult::failed(FailureReason::SpawnFailed,
                                        "cannot stage input " + request.input.string());
    }

    const int max_attempts = std::max(1, config_.retry.max_attempts);
    ConversionResult result = ConversionResult::failed(FailureReason::None, "not attempted");

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        std::error_code ec;
        std::filesystem::remove(request.output, ec);

        TranscodeResponse response = transcoder_.transcode(request);

        if (response.ok()) {
            auto bytes = read_file(request.output);
            if (bytes && !bytes.value().empty()) {
                result = ConversionResult::converted(std::move(bytes.value()), entry.target_format);
                result.attempts = attempt;
                LOG_DEBUG("Converter", entry.entry.name << " -> " << entry.output_name
                          << " (" << format_file_size(result.data.size()) << ")");
                return result;
            }
            result = ConversionResult::failed(FailureReason::OutputUnreadable,
                bytes ? "transcoder produced an empty file" : bytes.error().full_message());
        } else {
            std::string message = transcode_status_name(response.status);
            if (response.status == TranscodeStatus::NonZeroExit) {
                message += " (" + std::to_string(response.exit_code) + ")";
            }
            if (!response.diagnostics.empty()) {
                message += ": " + response.diagnostics;
            }
            result = ConversionResult::failed(reason_for(response.status), message);
        }
        result.attempts = attempt;

        if (result.reason == FailureReason::Timeout || result.reason == FailureReason::Cancelled) {
            break;
        }
        if (attempt < max_attempts) {
            LOG_WARNING("Converter", entry.entry.name << ": attempt " << attempt << "/" << max_attempts
                        << " failed (" << failure_reason_name(result.reason) << "), retrying");
            if (!wait_backoff(attempt, cancel)) {
                result = ConversionResult::failed(FailureReason::Cancelled, "cancelled during retry backoff");
                result.attempts = attempt;
                break;
            }
        }
    }

    LOG_ERROR("Converter", entry.entry.name << " -> " << entry.target_format << " failed: "
              << failure_reason_name(result.reason));
    return result;
}

bool AssetConverter::wait_backoff(int attempt, const CancellationToken& cancel) const {
    const double scale = std::pow(config_.retry.backoff_multiplier, attempt - 1);
    const auto delay = std::chrono::milliseconds(
        static_cast<long long>(static_cast<double>(config_.retry.backoff_base.count()) * scale));
    const auto deadline = std::chrono::steady_clock::now() + delay;

    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel.is_cancelled()) return false;
        std::this_thread::sleep_for(BACKOFF_SLICE);
    }
    return !cancel.is_cancelled();
}

ConversionBatch AssetConverter::convert_all(const Xp3Archive& archive, const std::vector<ClassifiedEntry>& entries,
                                            const CancellationToken& cancel, ProgressCallback progress) const {
    ConversionBatch batch;
    batch.results.resize(entries.size());

    const size_t work = static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
        [](const ClassifiedEntry& e) { return e.route != Route::Skip; }));
    if (work == 0) {
        batch.cancelled = cancel.is_cancelled();
        return batch;
    }

    const unsigned int thread_count = static_cast<unsigned int>(
        std::min<size_t>(config_.effective_workers(), work));

    LOG_INFO("Converter", "Converting " << work << " entries on " << thread_count << " workers");
    auto start_time = std::chrono::steady_clock::now();

    std::atomic<size_t> next{0};
    std::atomic<size_t> completed{0};
    std::mutex results_mutex;
    std::vector<std::future<void>> futures;

    for (unsigned int t = 0; t < thread_count; t++) {
        futures.push_back(std::async(std::launch::async, [&]() {
            for (;;) {
                if (cancel.is_cancelled()) break;

                size_t i = next.fetch_add(1);
                if (i >= entries.size()) break;

                const auto& entry = entries[i];
                if (entry.route == Route::Skip) continue;

                auto raw = archive.extract(entry.entry);
                if (!raw) {
                    std::lock_guard<std::mutex> lock(results_mutex);
                    batch.extraction_failures.push_back({i, entry.entry.name, raw.error()});
                    continue;
                }

                ConversionResult result = convert(entry, std::move(raw.value()), cancel);

                {
                    std::lock_guard<std::mutex> lock(results_mutex);
                    batch.results[i] = std::move(result);
                }
                size_t done = ++completed;
                if (progress) {
                    progress(done, work, entry.entry.name);
                }
            }
        }));
    }

    for (auto& f : futures) {
        f.get();
    }

    batch.cancelled = cancel.is_cancelled();

    std::sort(batch.extraction_failures.begin(), batch.extraction_failures.end(),
              [](const auto& a, const auto& b) { return a.position < b.position; });
    for (size_t i = 0; i < entries.size(); ++i) {
        if (batch.results[i] && !batch.results[i]->ok()) {
            batch.failed_entries.push_back(entries[i].entry.name);
        }
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    LOG_INFO("Converter", "Done: " << batch.converted_count() << " ok, " << batch.failed_entries.size()
             << " failed, " << batch.extraction_failures.size() << " unreadable in " << duration.count() << "ms"
             << (batch.cancelled ? " (cancelled)" : ""));
    return batch;
}

} // namespace mnemonic
