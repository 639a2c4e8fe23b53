/**
 * Mnemonic - Entry Point
 *
 *   mnemonic --build <xp3> --output <dir> [--config <yml>] [--workers N]
 *   mnemonic --list <xp3>
 *   mnemonic --check <xp3>
 *   mnemonic --extract <xp3> --output <dir>
 *   mnemonic --help
 */

#include "mnemonic/files.hpp"
#include "mnemonic/logging.hpp"
#include "mnemonic/manifest.hpp"
#include "mnemonic/pipeline.hpp"
#include "mnemonic/transcoder.hpp"
#include "mnemonic/xp3_reader.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_ERROR = 1,
    EXIT_INVALID_INPUT = 2,
    EXIT_DEPENDENCY_ERROR = 3
};

mnemonic::CancellationToken g_cancel;

void handle_interrupt(int) {
    g_cancel.cancel();
}

// CLI argument parsing
struct CliArgs {
    bool show_help = false;
    bool build_mode = false;
    bool list_mode = false;
    bool check_mode = false;
    bool extract_mode = false;
    std::string archive_path;
    std::string output_dir;
    std::string config_path;
    std::string log_file;
    std::string ffmpeg = "ffmpeg";
    int workers = -1;
    bool verbose = false;
    bool debug_logging = false;
    std::string bad_argument;
};

void print_help() {
    std::cout << R"(
Mnemonic - XP3 ingestion and asset conversion for Android builds

Usage:
  mnemonic --build <game.xp3> --output <dir> [options]
  mnemonic --list <game.xp3>
  mnemonic --check <game.xp3>
  mnemonic --extract <game.xp3> --output <dir>
  mnemonic --help

Options:
  --help, -h             Show this help message
  --build, -b <xp3>      Convert the archive and stage the build manifest
  --list, -l <xp3>       List archive entries in index order
  --check, -c <xp3>      Report header and encryption state
  --extract, -e <xp3>    Extract every entry unchanged
  --output, -o <dir>     Output / staging directory
  --config <yml>         Project config (default: mnemonic.yml beside the archive)
  --workers, -j <n>      Conversion workers (0 = one per processing unit)
  --ffmpeg <path>        Transcoder executable (default: ffmpeg from PATH)
  --log-file <path>      Also write the log to a file
  --verbose, -v          Verbose output
  --debug, -d            Enable debug logging

Exit codes: 0 success, 1 build error, 2 invalid input, 3 missing transcoder
)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take = [&](int& i, std::string& out) {
        if (i + 1 < argc) {
            out = argv[++i];
        } else {
            args.bad_argument = std::string(argv[i]) + " needs a value";
        }
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        }
        else if (arg == "--build" || arg == "-b") {
            args.build_mode = true;
            take(i, args.archive_path);
        }
        else if (arg == "--list" || arg == "-l") {
            args.list_mode = true;
            take(i, args.archive_path);
        }
        else if (arg == "--check" || arg == "-c") {
            args.check_mode = true;
            take(i, args.archive_path);
        }
        else if (arg == "--extract" || arg == "-e") {
            args.extract_mode = true;
            take(i, args.archive_path);
        }
        else if (arg == "--output" || arg == "-o") {
            take(i, args.output_dir);
        }
        else if (arg == "--config") {
            take(i, args.config_path);
        }
        else if (arg == "--log-file") {
            take(i, args.log_file);
        }
        else if (arg == "--ffmpeg") {
            take(i, args.ffmpeg);
        }
        else if (arg == "--workers" || arg == "-j") {
            std::string value;
            take(i, value);
            try {
                args.workers = std::stoi(value);
            } catch (const std::exception&) {
                args.bad_argument = "invalid worker count: " + value;
            }
            if (args.workers < 0 && args.bad_argument.empty()) {
                args.bad_argument = "invalid worker count: " + value;
            }
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--debug" || arg == "-d") {
            args.debug_logging = true;
        }
        else if (args.bad_argument.empty()) {
            args.bad_argument = "unknown argument: " + arg;
        }
    }

    return args;
}

int exit_code_for(const mnemonic::Error& error) {
    using Code = mnemonic::Error::Code;
    switch (error.code) {
        case Code::FileNotFound:
        case Code::InvalidArgument:
        case Code::MalformedHeader:
        case Code::CorruptIndex:
        case Code::EncryptedArchive:
        case Code::ConfigError:
            return EXIT_INVALID_INPUT;
        default:
            return EXIT_ERROR;
    }
}

int report(const mnemonic::Error& error) {
    std::cerr << "Error: " << mnemonic::error_code_name(error.code) << ": " << error.message << "\n";
    if (!error.context.empty()) {
        std::cerr << "  at " << error.context << "\n";
    }
    for (const auto& name : error.entries) {
        std::cerr << "  - " << name << "\n";
    }
    return exit_code_for(error);
}

int run_check(const CliArgs& args) {
    auto archive = mnemonic::Xp3Archive::open(args.archive_path);
    if (!archive) {
        return report(archive.error());
    }

    auto info = archive.value()->encryption();
    std::cout << "Archive: " << args.archive_path << "\n";
    std::cout << "Encrypted: " << (info.is_encrypted ? "yes" : "no") << "\n";
    std::cout << "Encryption: " << mnemonic::encryption_type_name(info.type) << "\n";
    if (info.is_encrypted) {
        std::cout << "Details: " << info.details << "\n";
        return EXIT_INVALID_INPUT;
    }
    std::cout << "Entries: " << archive.value()->file_count() << "\n";
    std::cout << "Total size: " << mnemonic::format_file_size(archive.value()->total_size()) << "\n";
    return EXIT_OK;
}

int run_list(const CliArgs& args) {
    auto archive = mnemonic::Xp3Archive::open(args.archive_path);
    if (!archive) {
        return report(archive.error());
    }

    auto entries = archive.value()->list_entries();
    if (!entries) {
        return report(entries.error());
    }

    for (const auto& entry : entries.value()) {
        std::cout << entry.name;
        if (args.verbose) {
            std::cout << " (" << entry.archived_size << " bytes stored, "
                      << entry.original_size << " bytes, "
                      << (entry.is_compressed() ? "zlib" : "raw") << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\nEntries: " << entries.value().size() << "\n";
    return EXIT_OK;
}

int run_extract(const CliArgs& args) {
    if (args.output_dir.empty()) {
        std::cerr << "Error: No output directory specified (use --output)\n";
        return EXIT_INVALID_INPUT;
    }

    auto archive = mnemonic::Xp3Archive::open(args.archive_path);
    if (!archive) {
        return report(archive.error());
    }

    auto result = archive.value()->extract_all(args.output_dir,
        [&](const std::string& name, size_t current, size_t total) {
            if (args.verbose) {
                std::cout << "[" << current << "/" << total << "] " << name << "\n";
            }
            return !g_cancel.is_cancelled();
        });
    if (!result) {
        return report(result.error());
    }

    std::cout << "\nExtracted: " << archive.value()->file_count() << " files\n";
    return EXIT_OK;
}

int run_build(const CliArgs& args) {
    if (args.output_dir.empty()) {
        std::cerr << "Error: No output directory specified (use --output)\n";
        return EXIT_INVALID_INPUT;
    }

    mnemonic::FfmpegTranscoder transcoder(args.ffmpeg);
    const bool transcoder_available = transcoder.is_available();
    if (!transcoder_available) {
        LOG_WARNING("App", "Transcoder '" << args.ffmpeg << "' not found; builds needing conversion will fail");
    }

    mnemonic::PipelineOptions options;
    options.archive_path = args.archive_path;
    options.config_path = args.config_path;
    if (args.workers >= 0) {
        options.worker_count = static_cast<unsigned int>(args.workers);
    }

    mnemonic::Pipeline pipeline(options, transcoder);
    std::mutex progress_mutex;
    if (args.verbose) {
        pipeline.set_progress_callback([&progress_mutex](size_t current, size_t total, const std::string& item) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            std::cout << "[" << current << "/" << total << "] " << item << "\n";
        });
    }

    auto manifest = pipeline.run(g_cancel);
    if (!manifest) {
        const auto& error = manifest.error();
        if (error.code == mnemonic::Error::Code::ConversionFailed && !transcoder_available) {
            report(error);
            return EXIT_DEPENDENCY_ERROR;
        }
        return report(error);
    }

    auto staged = mnemonic::write_manifest(manifest.value(), args.output_dir);
    if (!staged) {
        return report(staged.error());
    }

    std::cout << "Staged " << manifest.value().assets.size() << " assets ("
              << mnemonic::format_file_size(manifest.value().total_size()) << ") to "
              << args.output_dir << "\n";
    return EXIT_OK;
}

int run_cli(const CliArgs& args) {
    if (args.show_help) {
        print_help();
        return EXIT_OK;
    }

    if (!args.bad_argument.empty()) {
        std::cerr << "Error: " << args.bad_argument << "\n";
        print_help();
        return EXIT_INVALID_INPUT;
    }

    int modes = args.build_mode + args.list_mode + args.check_mode + args.extract_mode;
    if (modes != 1 || args.archive_path.empty()) {
        std::cerr << "Error: Specify exactly one of --build, --list, --check or --extract with an archive\n";
        print_help();
        return EXIT_INVALID_INPUT;
    }

    if (args.check_mode) return run_check(args);
    if (args.list_mode) return run_list(args);
    if (args.extract_mode) return run_extract(args);
    return run_build(args);
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    auto& logger = mnemonic::Logger::instance();
    logger.set_console_output(true);
    logger.set_level(args.verbose ? mnemonic::LogLevel::Info : mnemonic::LogLevel::Warning);

    if (args.debug_logging) {
        logger.set_level(mnemonic::LogLevel::Debug);
        LOG_INFO("App", "Debug logging enabled");
    }

    if (!args.log_file.empty() && !logger.set_file(args.log_file)) {
        std::cerr << "Error: Cannot open log file: " << args.log_file << "\n";
        return EXIT_INVALID_INPUT;
    }

    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    int result = run_cli(args);

    logger.close_file();
    return result;
}
