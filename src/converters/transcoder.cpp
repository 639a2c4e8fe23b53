/**
 * Mnemonic - External transcoder process
 *
 * fork + execvp without a shell, so entry names never reach a command line
 * parser. The parent polls the child and kills its process group on timeout
 * or cancellation.
 */

#include "mnemonic/transcoder.hpp"
#include "mnemonic/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mnemonic {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(10);
constexpr size_t MAX_DIAGNOSTICS = 8192;

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

void drain(int fd, std::string& sink) {
    char buffer[4096];
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            if (sink.size() > MAX_DIAGNOSTICS) {
                sink.erase(0, sink.size() - MAX_DIAGNOSTICS);
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // namespace

const char* transcode_status_name(TranscodeStatus status) {
    switch (status) {
        case TranscodeStatus::Success:     return "success";
        case TranscodeStatus::NonZeroExit: return "non-zero exit";
        case TranscodeStatus::Signaled:    return "killed by signal";
        case TranscodeStatus::Timeout:     return "timeout";
        case TranscodeStatus::Cancelled:   return "cancelled";
        case TranscodeStatus::SpawnFailed: return "spawn failed";
        default:                           return "unknown";
    }
}

std::vector<std::string> FfmpegTranscoder::default_arguments() {
    return {"-nostdin", "-y", "-loglevel", "error", "-i", "{input}", "{output}"};
}

FfmpegTranscoder::FfmpegTranscoder(std::string program, std::vector<std::string> arguments)
    : program_(std::move(program)), arguments_(std::move(arguments)) {}

std::vector<std::string> FfmpegTranscoder::expand_arguments(const TranscodeRequest& request) const {
    std::vector<std::string> args;
    args.reserve(arguments_.size() + 1);
    args.push_back(program_);
    for (auto arg : arguments_) {
        replace_all(arg, "{input}", request.input.string());
        replace_all(arg, "{output}", request.output.string());
        replace_all(arg, "{format}", request.target_format);
        args.push_back(std::move(arg));
    }
    return args;
}

bool FfmpegTranscoder::is_available() const {
    auto executable = [](const std::string& candidate) {
        struct stat st;
        return stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
               access(candidate.c_str(), X_OK) == 0;
    };

    if (program_.find('/') != std::string::npos) {
        return executable(program_);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (executable(dir + "/" + program_)) return true;
    }
    return false;
}

TranscodeResponse FfmpegTranscoder::transcode(const TranscodeRequest& request) {
    TranscodeResponse response;

    if (request.cancel && request.cancel->is_cancelled()) {
        response.status = TranscodeStatus::Cancelled;
        return response;
    }

    // argv must be complete before fork; the child may only exec or _exit
    std::vector<std::string> args = expand_arguments(request);
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int output_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // Carries errno if execvp fails
    if (pipe2(output_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        response.diagnostics = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(output_pipe);
        close_pair(exec_pipe);
        return response;
    }

    pid_t pid = fork();
    if (pid < 0) {
        response.diagnostics = std::string("fork failed: ") + std::strerror(errno);
        close_pair(output_pipe);
        close_pair(exec_pipe);
        return response;
    }

    if (pid == 0) {
        // Own process group, so a timeout kill reaches helpers the tool spawns
        setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        dup2(output_pipe[1], STDOUT_FILENO);
        dup2(output_pipe[1], STDERR_FILENO);

        execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(output_pipe[1]);
    close(exec_pipe[1]);
    fcntl(output_pipe[0], F_SETFL, fcntl(output_pipe[0], F_GETFL) | O_NONBLOCK);

    LOG_DEBUG("Transcoder", "Started " << program_ << " (pid " << pid << ") for "
              << request.input.filename().string() << " -> " << request.target_format);

    const auto deadline = std::chrono::steady_clock::now() + request.timeout;
    int status = 0;
    bool exited = false;
    TranscodeStatus forced = TranscodeStatus::Success;

    while (!exited) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            exited = true;
            break;
        }
        if (done < 0 && errno != EINTR) {
            response.diagnostics = std::string("waitpid failed: ") + std::strerror(errno);
            forced = TranscodeStatus::SpawnFailed;
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            break;
        }

        drain(output_pipe[0], response.diagnostics);

        if (request.cancel && request.cancel->is_cancelled()) {
            forced = TranscodeStatus::Cancelled;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            forced = TranscodeStatus::Timeout;
        }

        if (forced != TranscodeStatus::Success) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            break;
        }

        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    drain(output_pipe[0], response.diagnostics);
    close(output_pipe[0]);

    int exec_errno = 0;
    ssize_t got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    close(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        response.status = TranscodeStatus::SpawnFailed;
        response.diagnostics = "cannot execute " + program_ + ": " + std::strerror(exec_errno);
        LOG_ERROR("Transcoder", response.diagnostics);
        return response;
    }

    if (forced != TranscodeStatus::Success) {
        response.status = forced;
        LOG_WARNING("Transcoder", program_ << " " << transcode_status_name(forced) << " for "
                    << request.input.filename().string());
        return response;
    }

    if (WIFEXITED(status)) {
        response.exit_code = WEXITSTATUS(status);
        response.status = response.exit_code == 0 ? TranscodeStatus::Success : TranscodeStatus::NonZeroExit;
    } else {
        response.status = TranscodeStatus::Signaled;
        if (WIFSIGNALED(status)) {
            response.exit_code = 128 + WTERMSIG(status);
        }
    }

    if (!response.ok()) {
        LOG_WARNING("Transcoder", program_ << " exited with " << response.exit_code << " for "
                    << request.input.filename().string());
    }
    return response;
}

} // namespace mnemonic
