/**
 * Mnemonic - Logging System
 *
 * Provides structured logging with configurable levels.
 * Thread-safe (converter workers log concurrently), supports file and console output.
 */

#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <functional>
#include <memory>

namespace mnemonic {

/**
 * Log severity levels
 */
enum class LogLevel {
    Debug = 0,   // Detailed debugging information
    Info = 1,    // General operational messages
    Warning = 2, // Non-critical issues
    Error = 3,   // Critical failures
    None = 4     // Disable all logging
};

/**
 * Convert LogLevel to string representation
 */
constexpr const char* log_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

/**
 * Thread-safe logger with level filtering
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * Set minimum log level (messages below this level are ignored)
     */
    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel get_level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    bool is_enabled(LogLevel level) const {
        return level >= min_level_.load(std::memory_order_acquire);
    }

    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }

    /**
     * Set log file path (truncates and writes a session header)
     */
    bool set_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (file_.is_open()) {
            file_.close();
        }

        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        file_.open(path, std::ios::out | std::ios::trunc);
        if (!file_.is_open()) {
            return false;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf;
        localtime_r(&time, &tm_buf);
        file_ << "=== Mnemonic Build Log - "
              << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " ===\n\n";
        file_.flush();
        return true;
    }

    void close_file() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_ << "\n=== Log End ===\n";
            file_.close();
        }
    }

    using Sink = std::function<void(LogLevel, const std::string&)>;

    /**
     * Mirror every emitted line to `callback` (embedding front ends, tests).
     * It runs on the logging thread, outside the logger lock, so converter
     * workers are never held up behind it. Pass nullptr to detach.
     */
    void set_callback(Sink callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (callback) {
            callback_ = std::make_shared<const Sink>(std::move(callback));
        } else {
            callback_.reset();
        }
    }

    /**
     * Log a message at the specified level
     */
    template<typename... Args>
    void log(LogLevel level, std::string_view tag, std::string_view format, Args&&... args) {
        if (level < min_level_) return;

        std::string message = format_message(level, tag, format, std::forward<Args>(args)...);

        std::shared_ptr<const Sink> sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (console_enabled_) {
                if (level >= LogLevel::Warning) {
                    std::cerr << message << std::endl;
                } else {
                    std::cout << message << '\n';
                }
            }

            // Warnings and errors reach the disk before a crash or kill can lose them
            if (file_.is_open()) {
                file_ << message << '\n';
                if (level >= LogLevel::Warning) {
                    file_.flush();
                }
            }

            sink = callback_;
        }

        if (sink) {
            (*sink)(level, message);
        }
    }

    // Convenience methods
    template<typename... Args>
    void debug(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Debug, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Info, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Warning, tag, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view tag, std::string_view format, Args&&... args) {
        log(LogLevel::Error, tag, format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger() {
        if (file_.is_open()) {
            file_ << "\n=== Log End ===\n";
            file_.close();
        }
    }

    template<typename... Args>
    std::string format_message(LogLevel level, std::string_view tag,
                               std::string_view format, Args&&... args) {
        std::ostringstream ss;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        localtime_r(&time, &tm_buf);

        ss << std::put_time(&tm_buf, "%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << ms.count() << ' ';

        ss << '[' << log_level_string(level) << "] ";

        if (!tag.empty()) {
            ss << '[' << tag << "] ";
        }

        ss << format;
        ((ss << args), ...);

        return ss.str();
    }

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    bool console_enabled_ = false;
    std::ofstream file_;
    std::shared_ptr<const Sink> callback_;
};

// Stream-based logging macros - usage: LOG_INFO("Tag", "message " << value << " more")
#define LOG_DEBUG(tag, msg) \
    do { \
        if (mnemonic::Logger::instance().is_enabled(mnemonic::LogLevel::Debug)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            mnemonic::Logger::instance().debug(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_INFO(tag, msg) \
    do { \
        if (mnemonic::Logger::instance().is_enabled(mnemonic::LogLevel::Info)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            mnemonic::Logger::instance().info(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_WARNING(tag, msg) \
    do { \
        if (mnemonic::Logger::instance().is_enabled(mnemonic::LogLevel::Warning)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            mnemonic::Logger::instance().warn(tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_WARN(tag, msg) LOG_WARNING(tag, msg)

#define LOG_ERROR(tag, msg) \
    do { \
        if (mnemonic::Logger::instance().is_enabled(mnemonic::LogLevel::Error)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            mnemonic::Logger::instance().error(tag, _log_ss.str()); \
        } \
    } while(0)

} // namespace mnemonic
