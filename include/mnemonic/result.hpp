/**
 * Mnemonic - Result Type
 *
 * Provides a Result<T> type for consistent error handling across the
 * ingestion pipeline. Every stage reports failures through Error.
 */

#pragma once

#include <variant>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

namespace mnemonic {

/**
 * Error information with code, message and the entries it concerns
 */
struct Error {
    enum class Code {
        None = 0,
        FileNotFound,
        IoError,
        InvalidArgument,
        MalformedHeader,
        CorruptIndex,
        EncryptedArchive,
        CorruptEntry,
        ConversionFailed,
        MissingConversion,
        ConfigError,
        Cancelled,
        Unknown
    };

    Code code = Code::None;
    std::string message;
    std::string context;               // Additional context (file path, etc.)
    std::vector<std::string> entries;  // Archive entries affected by this error

    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}
    Error(Code c, std::string msg, std::string ctx, std::vector<std::string> names)
        : code(c), message(std::move(msg)), context(std::move(ctx)), entries(std::move(names)) {}

    bool ok() const { return code == Code::None; }

    std::string full_message() const {
        std::string result = message;
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        if (!entries.empty()) {
            result += " (";
            for (size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) result += ", ";
                result += entries[i];
            }
            result += ")";
        }
        return result;
    }

    // Common error constructors
    static Error file_not_found(const std::string& path) {
        return Error(Code::FileNotFound, "File not found", path);
    }

    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }

    static Error invalid_argument(const std::string& msg) {
        return Error(Code::InvalidArgument, msg);
    }

    static Error malformed_header(const std::string& msg, const std::string& path = "") {
        return Error(Code::MalformedHeader, msg, path);
    }

    static Error corrupt_index(const std::string& msg, const std::string& path = "") {
        return Error(Code::CorruptIndex, msg, path);
    }

    static Error encrypted_archive(const std::string& details, const std::string& path = "") {
        return Error(Code::EncryptedArchive,
                     "this archive format is not supported - encryption is not handled: " + details,
                     path);
    }

    static Error corrupt_entry(const std::string& msg, const std::string& entry) {
        return Error(Code::CorruptEntry, msg, "", {entry});
    }

    static Error conversion_failed(std::vector<std::string> failed_entries) {
        return Error(Code::ConversionFailed,
                     std::to_string(failed_entries.size()) + " asset conversion(s) failed",
                     "", std::move(failed_entries));
    }

    static Error missing_conversion(std::vector<std::string> names) {
        return Error(Code::MissingConversion, "No conversion result for entry", "", std::move(names));
    }

    static Error config_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::ConfigError, msg, path);
    }

    static Error cancelled() {
        return Error(Code::Cancelled, "Build cancelled");
    }
};

/**
 * Stable name for an error code, used in logs and manifest reports.
 */
inline const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::None:              return "None";
        case Error::Code::FileNotFound:      return "FileNotFound";
        case Error::Code::IoError:           return "IoError";
        case Error::Code::InvalidArgument:   return "InvalidArgument";
        case Error::Code::MalformedHeader:   return "MalformedHeader";
        case Error::Code::CorruptIndex:      return "CorruptIndex";
        case Error::Code::EncryptedArchive:  return "EncryptedArchive";
        case Error::Code::CorruptEntry:      return "CorruptEntry";
        case Error::Code::ConversionFailed:  return "ConversionFailed";
        case Error::Code::MissingConversion: return "MissingConversion";
        case Error::Code::ConfigError:       return "ConfigError";
        case Error::Code::Cancelled:         return "Cancelled";
        default:                             return "Unknown";
    }
}

/**
 * Result type that holds either a value T or an Error
 *
 * Usage:
 *   Result<std::vector<uint8_t>> bytes = archive.extract(entry);
 *   if (bytes) {
 *       consume(bytes.value());
 *   } else {
 *       LOG_ERROR("Build", bytes.error().full_message());
 *   }
 */
template<typename T>
class Result {
public:
    // Success construction
    Result(T value) : data_(std::move(value)) {}

    // Error construction
    Result(Error error) : data_(std::move(error)) {}

    // Check if result is successful
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().message);
        }
        return std::get<T>(data_);
    }

    // Access error
    const Error& error() const {
        if (ok()) {
            static Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }

    // Pointer-like access
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for void results (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        static Error no_error;
        return error_ ? *error_ : no_error;
    }

    static Result success() { return Result(); }
    static Result failure(Error err) { return Result(std::move(err)); }

private:
    std::optional<Error> error_;
};

// Helper macros for early return on error
#define MNEMONIC_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) { \
            return _result.error(); \
        } \
    } while(0)

#define MNEMONIC_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (!_result_##var.ok()) { \
        return _result_##var.error(); \
    } \
    auto var = std::move(_result_##var.value())

} // namespace mnemonic
