/**
 * Mnemonic - Path Utilities
 *
 * Archive entry names use '/' (occasionally '\\') and mixed case; these helpers
 * give rules and lookups one canonical form.
 */

#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace mnemonic {

/**
 * Normalize path separators and case for consistent comparisons.
 * Converts backslashes to forward slashes and lowercases the path.
 */
inline std::string normalize_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/**
 * Get lowercase extension including the dot, or "" when the last
 * path component has none.
 */
inline std::string get_extension_lower(const std::string& path) {
    std::string normalized = normalize_path(path);
    size_t slash = normalized.rfind('/');
    size_t dot = normalized.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    // ".hidden" files have no extension
    if (dot == 0 || (slash != std::string::npos && dot == slash + 1)) {
        return "";
    }
    return normalized.substr(dot);
}

/**
 * Replace the extension of the last path component (`new_ext` without the dot).
 */
inline std::string replace_extension(const std::string& path, const std::string& new_ext) {
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.rfind('.');
    bool has_ext = dot != std::string::npos &&
                   (slash == std::string::npos || dot > slash + 1) && dot != 0;
    std::string stem = has_ext ? path.substr(0, dot) : path;
    return stem + "." + new_ext;
}

/**
 * Simple glob pattern matching with * and ? on normalized paths.
 */
inline bool glob_match(const std::string& path, const std::string& pattern) {
    const std::string text = normalize_path(path);
    const std::string pat = normalize_path(pattern);

    size_t ti = 0, pi = 0;
    size_t star_idx = std::string::npos;
    size_t match_idx = 0;

    while (ti < text.size()) {
        if (pi < pat.size() && (pat[pi] == '?' || pat[pi] == text[ti])) {
            ++ti;
            ++pi;
        } else if (pi < pat.size() && pat[pi] == '*') {
            star_idx = pi++;
            match_idx = ti;
        } else if (star_idx != std::string::npos) {
            pi = star_idx + 1;
            ti = ++match_idx;
        } else {
            return false;
        }
    }

    while (pi < pat.size() && pat[pi] == '*') {
        ++pi;
    }

    return pi == pat.size();
}

/**
 * Name as a relative path that stays inside whatever directory it is
 * joined to, or an empty path if it would escape it.
 */
inline std::filesystem::path contained_relative_path(const std::string& name) {
    std::string slashed = name;
    std::replace(slashed.begin(), slashed.end(), '\\', '/');
    std::filesystem::path relative = std::filesystem::path(slashed).lexically_normal();
    if (relative.empty() || relative.is_absolute() || relative.has_root_name() ||
        *relative.begin() == ".." || relative == ".") {
        return {};
    }
    return relative;
}

} // namespace mnemonic
