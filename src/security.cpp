#include "security.hpp"
#include <algorithm>
#include <system_error>

namespace security {

namespace {

bool is_allowed_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '-' || c == '_';
}

bool only_dots(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return c == '.'; });
}

// Extension starts at the last dot, ignoring leading dots (".bashrc" has none)
std::size_t extension_pos(const std::string& name) {
    std::size_t dot = name.rfind('.');
    if (dot == std::string::npos) return std::string::npos;
    std::size_t first_non_dot = name.find_first_not_of('.');
    if (first_non_dot == std::string::npos || dot < first_non_dot) return std::string::npos;
    return dot;
}

} // namespace

std::string sanitize_filename(const std::string& filename) {
    std::string base = filename;
    std::size_t sep = base.find_last_of("/\\");
    if (sep != std::string::npos) {
        base = base.substr(sep + 1);
    }

    std::string safe_name;
    safe_name.reserve(base.size());
    for (char c : base) {
        if (is_allowed_char(c)) safe_name += c;
    }

    if (safe_name.empty() || only_dots(safe_name)) {
        return PLACEHOLDER_FILENAME;
    }

    if (safe_name.size() > MAX_FILENAME_SIZE) {
        std::size_t dot = extension_pos(safe_name);
        std::string ext = (dot == std::string::npos) ? "" : safe_name.substr(dot);
        if (ext.size() >= MAX_FILENAME_SIZE) {
            safe_name = safe_name.substr(0, MAX_FILENAME_SIZE);
        } else {
            safe_name = safe_name.substr(0, MAX_FILENAME_SIZE - ext.size()) + ext;
        }
        if (only_dots(safe_name)) return PLACEHOLDER_FILENAME;
    }

    return safe_name;
}

bool is_sanitized(const std::string& filename) {
    if (filename.empty() || filename.size() > MAX_FILENAME_SIZE) return false;
    if (only_dots(filename)) return false;
    return std::all_of(filename.begin(), filename.end(), is_allowed_char);
}

std::filesystem::path resolve_destination(const std::filesystem::path& dir,
                                          const std::string& filename) {
    std::filesystem::path original = dir / filename;
    std::filesystem::path candidate = original;
    std::string stem = original.stem().string();
    std::string ext = original.extension().string();

    std::error_code ec;
    for (unsigned counter = 1; std::filesystem::exists(candidate, ec); ++counter) {
        candidate = dir / (stem + "_" + std::to_string(counter) + ext);
    }
    return candidate;
}

} // namespace security
