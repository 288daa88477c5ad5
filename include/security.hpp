#pragma once

#include <string>
#include <cstddef>
#include <filesystem>

namespace security {

constexpr std::size_t MAX_FILENAME_SIZE = 255;
constexpr const char* PLACEHOLDER_FILENAME = "unnamed_file";

// Reduce a peer-supplied filename to a basename made of [A-Za-z0-9._-],
// at most MAX_FILENAME_SIZE characters with the extension preserved.
// Never empty, never "." or "..". Idempotent.
std::string sanitize_filename(const std::string& filename);

// True when sanitize_filename() would return the name unchanged
bool is_sanitized(const std::string& filename);

// First of dir/name, dir/stem_1.ext, dir/stem_2.ext, ... that does not exist.
// Probe only: two sessions resolving the same name concurrently can race.
std::filesystem::path resolve_destination(const std::filesystem::path& dir,
                                          const std::string& filename);

} // namespace security
