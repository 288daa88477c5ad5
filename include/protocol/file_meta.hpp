#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// FILE_INFO payload: {"filename": "...", "filesize": N}. The name is the
// sender's basename and is sanitized again on the receiving side.
struct FileInfo {
    std::string filename;
    uint64_t filesize = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileInfo, filename, filesize)

} // namespace protocol
