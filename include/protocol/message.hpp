#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include "protocol/packet.hpp"
#include "protocol/file_meta.hpp"

namespace protocol {

struct FileInfoMessage {
    FileInfo info;
};

struct FileDataMessage {
    std::vector<uint8_t> data;
};

struct FileEndMessage {};

struct AckMessage {
    std::string text;
};

struct ErrorMessage {
    std::string text;
};

using Message = std::variant<FileInfoMessage, FileDataMessage, FileEndMessage,
                             AckMessage, ErrorMessage>;

MessageKind kind_of(const Message& message);
std::string describe(const Message& message);

Frame to_frame(const Message& message);

// Returns false and fills `error` on an unknown tag or undecodable FILE_INFO
bool from_frame(const Frame& frame, Message& message, std::string& error);

} // namespace protocol
