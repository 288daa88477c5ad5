#include "protocol/packet.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <stdexcept>

namespace protocol {

const char* tag_for(MessageKind kind) {
    switch (kind) {
        case MessageKind::FILE_INFO: return TAG_FILE_INFO;
        case MessageKind::FILE_DATA: return TAG_FILE_DATA;
        case MessageKind::FILE_END:  return TAG_FILE_END;
        case MessageKind::ACK:       return TAG_ACK;
        case MessageKind::ERROR:     return TAG_ERROR;
    }
    return "";
}

bool kind_for(const std::string& tag, MessageKind& kind) {
    static const MessageKind kinds[] = {
        MessageKind::FILE_INFO, MessageKind::FILE_DATA, MessageKind::FILE_END,
        MessageKind::ACK, MessageKind::ERROR
    };
    for (MessageKind k : kinds) {
        if (tag == tag_for(k)) {
            kind = k;
            return true;
        }
    }
    return false;
}

std::array<uint8_t, HEADER_SIZE> serialize_header(const std::string& tag, uint32_t length) {
    if (tag.size() != TAG_SIZE) {
        throw std::invalid_argument("Message type must be exactly 4 bytes");
    }
    std::array<uint8_t, HEADER_SIZE> buffer;
    uint32_t len = htonl(length);

    std::memcpy(buffer.data(), tag.data(), TAG_SIZE);
    std::memcpy(buffer.data() + TAG_SIZE, &len, 4);

    return buffer;
}

FrameHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer) {
    FrameHeader header;
    uint32_t len;

    header.tag.assign(reinterpret_cast<const char*>(buffer.data()), TAG_SIZE);
    std::memcpy(&len, buffer.data() + TAG_SIZE, 4);
    header.length = ntohl(len);

    return header;
}

std::vector<uint8_t> encode(const std::string& tag, const std::vector<uint8_t>& payload) {
    auto header = serialize_header(tag, static_cast<uint32_t>(payload.size()));

    std::vector<uint8_t> bytes;
    bytes.reserve(HEADER_SIZE + payload.size());
    bytes.insert(bytes.end(), header.begin(), header.end());
    bytes.insert(bytes.end(), payload.begin(), payload.end());
    return bytes;
}

} // namespace protocol
