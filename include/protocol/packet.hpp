#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <vector>

namespace protocol {

// Fixed 8-byte header: 4-byte ASCII tag + big-endian payload length
constexpr std::size_t HEADER_SIZE = 8;
constexpr std::size_t TAG_SIZE = 4;

// Sender convention, not a protocol limit
constexpr std::size_t CHUNK_SIZE = 4096;

// Headers declaring more than this are rejected before allocating the payload
constexpr uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

enum class MessageKind {
    FILE_INFO,
    FILE_DATA,
    FILE_END,
    ACK,
    ERROR
};

constexpr const char* TAG_FILE_INFO = "INFO";
constexpr const char* TAG_FILE_DATA = "DATA";
constexpr const char* TAG_FILE_END  = "FEND";
constexpr const char* TAG_ACK       = "ACK_";
constexpr const char* TAG_ERROR     = "ERR_";

struct Frame {
    std::string tag;
    std::vector<uint8_t> payload;
};

struct FrameHeader {
    std::string tag;
    uint32_t length;
};

const char* tag_for(MessageKind kind);

// Returns false for tags outside the five defined kinds
bool kind_for(const std::string& tag, MessageKind& kind);

// Throws std::invalid_argument unless tag is exactly 4 bytes
std::vector<uint8_t> encode(const std::string& tag, const std::vector<uint8_t>& payload);

std::array<uint8_t, HEADER_SIZE> serialize_header(const std::string& tag, uint32_t length);
FrameHeader deserialize_header(const std::array<uint8_t, HEADER_SIZE>& buffer);

} // namespace protocol
