#include "protocol/message.hpp"
#include <nlohmann/json.hpp>

namespace protocol {

namespace {

struct KindVisitor {
    MessageKind operator()(const FileInfoMessage&) const { return MessageKind::FILE_INFO; }
    MessageKind operator()(const FileDataMessage&) const { return MessageKind::FILE_DATA; }
    MessageKind operator()(const FileEndMessage&) const { return MessageKind::FILE_END; }
    MessageKind operator()(const AckMessage&) const { return MessageKind::ACK; }
    MessageKind operator()(const ErrorMessage&) const { return MessageKind::ERROR; }
};

struct PayloadVisitor {
    std::vector<uint8_t> operator()(const FileInfoMessage& m) const {
        nlohmann::json j = m.info;
        // Local filenames are not guaranteed UTF-8; the receiver sanitizes anyway
        std::string text = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        return std::vector<uint8_t>(text.begin(), text.end());
    }
    std::vector<uint8_t> operator()(const FileDataMessage& m) const { return m.data; }
    std::vector<uint8_t> operator()(const FileEndMessage&) const { return {}; }
    std::vector<uint8_t> operator()(const AckMessage& m) const {
        return std::vector<uint8_t>(m.text.begin(), m.text.end());
    }
    std::vector<uint8_t> operator()(const ErrorMessage& m) const {
        return std::vector<uint8_t>(m.text.begin(), m.text.end());
    }
};

bool parse_file_info(const std::vector<uint8_t>& payload, FileInfo& info, std::string& error) {
    try {
        nlohmann::json j = nlohmann::json::parse(payload.begin(), payload.end());
        if (!j.is_object()) {
            error = "Failed to parse file info: expected a JSON object";
            return false;
        }
        if (!j.contains("filename") || !j["filename"].is_string()) {
            error = "Failed to parse file info: missing string field 'filename'";
            return false;
        }
        // Non-negative integers parse as number_unsigned
        if (!j.contains("filesize") || !j["filesize"].is_number_unsigned()) {
            error = "Failed to parse file info: 'filesize' must be a non-negative integer";
            return false;
        }
        info = j.get<FileInfo>();
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = std::string("Failed to parse file info: ") + e.what();
        return false;
    }
}

} // namespace

MessageKind kind_of(const Message& message) {
    return std::visit(KindVisitor{}, message);
}

std::string describe(const Message& message) {
    return tag_for(kind_of(message));
}

Frame to_frame(const Message& message) {
    Frame frame;
    frame.tag = tag_for(kind_of(message));
    frame.payload = std::visit(PayloadVisitor{}, message);
    return frame;
}

bool from_frame(const Frame& frame, Message& message, std::string& error) {
    MessageKind kind;
    if (!kind_for(frame.tag, kind)) {
        error = "Unexpected message type: " + frame.tag;
        return false;
    }

    switch (kind) {
        case MessageKind::FILE_INFO: {
            FileInfo info;
            if (!parse_file_info(frame.payload, info, error)) return false;
            message = FileInfoMessage{info};
            return true;
        }
        case MessageKind::FILE_DATA:
            message = FileDataMessage{frame.payload};
            return true;
        case MessageKind::FILE_END:
            message = FileEndMessage{};
            return true;
        case MessageKind::ACK:
            message = AckMessage{std::string(frame.payload.begin(), frame.payload.end())};
            return true;
        case MessageKind::ERROR:
            message = ErrorMessage{std::string(frame.payload.begin(), frame.payload.end())};
            return true;
    }
    error = "Unexpected message type: " + frame.tag;
    return false;
}

} // namespace protocol
