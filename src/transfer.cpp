#include "transfer.hpp"
#include "security.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <algorithm>

using boost::asio::ip::tcp;

namespace transfer {

namespace {

// Tags off the wire may hold arbitrary bytes
std::string printable_tag(const std::string& tag) {
    std::string out = tag;
    std::replace_if(out.begin(), out.end(), [](char c) { return c < 0x20 || c > 0x7e; }, '?');
    return out;
}

std::string format_progress(uint64_t received, uint64_t total) {
    double percent = (total > 0) ? (received * 100.0) / total : 100.0;
    std::ostringstream oss;
    oss << "Received " << received << "/" << total << " bytes ("
        << std::fixed << std::setprecision(1) << percent << "%)";
    return oss.str();
}

std::string peer_name(tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) return "unknown peer";
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:               return "none";
        case ErrorKind::TRANSPORT_FAILURE:  return "transport failure";
        case ErrorKind::PROTOCOL_VIOLATION: return "protocol violation";
        case ErrorKind::APPLICATION_ERROR:  return "application error";
        case ErrorKind::FILE_ERROR:         return "file error";
    }
    return "unknown";
}

// ─── MessageSender ──────────────────────────────────────────────────────────

std::optional<Error> MessageSender::send_frame(tcp::socket& socket, const protocol::Frame& frame) {
    std::vector<uint8_t> bytes = protocol::encode(frame.tag, frame.payload);
    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(bytes), ec);
    if (ec) {
        return Error{ErrorKind::TRANSPORT_FAILURE, "Failed to send " + frame.tag + ": " + ec.message()};
    }
    return std::nullopt;
}

std::optional<Error> MessageSender::send(tcp::socket& socket, const protocol::Message& message) {
    return send_frame(socket, protocol::to_frame(message));
}

std::optional<Error> MessageSender::send_file(tcp::socket& socket, const std::string& filepath,
                                              std::size_t chunk_size, uint64_t& bytes_sent,
                                              const StatusCallback& on_status) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return Error{ErrorKind::FILE_ERROR, "Could not open file for reading: " + filepath};
    }
    if (chunk_size == 0) chunk_size = protocol::CHUNK_SIZE;

    std::vector<uint8_t> buffer(chunk_size);
    while (true) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
        std::streamsize bytes_read = file.gcount();
        if (bytes_read <= 0) {
            if (file.bad()) {
                return Error{ErrorKind::FILE_ERROR, "Failed reading from " + filepath};
            }
            break;
        }

        protocol::FileDataMessage chunk{
            std::vector<uint8_t>(buffer.begin(), buffer.begin() + bytes_read)};
        if (auto err = send(socket, chunk)) return err;

        // Stop-and-wait: next chunk only after this one is acknowledged
        std::string ack_text;
        if (auto err = MessageReceiver::expect_ack(socket, ack_text)) return err;
        bytes_sent += static_cast<uint64_t>(bytes_read);
        if (on_status) on_status(ack_text);
    }
    return std::nullopt;
}

// ─── MessageReceiver ────────────────────────────────────────────────────────

std::vector<uint8_t> MessageReceiver::read_exact(tcp::socket& socket, std::size_t n,
                                                 boost::system::error_code& ec) {
    ec.clear();
    std::vector<uint8_t> data(n);
    std::size_t received = 0;
    while (received < n) {
        received += socket.read_some(boost::asio::buffer(data.data() + received, n - received), ec);
        if (ec) break;
    }
    data.resize(received);
    return data;
}

std::optional<Error> MessageReceiver::receive_frame(tcp::socket& socket, protocol::Frame& frame) {
    boost::system::error_code ec;
    std::vector<uint8_t> header_bytes = read_exact(socket, protocol::HEADER_SIZE, ec);
    if (header_bytes.size() != protocol::HEADER_SIZE) {
        if (header_bytes.empty() && ec == boost::asio::error::eof) {
            return Error{ErrorKind::TRANSPORT_FAILURE, "Connection closed by peer"};
        }
        return Error{ErrorKind::TRANSPORT_FAILURE,
                     "Failed to receive complete header" + (ec ? ": " + ec.message() : std::string())};
    }

    std::array<uint8_t, protocol::HEADER_SIZE> buf;
    std::copy(header_bytes.begin(), header_bytes.end(), buf.begin());
    protocol::FrameHeader header = protocol::deserialize_header(buf);

    if (header.length > protocol::MAX_PAYLOAD_SIZE) {
        return Error{ErrorKind::PROTOCOL_VIOLATION,
                     "Declared payload length " + std::to_string(header.length) + " exceeds limit"};
    }

    std::vector<uint8_t> payload = read_exact(socket, header.length, ec);
    if (payload.size() != header.length) {
        return Error{ErrorKind::TRANSPORT_FAILURE,
                     "Failed to receive complete data (" + std::to_string(payload.size()) + "/" +
                     std::to_string(header.length) + " bytes)"};
    }

    frame.tag = header.tag;
    frame.payload = std::move(payload);
    return std::nullopt;
}

std::optional<Error> MessageReceiver::receive(tcp::socket& socket, protocol::Message& message) {
    protocol::Frame frame;
    if (auto err = receive_frame(socket, frame)) return err;

    std::string error;
    if (!protocol::from_frame(frame, message, error)) {
        return Error{ErrorKind::PROTOCOL_VIOLATION, printable_tag(error)};
    }
    return std::nullopt;
}

std::optional<Error> MessageReceiver::expect_ack(tcp::socket& socket, std::string& ack_text) {
    protocol::Message message;
    if (auto err = receive(socket, message)) return err;

    if (auto* ack = std::get_if<protocol::AckMessage>(&message)) {
        ack_text = ack->text;
        return std::nullopt;
    }
    if (auto* error = std::get_if<protocol::ErrorMessage>(&message)) {
        return Error{ErrorKind::APPLICATION_ERROR, "Server error: " + error->text};
    }
    return Error{ErrorKind::PROTOCOL_VIOLATION, "Expected ACK, got: " + protocol::describe(message)};
}

// ─── FileReceiver ───────────────────────────────────────────────────────────

FileReceiver::FileReceiver(std::string receive_dir, StatusCallback on_status)
    : receive_dir_(std::move(receive_dir)), on_status_(std::move(on_status)) {}

void FileReceiver::report(const std::string& message) const {
    if (on_status_) {
        on_status_(message);
    } else {
        std::cout << message << "\n";
    }
}

void FileReceiver::send_error(tcp::socket& socket, const std::string& text) {
    if (auto err = MessageSender::send(socket, protocol::ErrorMessage{text})) {
        report("Could not deliver error to peer: " + err->message);
    }
}

TransferResult FileReceiver::run(tcp::socket& socket) {
    std::string peer = peer_name(socket);
    report("Handling client " + peer);

    TransferResult result = receive(socket);

    boost::system::error_code ec;
    socket.close(ec);
    if (ec) {
        report("Error closing connection with " + peer + ": " + ec.message());
    }
    report("Connection with " + peer + " closed");
    return result;
}

TransferResult FileReceiver::receive(tcp::socket& socket) {
    TransferResult result;
    state_ = ReceiveState::AWAIT_INFO;

    protocol::Frame frame;
    if (auto err = MessageReceiver::receive_frame(socket, frame)) {
        report("Error reading file info: " + err->message);
        if (err->kind == ErrorKind::PROTOCOL_VIOLATION) send_error(socket, err->message);
        state_ = ReceiveState::FAILED;
        result.error = err->kind;
        result.message = err->message;
        return result;
    }

    if (frame.tag != protocol::TAG_FILE_INFO) {
        report("Expected file info, got: " + printable_tag(frame.tag));
        send_error(socket, "Expected file info message");
        state_ = ReceiveState::FAILED;
        result.error = ErrorKind::PROTOCOL_VIOLATION;
        result.message = "Expected file info message";
        return result;
    }

    protocol::Message message;
    std::string parse_error;
    if (!protocol::from_frame(frame, message, parse_error)) {
        report(parse_error);
        send_error(socket, parse_error);
        state_ = ReceiveState::FAILED;
        result.error = ErrorKind::PROTOCOL_VIOLATION;
        result.message = parse_error;
        return result;
    }
    const protocol::FileInfo info = std::get<protocol::FileInfoMessage>(message).info;

    std::string filename = security::sanitize_filename(info.filename);
    if (!security::is_sanitized(info.filename)) {
        report("Peer filename '" + info.filename + "' stored as '" + filename + "'");
    }
    uint64_t filesize = info.filesize;
    report("Receiving file: " + filename + " (" + std::to_string(filesize) + " bytes)");

    std::filesystem::path file_path = security::resolve_destination(receive_dir_, filename);
    result.path = file_path.string();

    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        report("Could not open file for writing: " + result.path);
        send_error(socket, "Cannot create destination file");
        state_ = ReceiveState::FAILED;
        result.error = ErrorKind::FILE_ERROR;
        result.message = "Cannot create destination file";
        return result;
    }

    state_ = ReceiveState::READY;
    std::optional<Error> failure = MessageSender::send(socket, protocol::AckMessage{"Ready to receive file"});

    uint64_t bytes_received = 0;
    bool end_marker = false;
    if (!failure) state_ = ReceiveState::RECEIVING;

    while (!failure && bytes_received < filesize) {
        protocol::Message incoming;
        if (auto err = MessageReceiver::receive(socket, incoming)) {
            failure = err;
            report("Error receiving data: " + err->message);
            if (err->kind == ErrorKind::PROTOCOL_VIOLATION) send_error(socket, err->message);
            break;
        }

        if (auto* chunk = std::get_if<protocol::FileDataMessage>(&incoming)) {
            file.write(reinterpret_cast<const char*>(chunk->data.data()),
                       static_cast<std::streamsize>(chunk->data.size()));
            if (!file) {
                failure = Error{ErrorKind::FILE_ERROR, "Failed writing to " + result.path};
                report(failure->message);
                send_error(socket, "Failed to write file data");
                break;
            }
            bytes_received += chunk->data.size();
            failure = MessageSender::send(socket, protocol::AckMessage{format_progress(bytes_received, filesize)});
        } else if (std::holds_alternative<protocol::FileEndMessage>(incoming)) {
            // Explicit end marker is honored even short of the declared size
            end_marker = true;
            break;
        } else {
            failure = Error{ErrorKind::PROTOCOL_VIOLATION,
                            "Unexpected message type: " + protocol::describe(incoming)};
            report("Protocol error: " + failure->message);
            send_error(socket, failure->message);
            break;
        }
    }
    file.close();
    result.bytes_transferred = bytes_received;

    if (!failure && (bytes_received == filesize || end_marker)) {
        state_ = ReceiveState::COMPLETE;
        if (bytes_received != filesize) {
            report("End marker after " + std::to_string(bytes_received) + "/" +
                   std::to_string(filesize) + " bytes; keeping short file");
        }
        report("File received successfully: " + result.path);

        std::string final_text = "File '" + filename + "' received successfully";
        if (auto err = MessageSender::send(socket, protocol::AckMessage{final_text})) {
            report("Could not deliver final acknowledgment: " + err->message);
        }

        // The sender follows its last chunk with FILE_END; consume it before closing
        if (!end_marker) {
            protocol::Message trailing;
            if (auto err = MessageReceiver::receive(socket, trailing)) {
                report("No end marker after complete transfer: " + err->message);
            } else if (!std::holds_alternative<protocol::FileEndMessage>(trailing)) {
                report("Ignoring " + protocol::describe(trailing) + " after complete transfer");
            }
        }

        result.state = TransferState::COMPLETED;
        result.message = final_text;
        return result;
    }

    state_ = ReceiveState::FAILED;
    report("File transfer incomplete: " + std::to_string(bytes_received) + "/" +
           std::to_string(filesize) + " bytes");

    std::error_code ec;
    if (std::filesystem::exists(file_path, ec)) {
        std::filesystem::remove(file_path, ec);
        if (ec) report("Could not remove partial file " + result.path + ": " + ec.message());
    }
    send_error(socket, "File transfer incomplete");

    result.error = failure ? failure->kind : ErrorKind::APPLICATION_ERROR;
    result.message = failure ? failure->message : "File transfer incomplete";
    return result;
}

} // namespace transfer
