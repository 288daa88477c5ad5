#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <boost/asio.hpp>
#include "protocol/packet.hpp"
#include "protocol/message.hpp"

namespace transfer {

// Single-argument status sink; progress and log lines go through it
using StatusCallback = std::function<void(const std::string&)>;

enum class TransferState {
    COMPLETED,
    FAILED
};

enum class ErrorKind {
    NONE,
    TRANSPORT_FAILURE,   // I/O errors, mid-frame disconnects
    PROTOCOL_VIOLATION,  // unexpected tag, bad header, undecodable metadata
    APPLICATION_ERROR,   // ERROR frame sent or received
    FILE_ERROR           // local file could not be opened, read or written
};

const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
};

struct TransferResult {
    TransferState state = TransferState::FAILED;
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    uint64_t bytes_transferred = 0;
    std::string path;

    bool ok() const { return state == TransferState::COMPLETED; }
};

class MessageSender {
public:
    // Writes one frame; nullopt on success
    static std::optional<Error> send(boost::asio::ip::tcp::socket& socket, const protocol::Message& message);
    static std::optional<Error> send_frame(boost::asio::ip::tcp::socket& socket, const protocol::Frame& frame);

    // Streams the file as FILE_DATA frames, waiting for an ACK after each one.
    // `bytes_sent` is updated as chunks are acknowledged.
    static std::optional<Error> send_file(boost::asio::ip::tcp::socket& socket, const std::string& filepath,
                                          std::size_t chunk_size, uint64_t& bytes_sent,
                                          const StatusCallback& on_status = nullptr);
};

class MessageReceiver {
public:
    // Reads until n bytes are collected or the stream ends; a short result means failure
    static std::vector<uint8_t> read_exact(boost::asio::ip::tcp::socket& socket, std::size_t n,
                                           boost::system::error_code& ec);

    // An incomplete header or payload is a TRANSPORT_FAILURE, an oversize
    // declared length a PROTOCOL_VIOLATION. The tag is not checked here.
    static std::optional<Error> receive_frame(boost::asio::ip::tcp::socket& socket, protocol::Frame& frame);

    // receive_frame plus decoding; unknown tags and bad metadata are PROTOCOL_VIOLATION
    static std::optional<Error> receive(boost::asio::ip::tcp::socket& socket, protocol::Message& message);

    // Reads the peer's response to a request: ACK text on success, the ERROR text as
    // APPLICATION_ERROR, anything else as PROTOCOL_VIOLATION
    static std::optional<Error> expect_ack(boost::asio::ip::tcp::socket& socket, std::string& ack_text);
};

enum class ReceiveState {
    AWAIT_INFO,
    READY,
    RECEIVING,
    COMPLETE,
    FAILED
};

// Runs one inbound session on an accepted connection: metadata, chunks, final
// verdict. The socket is closed when run() returns.
class FileReceiver {
public:
    FileReceiver(std::string receive_dir, StatusCallback on_status = nullptr);

    TransferResult run(boost::asio::ip::tcp::socket& socket);

    ReceiveState state() const { return state_; }

private:
    TransferResult receive(boost::asio::ip::tcp::socket& socket);
    void report(const std::string& message) const;
    void send_error(boost::asio::ip::tcp::socket& socket, const std::string& text);

    std::string receive_dir_;
    StatusCallback on_status_;
    ReceiveState state_ = ReceiveState::AWAIT_INFO;
};

} // namespace transfer
