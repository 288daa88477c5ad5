#include "networking.hpp"
#include "transfer.hpp"
#include "protocol/message.hpp"
#include "protocol/file_meta.hpp"
#include <iostream>
#include <boost/asio.hpp>
#include <thread>
#include <memory>
#include <filesystem>
#include <system_error>

using boost::asio::ip::tcp;

namespace networking {

namespace {

// An accepted connection with its own io_context, so the socket stays valid
// on the session thread after the acceptor's io_context is gone
struct Connection {
    boost::asio::io_context io_context;
    tcp::socket socket;

    Connection() : socket(io_context) {}
};

} // namespace

// ─── Server ─────────────────────────────────────────────────────────────────

Server::Server(ServerCallbacks callbacks) : callbacks_(std::move(callbacks)) {}

Server::~Server() {
    stop();
}

void Server::report(const std::string& message) const {
    if (callbacks_.on_status) {
        callbacks_.on_status(message);
    } else {
        std::cout << message << "\n";
    }
}

void Server::report_error(const std::string& message) const {
    if (callbacks_.on_error) {
        callbacks_.on_error(message);
    } else {
        std::cerr << message << "\n";
    }
}

bool Server::start(const std::string& host, unsigned short port, const std::string& receive_dir) {
    std::error_code fs_ec;
    std::filesystem::create_directories(receive_dir, fs_ec);
    if (fs_ec) {
        report_error("Cannot create receive directory " + receive_dir + ": " + fs_ec.message());
        return false;
    }

    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context);
    try {
        tcp::endpoint endpoint(tcp::v4(), port);
        if (!host.empty()) {
            tcp::resolver resolver(io_context);
            endpoint = *resolver.resolve(tcp::v4(), host, std::to_string(port)).begin();
        }
        acceptor.open(endpoint.protocol());
        acceptor.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();
    } catch (std::exception& e) {
        report_error(std::string("Server error: ") + e.what());
        return false;
    }

    port_ = acceptor.local_endpoint().port();

    // stop() may have landed while the socket was being set up
    if (stop_requested_) {
        boost::system::error_code ec;
        acceptor.close(ec);
        report("Server stopped before accepting connections");
        return true;
    }
    running_ = true;

    report("Server listening on " + host + ":" + std::to_string(port_.load()));
    report("Files will be saved to: " + std::filesystem::absolute(receive_dir, fs_ec).string());

    while (!stop_requested_) {
        auto connection = std::make_shared<Connection>();
        bool accepted = false;
        boost::system::error_code accept_ec;

        acceptor.async_accept(connection->socket, [&accepted, &accept_ec](const boost::system::error_code& ec) {
            accept_ec = ec;
            accepted = true;
        });

        // Wait for a connection in bounded slices so stop() is noticed
        while (!accepted && !stop_requested_) {
            io_context.run_one_for(ACCEPT_POLL_INTERVAL);
            if (io_context.stopped()) io_context.restart();
        }

        if (!accepted) {
            // Completes the pending accept with operation_aborted before its locals go away
            boost::system::error_code ec;
            acceptor.cancel(ec);
            io_context.restart();
            io_context.run();
            break;
        }

        if (accept_ec) {
            report_error("Accept error: " + accept_ec.message());
            continue;
        }

        boost::system::error_code ec;
        auto remote = connection->socket.remote_endpoint(ec);
        if (!ec) {
            report("New connection from " + remote.address().to_string() + ":" + std::to_string(remote.port()));
        }

        StatusCallback on_status = callbacks_.on_status;
        std::function<void(const std::string&)> on_error = callbacks_.on_error;
        try {
            std::thread([connection, receive_dir, on_status, on_error]() {
                try {
                    transfer::FileReceiver receiver(receive_dir, on_status);
                    transfer::TransferResult result = receiver.run(connection->socket);
                    if (!result.ok() && on_error) {
                        on_error("Receive failed (" + std::string(transfer::to_string(result.error)) +
                                 "): " + result.message);
                    }
                } catch (std::exception& e) {
                    if (on_error) {
                        on_error(std::string("Error handling client: ") + e.what());
                    } else {
                        std::cerr << "Error handling client: " << e.what() << "\n";
                    }
                }
            }).detach();
        } catch (std::system_error& e) {
            report_error(std::string("Could not start session thread: ") + e.what());
        }
    }

    boost::system::error_code ec;
    acceptor.close(ec);
    if (ec) {
        report_error("Error closing listening socket: " + ec.message());
    }
    running_ = false;
    report("Server stopped");
    return true;
}

void Server::stop() {
    stop_requested_ = true;
    running_ = false;
}

// ─── Client ─────────────────────────────────────────────────────────────────

Client::Client(std::string host, unsigned short port, ClientCallbacks callbacks, std::size_t chunk_size)
    : host_(std::move(host)), port_(port), callbacks_(std::move(callbacks)),
      chunk_size_(chunk_size == 0 ? protocol::CHUNK_SIZE : chunk_size) {}

void Client::report(const std::string& message) const {
    if (callbacks_.on_status) {
        callbacks_.on_status(message);
    } else {
        std::cout << message << "\n";
    }
}

transfer::TransferResult Client::fail(transfer::TransferResult result, const transfer::Error& error) const {
    result.state = transfer::TransferState::FAILED;
    result.error = error.kind;
    result.message = error.message;
    if (callbacks_.on_error) {
        callbacks_.on_error(error.message);
    } else {
        std::cerr << error.message << "\n";
    }
    return result;
}

std::optional<transfer::Error> Client::transmit(tcp::socket& socket, const std::string& path,
                                                const protocol::FileInfo& info, uint64_t& bytes_sent,
                                                std::string& final_text) const {
    if (auto err = transfer::MessageSender::send(socket, protocol::FileInfoMessage{info})) return err;

    std::string ready_text;
    if (auto err = transfer::MessageReceiver::expect_ack(socket, ready_text)) return err;
    report("Server ready: " + ready_text);

    if (auto err = transfer::MessageSender::send_file(socket, path, chunk_size_, bytes_sent,
                                                      callbacks_.on_progress)) {
        return err;
    }

    if (auto err = transfer::MessageSender::send(socket, protocol::FileEndMessage{})) return err;

    return transfer::MessageReceiver::expect_ack(socket, final_text);
}

transfer::TransferResult Client::send_file(const std::string& path) {
    transfer::TransferResult result;
    result.path = path;

    std::error_code fs_ec;
    if (!std::filesystem::exists(path, fs_ec)) {
        return fail(result, {transfer::ErrorKind::FILE_ERROR, "File not found: " + path});
    }
    if (!std::filesystem::is_regular_file(path, fs_ec)) {
        return fail(result, {transfer::ErrorKind::FILE_ERROR, "Path is not a file: " + path});
    }
    uint64_t filesize = std::filesystem::file_size(path, fs_ec);
    if (fs_ec) {
        return fail(result, {transfer::ErrorKind::FILE_ERROR,
                             "Cannot determine size of " + path + ": " + fs_ec.message()});
    }
    protocol::FileInfo info{std::filesystem::path(path).filename().string(), filesize};

    report("Connecting to " + host_ + ":" + std::to_string(port_) + "...");

    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    tcp::resolver resolver(io_context);
    boost::system::error_code ec;

    auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec) {
        return fail(result, {transfer::ErrorKind::TRANSPORT_FAILURE,
                             "Cannot resolve " + host_ + ": " + ec.message()});
    }
    boost::asio::connect(socket, endpoints, ec);
    if (ec) {
        return fail(result, {transfer::ErrorKind::TRANSPORT_FAILURE, "Connection error: " + ec.message()});
    }
    report("Connected! Sending file: " + info.filename + " (" + std::to_string(filesize) + " bytes)");

    std::string final_text;
    std::optional<transfer::Error> err = transmit(socket, path, info, result.bytes_transferred, final_text);

    socket.close(ec);
    if (ec) {
        report("Error closing connection: " + ec.message());
    }
    report("Connection closed.");

    if (err) {
        return fail(result, *err);
    }

    result.state = transfer::TransferState::COMPLETED;
    result.message = final_text;
    report(final_text);
    return result;
}

std::vector<transfer::TransferResult> Client::send_multiple_files(const std::vector<std::string>& paths) {
    std::vector<transfer::TransferResult> results;
    results.reserve(paths.size());

    for (const auto& path : paths) {
        report(std::string(50, '='));
        transfer::TransferResult result = send_file(path);
        if (result.ok()) {
            report("Successfully sent: " + path);
        } else {
            report("Failed to send " + path + ": " + result.message);
        }
        results.push_back(std::move(result));
    }
    return results;
}

} // namespace networking
