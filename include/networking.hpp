#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <atomic>
#include <chrono>
#include <optional>
#include <boost/asio.hpp>
#include "transfer.hpp"
#include "protocol/packet.hpp"
#include "protocol/file_meta.hpp"

namespace networking {

using StatusCallback = transfer::StatusCallback;

// How long the accept loop blocks before re-checking the running flag
constexpr std::chrono::milliseconds ACCEPT_POLL_INTERVAL{200};

struct ServerCallbacks {
    StatusCallback on_status;
    std::function<void(const std::string&)> on_error;
};

struct ClientCallbacks {
    StatusCallback on_status;
    StatusCallback on_progress;   // per-chunk ACK text, e.g. "Received 4096/10000 bytes (41.0%)"
    std::function<void(const std::string&)> on_error;
};

// Accepts connections and runs one FileReceiver per connection on its own
// detached thread. Threads are neither bounded nor tracked.
class Server {
public:
    explicit Server(ServerCallbacks callbacks = {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Blocks until stop(). Returns false if the receive directory or the
    // listening socket could not be set up.
    bool start(const std::string& host, unsigned short port, const std::string& receive_dir);

    // Observed by the accept loop within one ACCEPT_POLL_INTERVAL; in-flight
    // sessions are not drained. Sticky: a stop() issued before or during
    // start() makes start() return without serving.
    void stop();

    bool is_running() const { return running_; }
    unsigned short local_port() const { return port_; }

private:
    void report(const std::string& message) const;
    void report_error(const std::string& message) const;

    ServerCallbacks callbacks_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<unsigned short> port_{0};
};

// Pushes files to a Server, one connection per file
class Client {
public:
    Client(std::string host, unsigned short port, ClientCallbacks callbacks = {},
           std::size_t chunk_size = protocol::CHUNK_SIZE);

    transfer::TransferResult send_file(const std::string& path);

    // Independent sessions; a failed file does not stop the rest
    std::vector<transfer::TransferResult> send_multiple_files(const std::vector<std::string>& paths);

private:
    std::optional<transfer::Error> transmit(boost::asio::ip::tcp::socket& socket, const std::string& path,
                                            const protocol::FileInfo& info, uint64_t& bytes_sent,
                                            std::string& final_text) const;
    transfer::TransferResult fail(transfer::TransferResult result, const transfer::Error& error) const;
    void report(const std::string& message) const;

    std::string host_;
    unsigned short port_;
    ClientCallbacks callbacks_;
    std::size_t chunk_size_;
};

} // namespace networking
