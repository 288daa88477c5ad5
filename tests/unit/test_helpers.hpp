#pragma once

#include <boost/asio.hpp>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

namespace test_helpers {

namespace fs = std::filesystem;
using boost::asio::ip::tcp;

// Connected loopback pair; the kernel completes the handshake from the
// listen backlog, so this works on a single thread
inline void make_socket_pair(boost::asio::io_context& io, tcp::socket& client, tcp::socket& server) {
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    client.connect(acceptor.local_endpoint());
    acceptor.accept(server);
}

inline fs::path make_temp_dir(std::string name) {
    // Parameterized test names contain '/'
    for (auto& c : name) {
        if (c == '/') c = '_';
    }
    fs::path dir = fs::temp_directory_path() /
                   ("netdrop_" + name + "_" + std::to_string(getpid()));
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    return dir;
}

inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

inline std::vector<uint8_t> pattern_bytes(std::size_t n) {
    std::vector<uint8_t> data(n);
    for (std::size_t i = 0; i < n; i++) {
        data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

inline void write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<uint8_t> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::size_t count_files(const fs::path& dir) {
    std::size_t n = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file()) n++;
    }
    return n;
}

}  // namespace test_helpers
