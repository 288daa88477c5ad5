#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include "protocol/packet.hpp"

namespace config {

constexpr const char* DEFAULT_HOST = "localhost";
constexpr unsigned short DEFAULT_PORT = 8888;
constexpr const char* DEFAULT_RECEIVE_DIR = "received_files";

enum class Mode {
    NONE,
    SERVE,
    SEND
};

struct Config {
    Mode mode = Mode::NONE;
    std::string host = DEFAULT_HOST;
    unsigned short port = DEFAULT_PORT;
    std::string receive_dir = DEFAULT_RECEIVE_DIR;
    std::size_t chunk_size = protocol::CHUNK_SIZE;
    std::vector<std::string> files;
    bool show_help = false;
};

// netdrop serve [--host H] [--port P] [--receive-dir D]
// netdrop send  [--host H] [--port P] [--chunk-size N] FILE...
bool parse_args(int argc, char* argv[], Config& config, std::string& error);

std::string usage(const std::string& program);

} // namespace config
