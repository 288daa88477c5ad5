#include "config.hpp"
#include <stdexcept>

namespace config {

namespace {

bool parse_number(const std::string& text, unsigned long max, unsigned long& value) {
    if (text.empty() || text[0] == '-' || text[0] == '+') return false;
    try {
        std::size_t consumed = 0;
        value = std::stoul(text, &consumed);
        return consumed == text.size() && value <= max;
    } catch (std::exception&) {
        return false;
    }
}

} // namespace

bool parse_args(int argc, char* argv[], Config& config, std::string& error) {
    if (argc < 2) {
        error = "Missing command";
        return false;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        config.show_help = true;
        return true;
    }
    if (command == "serve") {
        config.mode = Mode::SERVE;
    } else if (command == "send") {
        config.mode = Mode::SEND;
    } else {
        error = "Unknown command: " + command;
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }

        bool takes_value = (arg == "--host" || arg == "--port" || arg == "--receive-dir" ||
                            arg == "--chunk-size");
        if (takes_value && i + 1 >= argc) {
            error = "Missing value for " + arg;
            return false;
        }

        if (arg == "--host") {
            config.host = argv[++i];
        } else if (arg == "--port") {
            unsigned long port;
            if (!parse_number(argv[++i], 65535, port)) {
                error = "Invalid port: " + std::string(argv[i]);
                return false;
            }
            config.port = static_cast<unsigned short>(port);
        } else if (arg == "--receive-dir" && config.mode == Mode::SERVE) {
            config.receive_dir = argv[++i];
        } else if (arg == "--chunk-size" && config.mode == Mode::SEND) {
            unsigned long size;
            if (!parse_number(argv[++i], protocol::MAX_PAYLOAD_SIZE, size) || size == 0) {
                error = "Invalid chunk size: " + std::string(argv[i]);
                return false;
            }
            config.chunk_size = size;
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else if (config.mode == Mode::SEND) {
            config.files.push_back(arg);
        } else {
            error = "Unexpected argument: " + arg;
            return false;
        }
    }

    if (config.show_help) return true;

    if (config.mode == Mode::SEND) {
        if (config.files.empty()) {
            error = "No files to send";
            return false;
        }
        if (config.port == 0) {
            error = "Invalid port: 0";
            return false;
        }
    }
    return true;
}

std::string usage(const std::string& program) {
    return "Usage:\n"
           "  " + program + " serve [--host H] [--port P] [--receive-dir D]\n"
           "  " + program + " send  [--host H] [--port P] [--chunk-size N] FILE...\n"
           "\n"
           "Defaults: host " + std::string(DEFAULT_HOST) + ", port " + std::to_string(DEFAULT_PORT) +
           ", receive dir " + DEFAULT_RECEIVE_DIR + ", chunk size " + std::to_string(protocol::CHUNK_SIZE) + "\n";
}

} // namespace config
