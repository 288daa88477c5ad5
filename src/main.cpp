#include <iostream>
#include <string>
#include <mutex>
#include <functional>
#include <thread>
#include <boost/asio.hpp>
#include "config.hpp"
#include "networking.hpp"

namespace {

// Never destroyed: detached session threads can still log while main returns
std::mutex& console_mutex() {
    static std::mutex* mutex = new std::mutex;
    return *mutex;
}

void print_status(const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cout << message << "\n";
}

void print_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cerr << message << "\n";
}

int run_server(const config::Config& cfg) {
    networking::Server server({print_status, print_error});

    // Ctrl+C / SIGTERM stop the server. The wait is re-armed so a signal during
    // startup does not leave later ones swallowed by the installed set.
    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    std::function<void(const boost::system::error_code&, int)> on_signal;
    on_signal = [&server, &signals, &on_signal](const boost::system::error_code& ec, int) {
        if (ec) return;
        print_status("\nShutting down server...");
        server.stop();
        signals.async_wait(on_signal);
    };
    signals.async_wait(on_signal);
    std::thread signal_thread([&signal_io]() { signal_io.run(); });

    print_status("Press Ctrl+C to stop the server");
    bool ok = server.start(cfg.host, cfg.port, cfg.receive_dir);

    signal_io.stop();
    signal_thread.join();
    return ok ? 0 : 1;
}

int run_client(const config::Config& cfg) {
    networking::ClientCallbacks callbacks;
    callbacks.on_status = print_status;
    callbacks.on_error = print_error;
    callbacks.on_progress = [](const std::string& text) {
        std::lock_guard<std::mutex> lock(console_mutex());
        std::cout << "\r" << text << std::flush;
    };

    networking::Client client(cfg.host, cfg.port, callbacks, cfg.chunk_size);

    if (cfg.files.size() == 1) {
        transfer::TransferResult result = client.send_file(cfg.files.front());
        std::cout << "\n";
        return result.ok() ? 0 : 1;
    }

    int failures = 0;
    for (const auto& result : client.send_multiple_files(cfg.files)) {
        if (!result.ok()) ++failures;
    }
    print_status(std::to_string(cfg.files.size() - failures) + "/" + std::to_string(cfg.files.size()) +
                 " files sent");
    return failures == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string program = argc > 0 ? argv[0] : "netdrop";

    config::Config cfg;
    std::string error;
    if (!config::parse_args(argc, argv, cfg, error)) {
        std::cerr << error << "\n\n" << config::usage(program);
        return 2;
    }
    if (cfg.show_help) {
        std::cout << config::usage(program);
        return 0;
    }

    try {
        if (cfg.mode == config::Mode::SERVE) {
            return run_server(cfg);
        }
        return run_client(cfg);
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
