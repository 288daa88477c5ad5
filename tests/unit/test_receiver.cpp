#include <gtest/gtest.h>
#include "transfer.hpp"
#include "protocol/message.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <thread>

namespace fs = std::filesystem;
using boost::asio::ip::tcp;

// Plays the sending side by hand against a FileReceiver running on its own thread
class FileReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test_helpers::make_temp_dir(::testing::UnitTest::GetInstance()->current_test_info()->name());
        test_helpers::make_socket_pair(io_, peer_, session_);
    }

    void TearDown() override {
        // Unblocks the receiver if a failed assertion cut the exchange short
        boost::system::error_code close_ec;
        peer_.close(close_ec);
        if (receiver_thread_.joinable()) receiver_thread_.join();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void start_receiver() {
        receiver_thread_ = std::thread([this]() {
            transfer::FileReceiver receiver(dir_.string(), [this](const std::string& line) {
                status_lines_.push_back(line);
            });
            result_ = receiver.run(session_);
            final_state_ = receiver.state();
        });
    }

    transfer::TransferResult finish() {
        receiver_thread_.join();
        return result_;
    }

    void send(const protocol::Message& message) {
        auto err = transfer::MessageSender::send(peer_, message);
        ASSERT_FALSE(err) << err->message;
    }

    protocol::Message receive() {
        protocol::Message message;
        auto err = transfer::MessageReceiver::receive(peer_, message);
        EXPECT_FALSE(err) << (err ? err->message : "");
        return message;
    }

    std::string expect_ack() {
        protocol::Message message = receive();
        EXPECT_TRUE(std::holds_alternative<protocol::AckMessage>(message)) << protocol::describe(message);
        auto* ack = std::get_if<protocol::AckMessage>(&message);
        return ack ? ack->text : "";
    }

    std::string expect_error() {
        protocol::Message message = receive();
        EXPECT_TRUE(std::holds_alternative<protocol::ErrorMessage>(message)) << protocol::describe(message);
        auto* error = std::get_if<protocol::ErrorMessage>(&message);
        return error ? error->text : "";
    }

    void send_info(const std::string& name, uint64_t size) {
        send(protocol::FileInfoMessage{{name, size}});
    }

    void send_data(const std::vector<uint8_t>& data) {
        send(protocol::FileDataMessage{data});
    }

    fs::path dir_;
    boost::asio::io_context io_;
    tcp::socket peer_{io_};
    tcp::socket session_{io_};
    std::thread receiver_thread_;
    transfer::TransferResult result_;
    std::vector<std::string> status_lines_;   // read only after finish()
    transfer::ReceiveState final_state_ = transfer::ReceiveState::AWAIT_INFO;
};

// ============================================================
// Successful sessions
// ============================================================

TEST_F(FileReceiverTest, ReceivesChunksAndCountsBytes) {
    auto data = test_helpers::pattern_bytes(10000);
    start_receiver();

    send_info("data.bin", data.size());
    EXPECT_EQ(expect_ack(), "Ready to receive file");

    for (std::size_t off = 0; off < data.size(); off += 4096) {
        std::size_t n = std::min<std::size_t>(4096, data.size() - off);
        send_data(std::vector<uint8_t>(data.begin() + off, data.begin() + off + n));
        std::string progress = expect_ack();
        EXPECT_EQ(progress.rfind("Received " + std::to_string(off + n) + "/10000 bytes", 0), 0u) << progress;
    }
    EXPECT_EQ(expect_ack(), "File 'data.bin' received successfully");
    send(protocol::FileEndMessage{});

    auto result = finish();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(final_state_, transfer::ReceiveState::COMPLETE);
    EXPECT_EQ(result.bytes_transferred, data.size());
    EXPECT_EQ(test_helpers::read_file(dir_ / "data.bin"), data);
}

TEST_F(FileReceiverTest, ProgressTextShowsPercentage) {
    start_receiver();

    send_info("half.bin", 100);
    expect_ack();
    send_data(test_helpers::pattern_bytes(50));
    EXPECT_EQ(expect_ack(), "Received 50/100 bytes (50.0%)");
    send_data(test_helpers::pattern_bytes(50));
    EXPECT_EQ(expect_ack(), "Received 100/100 bytes (100.0%)");
    expect_ack();
    send(protocol::FileEndMessage{});

    EXPECT_TRUE(finish().ok());
}

TEST_F(FileReceiverTest, EmptyFile) {
    start_receiver();

    send_info("empty.txt", 0);
    expect_ack();
    EXPECT_EQ(expect_ack(), "File 'empty.txt' received successfully");
    send(protocol::FileEndMessage{});

    auto result = finish();
    EXPECT_TRUE(result.ok());
    ASSERT_TRUE(fs::exists(dir_ / "empty.txt"));
    EXPECT_EQ(fs::file_size(dir_ / "empty.txt"), 0u);
}

TEST_F(FileReceiverTest, EndMarkerBeforeDeclaredSizeKeepsShortFile) {
    start_receiver();

    send_info("short.bin", 100);
    expect_ack();
    send_data(test_helpers::pattern_bytes(50));
    expect_ack();
    send(protocol::FileEndMessage{});
    EXPECT_EQ(expect_ack(), "File 'short.bin' received successfully");

    auto result = finish();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.bytes_transferred, 50u);
    ASSERT_TRUE(fs::exists(dir_ / "short.bin"));
    EXPECT_EQ(fs::file_size(dir_ / "short.bin"), 50u);
}

TEST_F(FileReceiverTest, TraversalNameStaysInsideReceiveDir) {
    start_receiver();

    send_info("../../outside/evil.sh", 3);
    expect_ack();
    send_data({'a', 'b', 'c'});
    expect_ack();
    expect_ack();
    send(protocol::FileEndMessage{});

    auto result = finish();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(fs::path(result.path), dir_ / "evil.sh");
    EXPECT_TRUE(fs::exists(dir_ / "evil.sh"));
    EXPECT_NE(std::find(status_lines_.begin(), status_lines_.end(),
                        "Peer filename '../../outside/evil.sh' stored as 'evil.sh'"),
              status_lines_.end());
}

TEST_F(FileReceiverTest, CleanNameIsNotReportedAsRewritten) {
    start_receiver();

    send_info("plain.txt", 1);
    expect_ack();
    send_data({'x'});
    expect_ack();
    expect_ack();
    send(protocol::FileEndMessage{});

    ASSERT_TRUE(finish().ok());
    for (const auto& line : status_lines_) {
        EXPECT_EQ(line.find("Peer filename"), std::string::npos) << line;
    }
}

// ============================================================
// Failed sessions
// ============================================================

TEST_F(FileReceiverTest, DropMidTransferLeavesNoFile) {
    start_receiver();

    send_info("dropped.bin", 100);
    expect_ack();
    send_data(test_helpers::pattern_bytes(50));
    expect_ack();
    EXPECT_TRUE(fs::exists(dir_ / "dropped.bin"));
    peer_.close();

    auto result = finish();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(final_state_, transfer::ReceiveState::FAILED);
    EXPECT_EQ(result.error, transfer::ErrorKind::TRANSPORT_FAILURE);
    EXPECT_EQ(result.bytes_transferred, 50u);
    EXPECT_FALSE(fs::exists(dir_ / "dropped.bin"));
    EXPECT_EQ(test_helpers::count_files(dir_), 0u);
}

TEST_F(FileReceiverTest, FirstMessageMustBeFileInfo) {
    start_receiver();

    send_data({1, 2, 3});
    EXPECT_EQ(expect_error(), "Expected file info message");

    auto result = finish();
    EXPECT_EQ(result.error, transfer::ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(test_helpers::count_files(dir_), 0u);
}

TEST_F(FileReceiverTest, MalformedFileInfoIsRejected) {
    start_receiver();

    std::string junk = "{\"filename\": \"x\", ";
    auto err = transfer::MessageSender::send_frame(peer_, protocol::Frame{"INFO", {junk.begin(), junk.end()}});
    ASSERT_FALSE(err);
    EXPECT_EQ(expect_error().rfind("Failed to parse file info", 0), 0u);

    auto result = finish();
    EXPECT_EQ(result.error, transfer::ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(test_helpers::count_files(dir_), 0u);
}

TEST_F(FileReceiverTest, UnexpectedMessageDuringTransfer) {
    start_receiver();

    send_info("mixed.bin", 100);
    expect_ack();
    send_data(test_helpers::pattern_bytes(10));
    expect_ack();
    send(protocol::AckMessage{"not allowed here"});
    EXPECT_EQ(expect_error(), "Unexpected message type: ACK_");
    EXPECT_EQ(expect_error(), "File transfer incomplete");

    auto result = finish();
    EXPECT_EQ(result.error, transfer::ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_FALSE(fs::exists(dir_ / "mixed.bin"));
}

TEST_F(FileReceiverTest, OverrunOfDeclaredSizeFails) {
    start_receiver();

    send_info("over.bin", 10);
    expect_ack();
    send_data(test_helpers::pattern_bytes(20));
    expect_ack();
    EXPECT_EQ(expect_error(), "File transfer incomplete");

    auto result = finish();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, transfer::ErrorKind::APPLICATION_ERROR);
    EXPECT_FALSE(fs::exists(dir_ / "over.bin"));
}

TEST_F(FileReceiverTest, MissingReceiveDirectoryReportsError) {
    fs::remove_all(dir_);
    start_receiver();

    send_info("nowhere.bin", 5);
    EXPECT_EQ(expect_error(), "Cannot create destination file");

    auto result = finish();
    EXPECT_EQ(result.error, transfer::ErrorKind::FILE_ERROR);
}
