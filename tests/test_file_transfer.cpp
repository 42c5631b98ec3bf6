#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include "test_support.hpp"
#include "tether/error.hpp"
#include "tether/transfer/file_transfer.hpp"

using namespace tether;
using namespace tether::transfer;
using namespace tether::test_support;
namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> random_bytes(std::size_t size, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> out(size);
    for (auto& b : out) {
        b = static_cast<uint8_t>(rng());
    }
    return out;
}

void write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

ErrorKind fetch_failure(networking::Connection& connection, const std::string& remote, const std::string& local) {
    try {
        fetch_file(connection, remote, local);
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "fetch of " << remote << " succeeded unexpectedly";
    return ErrorKind::Encoding;
}

class FileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() /
                ("tether_transfer_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(base_);
        remote_root_ = base_ / "remote";
        local_root_ = base_ / "local";
        fs::create_directories(remote_root_);
        fs::create_directories(local_root_);

        TransferConfig config;
        config.chunk_size = 16 * 1024;
        service_ = std::make_unique<FileService>(remote_root_.string(), pool_, config);
        service_->register_with(router_);

        auto transports = local_transport_pair(io_.io());
        controller_ = networking::Connection::create(std::move(transports.first), networking::Role::Initiator,
                                                     test_config(), controller_events_.callbacks());
        target_ = networking::Connection::create(std::move(transports.second), networking::Role::Acceptor,
                                                 test_config(), target_events_.callbacks());
        target_->on_inbound_command(std::cref(router_));
        target_->start();
        controller_->start();
        ASSERT_TRUE(controller_events_.wait([](Events& e) { return e.connected == 1; }));
    }

    void TearDown() override {
        controller_->abort(Error(ErrorKind::ConnectionLost, "test finished"));
        pool_.join();
        io_.stop();
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    TransferConfig fetch_config() const {
        TransferConfig config;
        config.chunk_size = 16 * 1024;
        return config;
    }

    IoThread io_;
    boost::asio::thread_pool pool_{2};
    protocol::CommandRouter router_;
    std::unique_ptr<FileService> service_;
    Events controller_events_;
    Events target_events_;
    std::shared_ptr<networking::Connection> controller_;
    std::shared_ptr<networking::Connection> target_;
    fs::path base_;
    fs::path remote_root_;
    fs::path local_root_;
};

} // namespace

TEST_F(FileTransferTest, FreshDownloadMatchesSource) {
    auto content = random_bytes(200 * 1024 + 123, 11);
    write_file(remote_root_ / "logs" / "app.log", content);
    const fs::path local = local_root_ / "nested" / "app.log";

    uint64_t last_done = 0;
    uint64_t last_total = 0;
    auto progress = [&](const std::string&, uint64_t done, uint64_t total) {
        last_done = done;
        last_total = total;
    };
    auto state = fetch_file(*controller_, "logs/app.log", local.string(), fetch_config(), progress);

    EXPECT_EQ(state, TransferState::COMPLETED);
    EXPECT_EQ(read_file(local), content);
    EXPECT_FALSE(fs::exists(local.string() + ".part"));
    EXPECT_EQ(last_done, content.size());
    EXPECT_EQ(last_total, content.size());
}

TEST_F(FileTransferTest, EmptyFileTransfers) {
    write_file(remote_root_ / "empty.txt", {});
    const fs::path local = local_root_ / "empty.txt";
    EXPECT_EQ(fetch_file(*controller_, "empty.txt", local.string(), fetch_config()), TransferState::COMPLETED);
    EXPECT_TRUE(fs::exists(local));
    EXPECT_EQ(fs::file_size(local), 0u);
}

TEST_F(FileTransferTest, RedownloadSendsOnlyChangedChunks) {
    auto content = random_bytes(1024 * 1024, 12);
    write_file(remote_root_ / "disk.img", content);
    const fs::path local = local_root_ / "disk.img";
    ASSERT_EQ(fetch_file(*controller_, "disk.img", local.string(), fetch_config()), TransferState::COMPLETED);

    content[500 * 1024] ^= 0x5A;
    write_file(remote_root_ / "disk.img", content);

    const uint64_t before = target_->link_stats().total_bytes();
    ASSERT_EQ(fetch_file(*controller_, "disk.img", local.string(), fetch_config()), TransferState::COMPLETED);
    const uint64_t sent = target_->link_stats().total_bytes() - before;

    EXPECT_EQ(read_file(local), content);
    EXPECT_LT(sent, 128u * 1024);
}

TEST_F(FileTransferTest, MissingFileIsRemoteFailure) {
    const fs::path local = local_root_ / "ghost.txt";
    EXPECT_EQ(fetch_failure(*controller_, "ghost.txt", local.string()), ErrorKind::RemoteFailure);
    EXPECT_FALSE(fs::exists(local));
    EXPECT_FALSE(fs::exists(local.string() + ".part"));
    EXPECT_EQ(controller_->state(), networking::ConnectionState::Active);
}

TEST_F(FileTransferTest, PathsOutsideRootAreRefused) {
    write_file(base_ / "secret.txt", random_bytes(16, 13));
    EXPECT_THROW(service_->resolve("../secret.txt"), Error);
    EXPECT_THROW(service_->resolve("a/../../secret.txt"), Error);
    EXPECT_NO_THROW(service_->resolve("/logs/app.log"));
    EXPECT_EQ(fetch_failure(*controller_, "../secret.txt", (local_root_ / "secret.txt").string()),
              ErrorKind::RemoteFailure);
}

TEST(FileReceiver, HashMismatchKeepsTheOldTarget) {
    const fs::path dir = fs::temp_directory_path() / "tether_receiver_mismatch";
    fs::remove_all(dir);
    const fs::path target = dir / "config.ini";
    write_file(target, bytes("old contents"));

    FileReceiver receiver(target.string());
    TransferHeader header{"config.ini", 3, 16, 1};
    nlohmann::json header_json = header;
    receiver.on_fragment(protocol::Packet(protocol::MessageKind::Response, 1, bytes(header_json.dump()),
                                          protocol::flags::kStreaming));

    DeltaOp op;
    op.length = 3;
    op.data = bytes("new");
    receiver.on_fragment(protocol::Packet(protocol::MessageKind::Response, 1, encode_op(op),
                                          protocol::flags::kStreaming | protocol::flags::kChunked));
    EXPECT_EQ(receiver.bytes_written(), 3u);
    EXPECT_TRUE(fs::exists(receiver.part_path()));

    TransferVerification wrong{security::to_hex(security::hash(bytes("not new"))), 3};
    nlohmann::json wrong_json = wrong;
    protocol::Packet terminal(protocol::MessageKind::Response, 1, bytes(wrong_json.dump()),
                              protocol::flags::kStreaming | protocol::flags::kLastChunk);
    try {
        receiver.finish(terminal);
        ADD_FAILURE() << "mismatched hash was accepted";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::FileIntegrityFailed);
    }
    EXPECT_FALSE(fs::exists(receiver.part_path()));
    EXPECT_EQ(text(read_file(target)), "old contents");
    fs::remove_all(dir);
}

TEST(FileReceiver, CopyWithoutPriorVersionIsRejected) {
    const fs::path dir = fs::temp_directory_path() / "tether_receiver_copy";
    fs::remove_all(dir);
    FileReceiver receiver((dir / "fresh.bin").string());
    nlohmann::json header_json = TransferHeader{"fresh.bin", 16, 16, 1};
    receiver.on_fragment(protocol::Packet(protocol::MessageKind::Response, 1, bytes(header_json.dump()),
                                          protocol::flags::kStreaming));

    DeltaOp copy;
    copy.type = DeltaOpType::Copy;
    copy.length = 16;
    EXPECT_THROW(receiver.on_fragment(protocol::Packet(protocol::MessageKind::Response, 1, encode_op(copy),
                                                       protocol::flags::kStreaming | protocol::flags::kChunked)),
                 Error);
    receiver.discard();
    EXPECT_FALSE(fs::exists(receiver.part_path()));
    fs::remove_all(dir);
}

TEST(FileReceiver, FragmentsAfterDiscardLeaveNoPartialFile) {
    const fs::path dir = fs::temp_directory_path() / "tether_receiver_discard";
    fs::remove_all(dir);
    FileReceiver receiver((dir / "late.bin").string());
    receiver.discard();

    nlohmann::json header_json = TransferHeader{"late.bin", 4, 16, 1};
    receiver.on_fragment(protocol::Packet(protocol::MessageKind::Response, 1, bytes(header_json.dump()),
                                          protocol::flags::kStreaming));
    EXPECT_FALSE(fs::exists(receiver.part_path()));
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_EQ(receiver.bytes_written(), 0u);
    fs::remove_all(dir);
}
