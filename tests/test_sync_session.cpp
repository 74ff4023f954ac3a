#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "test_helpers.hpp"
#include "../sync/client_session.hpp"
#include "../sync/server_mode.hpp"
#include "../sync/session_protocol.hpp"

using namespace testing_support;

namespace {

    class SyncSessionTest : public ::testing::Test {
    protected:
        void SetUp() override {
            config_.bufferSize = Config::MIN_BUFFER_SIZE;
            server_ = std::make_unique<ServerMode>(0, config_);
            Result<void> ready = server_->setupSocket();
            ASSERT_TRUE(ready.success) << ready.message;
            ASSERT_GT(server_->port(), 0);
        }

        void TearDown() override {
            if (serverThread_.joinable()) serverThread_.join();
        }

        void serve(size_t clients) {
            serverThread_ = std::thread([this, clients] { server_->acceptConnections(clients); });
        }

        TempDir dir_;
        SyncConfig config_;
        std::unique_ptr<ServerMode> server_;
        std::thread serverThread_;
    };

    Bytes edited(const Bytes& original, unsigned seed) {
        Bytes result = original;
        Bytes noise = randomBytes(300, seed);
        result.insert(result.begin() + static_cast<std::ptrdiff_t>(original.size() / 2), noise.begin(), noise.end());
        result.erase(result.begin(), result.begin() + 1000);
        return result;
    }
}

TEST_F(SyncSessionTest, PushUpdatesRemoteFile) {
    Bytes remote = randomBytes(30000, 1);
    Bytes local = edited(remote, 2);
    writeFile(dir_.file("remote"), remote);
    writeFile(dir_.file("local"), local);

    serve(1);
    ClientSession session("127.0.0.1", server_->port(), 1, config_);
    ASSERT_TRUE(session.connectToServer().success);
    EXPECT_TRUE(session.isConnected());

    Result<void> pushed = session.push(dir_.file("local"), dir_.file("remote"));
    ASSERT_TRUE(pushed.success) << pushed.message;
    EXPECT_FALSE(session.isConnected());
    serverThread_.join();

    EXPECT_EQ(readFile(dir_.file("remote")), local);
    EXPECT_EQ(readFile(dir_.file("local")), local);
}

TEST_F(SyncSessionTest, PullUpdatesLocalFile) {
    Bytes local = randomBytes(30000, 3);
    Bytes remote = edited(local, 4);
    writeFile(dir_.file("remote"), remote);
    writeFile(dir_.file("local"), local);

    serve(1);
    ClientSession session("127.0.0.1", server_->port(), 1, config_);
    ASSERT_TRUE(session.connectToServer().success);

    Result<void> pulled = session.pull(dir_.file("remote"), dir_.file("local"));
    ASSERT_TRUE(pulled.success) << pulled.message;
    serverThread_.join();

    EXPECT_EQ(readFile(dir_.file("local")), remote);
    EXPECT_EQ(readFile(dir_.file("remote")), remote);
}

TEST_F(SyncSessionTest, PushToMissingRemoteFails) {
    writeFile(dir_.file("local"), "content");

    serve(1);
    ClientSession session("127.0.0.1", server_->port(), 1, config_);
    ASSERT_TRUE(session.connectToServer().success);

    Result<void> pushed = session.push(dir_.file("local"), dir_.file("missing"));
    ASSERT_FALSE(pushed.success);
    EXPECT_NE(pushed.message.find("Remote file not found"), std::string::npos);
    serverThread_.join();
    EXPECT_FALSE(fs::exists(dir_.file("missing")));
}

TEST_F(SyncSessionTest, PushOfMissingLocalLeavesRemoteAlone) {
    writeFile(dir_.file("remote"), "remote content");

    serve(1);
    ClientSession session("127.0.0.1", server_->port(), 1, config_);
    ASSERT_TRUE(session.connectToServer().success);

    Result<void> pushed = session.push(dir_.file("missing"), dir_.file("remote"));
    ASSERT_FALSE(pushed.success);
    EXPECT_EQ(pushed.kind, ErrorKind::SourceNotFound);
    serverThread_.join();
    EXPECT_EQ(readFile(dir_.file("remote")), toBytes("remote content"));
}

TEST_F(SyncSessionTest, PullIntoMissingLocalFails) {
    writeFile(dir_.file("remote"), "remote content");

    serve(1);
    ClientSession session("127.0.0.1", server_->port(), 1, config_);
    ASSERT_TRUE(session.connectToServer().success);

    Result<void> pulled = session.pull(dir_.file("remote"), dir_.file("missing"));
    ASSERT_FALSE(pulled.success);
    EXPECT_EQ(pulled.kind, ErrorKind::SourceNotFound);
    serverThread_.join();
}

TEST_F(SyncSessionTest, ConcurrentClientsAreServed) {
    const int clients = 3;
    std::vector<Bytes> expected;
    for (int i = 0; i < clients; ++i) {
        Bytes remote = randomBytes(20000, 10 + i);
        Bytes local = edited(remote, 20 + i);
        writeFile(dir_.file("remote" + std::to_string(i)), remote);
        writeFile(dir_.file("local" + std::to_string(i)), local);
        expected.push_back(local);
    }

    serve(clients);
    std::vector<std::thread> threads;
    std::vector<Result<void>> results(clients);
    for (int i = 0; i < clients; ++i) {
        threads.emplace_back([this, i, &results] {
            ClientSession session("127.0.0.1", server_->port(), i, config_);
            results[i] = session.connectToServer();
            if (!results[i].success) return;
            results[i] = session.push(dir_.file("local" + std::to_string(i)), dir_.file("remote" + std::to_string(i)));
        });
    }
    for (auto& thread : threads) thread.join();
    serverThread_.join();

    for (int i = 0; i < clients; ++i) {
        ASSERT_TRUE(results[i].success) << results[i].message;
        EXPECT_EQ(readFile(dir_.file("remote" + std::to_string(i))), expected[i]);
    }
}

TEST_F(SyncSessionTest, UnknownCommandIsRejected) {
    serve(1);
    Result<Socket> raw = connectTo("127.0.0.1", server_->port());
    ASSERT_TRUE(raw.success) << raw.message;

    ASSERT_TRUE(SessionProtocol::sendText(raw.data.fd(), "SYNC").success);
    Result<StatusMessage> status = receiveStatus(raw.data.fd());
    ASSERT_TRUE(status.success) << status.message;
    EXPECT_FALSE(status.data.status);
    serverThread_.join();
}

TEST_F(SyncSessionTest, ClientDisconnectDoesNotStopServer) {
    writeFile(dir_.file("remote"), "remote content");
    writeFile(dir_.file("local"), "local content");

    serve(2);
    {
        Result<Socket> dropped = connectTo("127.0.0.1", server_->port());
        ASSERT_TRUE(dropped.success);
        ASSERT_TRUE(SessionProtocol::sendText(dropped.data.fd(), SessionProtocol::PUSH).success);
    }

    ClientSession session("127.0.0.1", server_->port(), 2, config_);
    ASSERT_TRUE(session.connectToServer().success);
    Result<void> pushed = session.push(dir_.file("local"), dir_.file("remote"));
    ASSERT_TRUE(pushed.success) << pushed.message;
    serverThread_.join();
    EXPECT_EQ(readFile(dir_.file("remote")), toBytes("local content"));
}

TEST(ClientSession, RequiresConnection) {
    ClientSession session("127.0.0.1", 1, 0);
    EXPECT_FALSE(session.isConnected());

    Result<void> pushed = session.push("a", "b");
    ASSERT_FALSE(pushed.success);
    EXPECT_EQ(pushed.kind, ErrorKind::InvalidState);
}

TEST(ClientSession, ConnectionRefused) {
    // bind and release a port so nothing listens on it
    int port = 0;
    {
        Result<Socket> listening = listenOn(0, 1);
        ASSERT_TRUE(listening.success);
        port = localPort(listening.data.fd()).data;
    }
    ClientSession session("127.0.0.1", port, 0);
    Result<void> connected = session.connectToServer();
    ASSERT_FALSE(connected.success);
    EXPECT_EQ(connected.kind, ErrorKind::ConnectionFailed);
}
