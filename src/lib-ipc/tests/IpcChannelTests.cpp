#include <gtest/gtest.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>

#include "espanso/IpcChannel.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Сборщик событий, принятых сервером
class EventSink {
public:
    void push(const espanso::IpcEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        cv_.notify_all();
    }

    bool waitFor(size_t count, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout,
                            [&] { return events_.size() >= count; });
    }

    std::vector<espanso::IpcEvent> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<espanso::IpcEvent> events_;
};

// Запись сырых байт в сокет сервера в обход IpcClient
void writeRaw(const fs::path& socketPath, const std::string& data) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socketPath.c_str(), sizeof(addr.sun_path) - 1);
    ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::write(fd, data.data(), data.size()),
              static_cast<ssize_t>(data.size()));
    ::close(fd);
}

}  // namespace

class IpcChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Короткий путь: sun_path ограничен 108 байтами
        runtimeDir_ = fs::path("/tmp") /
                      ("esp_ipc_" + std::to_string(::getpid()) + "_" +
                       std::to_string(counter_++));
        fs::create_directories(runtimeDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(runtimeDir_, ec);
    }

    fs::path runtimeDir_;
    static inline int counter_ = 0;
};

TEST_F(IpcChannelTest, EndpointPathUsesSocketSuffix) {
    EXPECT_EQ(espanso::endpointPath(runtimeDir_, espanso::kDaemonEndpoint),
              runtimeDir_ / "espansodaemonv2.sock");
    EXPECT_EQ(espanso::endpointPath(runtimeDir_, espanso::kWorkerEndpoint),
              runtimeDir_ / "espansoworkerv2.sock");
}

TEST_F(IpcChannelTest, ExitEventReachesHandler) {
    EventSink sink;
    espanso::IpcServer server(runtimeDir_, espanso::kWorkerEndpoint,
                              [&](const espanso::IpcEvent& e) { sink.push(e); });
    server.start();
    EXPECT_TRUE(fs::exists(server.socketPath()));

    espanso::IpcClient client(runtimeDir_, espanso::kWorkerEndpoint);
    client.send(espanso::IpcEvent::exit());

    ASSERT_TRUE(sink.waitFor(1));
    EXPECT_EQ(sink.events().front(), espanso::IpcEvent::exit());
}

TEST_F(IpcChannelTest, SendWithoutServerReportsAbsentPeer) {
    espanso::IpcClient client(runtimeDir_, espanso::kWorkerEndpoint);
    try {
        client.send(espanso::IpcEvent::exit());
        FAIL() << "send must fail when nobody listens";
    } catch (const std::system_error& e) {
        EXPECT_TRUE(espanso::IpcClient::isPeerAbsent(e));
    }
}

TEST_F(IpcChannelTest, StaleSocketFileIsReportedAsAbsentPeer) {
    {
        espanso::IpcServer server(runtimeDir_, espanso::kDaemonEndpoint,
                                  [](const espanso::IpcEvent&) {});
        server.start();
    }
    // Оставляем файл без слушателя, как после аварийного завершения
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    auto path = espanso::endpointPath(runtimeDir_, espanso::kDaemonEndpoint);
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ::close(fd);
    ASSERT_TRUE(fs::exists(path));

    espanso::IpcClient client(runtimeDir_, espanso::kDaemonEndpoint);
    try {
        client.send(espanso::IpcEvent::exit());
        FAIL() << "send must fail on a stale socket";
    } catch (const std::system_error& e) {
        EXPECT_TRUE(espanso::IpcClient::isPeerAbsent(e));
    }

    // Новый сервер перехватывает оставшийся файл
    EventSink sink;
    espanso::IpcServer server(runtimeDir_, espanso::kDaemonEndpoint,
                              [&](const espanso::IpcEvent& e) { sink.push(e); });
    ASSERT_NO_THROW(server.start());
    client.send(espanso::IpcEvent::exitAllProcesses());
    ASSERT_TRUE(sink.waitFor(1));
    EXPECT_EQ(sink.events().front().type,
              espanso::IpcEventType::ExitAllProcesses);
}

TEST_F(IpcChannelTest, ClientRejectsMissingRuntimeDirectory) {
    EXPECT_THROW(espanso::IpcClient(runtimeDir_ / "missing",
                                    espanso::kDaemonEndpoint),
                 std::system_error);
}

TEST_F(IpcChannelTest, ServerBindFailureThrows) {
    espanso::IpcServer server(runtimeDir_ / "missing", espanso::kDaemonEndpoint,
                              [](const espanso::IpcEvent&) {});
    EXPECT_THROW(server.start(), std::system_error);
    EXPECT_FALSE(server.isRunning());
}

TEST_F(IpcChannelTest, ConcurrentClientsAreAllServed) {
    EventSink sink;
    espanso::IpcServer server(runtimeDir_, espanso::kDaemonEndpoint,
                              [&](const espanso::IpcEvent& e) { sink.push(e); });
    server.start();

    constexpr int kClients = 8;
    std::vector<std::thread> threads;
    for (int i = 0; i < kClients; ++i) {
        threads.emplace_back([&] {
            espanso::IpcClient client(runtimeDir_, espanso::kDaemonEndpoint);
            client.send(espanso::IpcEvent::exit());
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_TRUE(sink.waitFor(kClients));
    EXPECT_EQ(sink.events().size(), static_cast<size_t>(kClients));
}

TEST_F(IpcChannelTest, MalformedLinesAreSkipped) {
    EventSink sink;
    espanso::IpcServer server(runtimeDir_, espanso::kWorkerEndpoint,
                              [&](const espanso::IpcEvent& e) { sink.push(e); });
    server.start();

    writeRaw(server.socketPath(), "not json\n\"Reload\"\n{\"a\":1}\n\"Exit\"\n");

    ASSERT_TRUE(sink.waitFor(1));
    std::this_thread::sleep_for(100ms);
    ASSERT_EQ(sink.events().size(), 1u);
    EXPECT_EQ(sink.events().front(), espanso::IpcEvent::exit());
}

TEST_F(IpcChannelTest, EventsOnOneConnectionKeepOrder) {
    EventSink sink;
    espanso::IpcServer server(runtimeDir_, espanso::kDaemonEndpoint,
                              [&](const espanso::IpcEvent& e) { sink.push(e); });
    server.start();

    writeRaw(server.socketPath(),
             espanso::encodeLine(espanso::IpcEvent::exitAllProcesses()) +
                 espanso::encodeLine(espanso::IpcEvent::exit()));

    ASSERT_TRUE(sink.waitFor(2));
    auto events = sink.events();
    EXPECT_EQ(events[0].type, espanso::IpcEventType::ExitAllProcesses);
    EXPECT_EQ(events[1].type, espanso::IpcEventType::Exit);
}

TEST_F(IpcChannelTest, StopRemovesSocketFile) {
    espanso::IpcServer server(runtimeDir_, espanso::kWorkerEndpoint,
                              [](const espanso::IpcEvent&) {});
    server.start();
    ASSERT_TRUE(fs::exists(server.socketPath()));
    server.stop();
    EXPECT_FALSE(server.isRunning());
    EXPECT_FALSE(fs::exists(server.socketPath()));
}

TEST_F(IpcChannelTest, StopFromHandlerReleasesEndpoint) {
    EventSink sink;
    espanso::IpcServer* self = nullptr;
    espanso::IpcServer server(runtimeDir_, espanso::kDaemonEndpoint,
                              [&](const espanso::IpcEvent& event) {
                                  sink.push(event);
                                  self->stop();
                              });
    self = &server;
    server.start();

    espanso::IpcClient client(runtimeDir_, espanso::kDaemonEndpoint);
    client.send(espanso::IpcEvent::exit());
    ASSERT_TRUE(sink.waitFor(1));

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (fs::exists(server.socketPath()) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(fs::exists(server.socketPath()));
    EXPECT_FALSE(server.isRunning());

    try {
        client.send(espanso::IpcEvent::exit());
        FAIL() << "send() must fail once the server stopped itself";
    } catch (const std::system_error& e) {
        EXPECT_TRUE(espanso::IpcClient::isPeerAbsent(e));
    }

    server.stop();
    EXPECT_EQ(sink.events().size(), 1u);
}

TEST(IpcEventTest, WireFormatIsVariantName) {
    EXPECT_EQ(espanso::encodeLine(espanso::IpcEvent::exit()), "\"Exit\"\n");
    EXPECT_EQ(espanso::decodeLine("\"ExitAllProcesses\"").type,
              espanso::IpcEventType::ExitAllProcesses);
    EXPECT_THROW(espanso::decodeLine("\"Unknown\""), std::invalid_argument);
    EXPECT_THROW(espanso::decodeLine("{"), std::invalid_argument);
}
