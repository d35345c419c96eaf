#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

#include "espanso/SignalRouter.hpp"

using namespace std::chrono_literals;

class SignalRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        espanso::SignalRouter::blockInCurrentThread({SIGUSR1, SIGUSR2});
    }
    void TearDown() override {
        auto& router = espanso::SignalRouter::instance();
        router.stop();
        router.unregisterHandler(SIGUSR1);
        router.unregisterHandler(SIGUSR2);
    }

    template <typename Pred>
    static bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(10ms);
        }
        return pred();
    }
};

TEST_F(SignalRouterTest, RealSignalReachesHandler) {
    auto& router = espanso::SignalRouter::instance();
    std::atomic<int> received{0};

    router.registerHandler(SIGUSR1, [&](int sig) { received = sig; });
    router.start();

    kill(getpid(), SIGUSR1);

    EXPECT_TRUE(waitFor([&] { return received.load() == SIGUSR1; }));
}

TEST_F(SignalRouterTest, MultipleHandlersForOneSignal) {
    auto& router = espanso::SignalRouter::instance();
    std::atomic<int> calls{0};

    router.registerHandler(SIGUSR2, [&](int) { ++calls; });
    router.registerHandler(SIGUSR2, [&](int) { ++calls; });
    router.start();

    kill(getpid(), SIGUSR2);

    EXPECT_TRUE(waitFor([&] { return calls.load() == 2; }));
}

TEST_F(SignalRouterTest, RejectsUncatchableSignals) {
    auto& router = espanso::SignalRouter::instance();
    EXPECT_THROW(router.registerHandler(SIGKILL, [](int) {}),
                 std::invalid_argument);
    EXPECT_THROW(router.registerHandler(0, [](int) {}), std::invalid_argument);
}

TEST_F(SignalRouterTest, DoubleStartIsIgnored) {
    auto& router = espanso::SignalRouter::instance();
    router.start();
    EXPECT_NO_THROW(router.start());
    EXPECT_TRUE(router.isRunning());
    router.stop();
    EXPECT_FALSE(router.isRunning());
}

TEST_F(SignalRouterTest, ConcurrentRegistration) {
    auto& router = espanso::SignalRouter::instance();

    std::thread t1([&] { router.registerHandler(SIGUSR1, [](int) {}); });
    std::thread t2([&] { router.registerHandler(SIGUSR2, [](int) {}); });
    t1.join();
    t2.join();

    router.start();
    router.stop();
}
