#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>

#include "espanso/LockFile.hpp"

namespace fs = std::filesystem;

class LockFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtimeDir_ = fs::temp_directory_path() /
                      ("espanso_lock_test_" +
                       std::to_string(std::chrono::steady_clock::now()
                                          .time_since_epoch()
                                          .count()));
        fs::create_directories(runtimeDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(runtimeDir_, ec);
    }

    fs::path runtimeDir_;
};

TEST_F(LockFileTest, AcquireCreatesNamedFile) {
    auto lock = espanso::acquireDaemonLock(runtimeDir_);
    ASSERT_TRUE(lock.has_value());
    EXPECT_EQ(lock->path(), runtimeDir_ / "espanso-daemon.lock");
    EXPECT_TRUE(fs::exists(lock->path()));
}

TEST_F(LockFileTest, SecondAcquireIsDeniedWhileHeld) {
    auto first = espanso::acquireWorkerLock(runtimeDir_);
    ASSERT_TRUE(first.has_value());

    auto second = espanso::acquireWorkerLock(runtimeDir_);
    EXPECT_FALSE(second.has_value());
}

TEST_F(LockFileTest, ReleaseOnScopeExitUnblocksNextAcquirer) {
    {
        auto held = espanso::acquireWorkerLock(runtimeDir_);
        ASSERT_TRUE(held.has_value());
    }
    auto next = espanso::acquireWorkerLock(runtimeDir_);
    EXPECT_TRUE(next.has_value());
}

TEST_F(LockFileTest, ExplicitReleaseUnblocksExactlyOneAcquirer) {
    auto held = espanso::acquireWorkerLock(runtimeDir_);
    ASSERT_TRUE(held.has_value());
    held->release();

    auto next = espanso::acquireWorkerLock(runtimeDir_);
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(espanso::acquireWorkerLock(runtimeDir_).has_value());
}

TEST_F(LockFileTest, DaemonAndWorkerLocksAreIndependent) {
    auto daemon = espanso::acquireDaemonLock(runtimeDir_);
    auto worker = espanso::acquireWorkerLock(runtimeDir_);
    EXPECT_TRUE(daemon.has_value());
    EXPECT_TRUE(worker.has_value());
}

TEST_F(LockFileTest, MovedHandleKeepsOwnership) {
    auto held = espanso::acquireDaemonLock(runtimeDir_);
    ASSERT_TRUE(held.has_value());

    espanso::LockFile moved = std::move(*held);
    held.reset();
    EXPECT_FALSE(espanso::acquireDaemonLock(runtimeDir_).has_value());
}

TEST_F(LockFileTest, LockHeldByAnotherProcessIsDenied) {
    int ready[2];
    ASSERT_EQ(pipe(ready), 0);

    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        close(ready[0]);
        auto lock = espanso::acquireDaemonLock(runtimeDir_);
        char byte = lock ? '1' : '0';
        if (write(ready[1], &byte, 1) != 1) _exit(2);
        usleep(300 * 1000);
        _exit(0);
    }

    close(ready[1]);
    char byte = 0;
    ASSERT_EQ(read(ready[0], &byte, 1), 1);
    close(ready[0]);
    ASSERT_EQ(byte, '1');

    EXPECT_FALSE(espanso::acquireDaemonLock(runtimeDir_).has_value());

    int status = 0;
    waitpid(child, &status, 0);
    EXPECT_TRUE(espanso::acquireDaemonLock(runtimeDir_).has_value());
}

TEST_F(LockFileTest, MissingRuntimeDirectoryThrows) {
    EXPECT_THROW(espanso::acquireDaemonLock(runtimeDir_ / "missing"),
                 std::system_error);
}
