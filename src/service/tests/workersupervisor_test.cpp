#include <gtest/gtest.h>
#include <pthread.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <thread>

#include "../include/workersupervisor.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

class WorkerSupervisorTest : public ::testing::Test {
protected:
    RuntimePaths paths() const {
        return RuntimePaths{dir_.path() / "config", dir_.path() / "packages",
                            dir_.path()};
    }

    WorkerSupervisor shell(const std::string &script) const {
        return WorkerSupervisor(WorkerCommand{"/bin/sh", {"-c", script}}, paths());
    }

    TempRuntimeDir dir_;
};

TEST_F(WorkerSupervisorTest, NonZeroExitIsForwarded) {
    auto [sender, receiver] = makeChannel<ExitCode>();
    pid_t pid = shell("exit 7").spawn(sender);
    EXPECT_GT(pid, 0);
    sender.reset();

    EXPECT_EQ(receiver.recv(), 7);
}

TEST_F(WorkerSupervisorTest, ZeroExitSendsNothing) {
    auto [sender, receiver] = makeChannel<ExitCode>();
    shell("exit 0").spawn(sender);
    sender.reset();

    // Монитор отпускает свою копию отправителя, ничего не отправив
    EXPECT_EQ(receiver.recv(), std::nullopt);
}

TEST_F(WorkerSupervisorTest, KilledBySignalSendsNothing) {
    auto [sender, receiver] = makeChannel<ExitCode>();
    shell("kill -9 $$").spawn(sender);
    sender.reset();

    EXPECT_EQ(receiver.recv(), std::nullopt);
}

TEST_F(WorkerSupervisorTest, DirectoriesAreInjected) {
    std::string script =
        "[ \"$ESPANSO_CONFIG_DIR\" = \"" + paths().configDir.string() +
        "\" ] && [ \"$ESPANSO_PACKAGE_DIR\" = \"" + paths().packageDir.string() +
        "\" ] && [ \"$ESPANSO_RUNTIME_DIR\" = \"" + paths().runtimeDir.string() +
        "\" ] && exit 11; exit 12";

    auto [sender, receiver] = makeChannel<ExitCode>();
    shell(script).spawn(sender);
    sender.reset();

    EXPECT_EQ(receiver.recv(), 11);
}

TEST_F(WorkerSupervisorTest, InheritedDirectoryVariablesAreReplaced) {
    char entry1[] = "ESPANSO_RUNTIME_DIR=/stale";
    char entry2[] = "PATH=/usr/bin";
    char *base[] = {entry1, entry2, nullptr};

    auto env = WorkerSupervisor::buildEnvironment(paths(), base);
    EXPECT_EQ(std::count(env.begin(), env.end(), "ESPANSO_RUNTIME_DIR=/stale"), 0);
    EXPECT_EQ(std::count(env.begin(), env.end(), "PATH=/usr/bin"), 1);
    EXPECT_EQ(std::count(env.begin(), env.end(),
                         "ESPANSO_RUNTIME_DIR=" + dir_.path().string()),
              1);
}

TEST_F(WorkerSupervisorTest, SignalMaskIsNotInherited) {
    sigset_t blocked, previous;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &blocked, &previous);

    auto [sender, receiver] = makeChannel<ExitCode>();
    // С заблокированным SIGTERM оболочка дошла бы до exit 3
    shell("kill -TERM $$; sleep 1; exit 3").spawn(sender);
    sender.reset();

    EXPECT_EQ(receiver.recv(), std::nullopt);
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
}

TEST_F(WorkerSupervisorTest, MissingExecutableThrows) {
    auto [sender, receiver] = makeChannel<ExitCode>();
    WorkerSupervisor supervisor(
        WorkerCommand{dir_.path() / "no-such-espanso", {"worker"}}, paths());
    EXPECT_THROW(supervisor.spawn(sender), std::system_error);
}

TEST_F(WorkerSupervisorTest, ClosedChannelOnlyAffectsMonitor) {
    auto channel = makeChannel<ExitCode>();
    ExitSender sender = channel.first;
    shell("sleep 0.1; exit 5").spawn(sender);
    {
        ExitReceiver dropped = std::move(channel.second);
    }
    // Монитор должен зафиксировать ошибку отправки и завершиться сам
    std::this_thread::sleep_for(300ms);
    EXPECT_FALSE(sender.send(1));
}
