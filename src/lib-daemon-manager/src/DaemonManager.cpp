#include "espanso/DaemonManager.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>

namespace espanso {

namespace {

std::optional<pid_t> readPidFile(const std::filesystem::path& pidPath) {
    std::ifstream file(pidPath);
    if (!file) return std::nullopt;

    pid_t pid = 0;
    if (!(file >> pid) || pid <= 0) return std::nullopt;
    return pid;
}

bool isAlive(pid_t pid) {
    return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace

std::filesystem::path daemonPidPath(const std::filesystem::path& runtimeDir) {
    return runtimeDir / "espanso-daemon.pid";
}

DaemonManager::DaemonManager(const std::filesystem::path& pidPath)
    : mPidPath(std::filesystem::absolute(pidPath))
{
    removeStalePid();
}

DaemonManager::~DaemonManager() {
    cleanup();
}

void DaemonManager::daemonize() {
    // Первый fork
    if (pid_t pid = fork(); pid < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: daemonize(): First fork failed");
    } else if (pid > 0) {
        _exit(EXIT_SUCCESS);
    }

    if (setsid() < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: daemonize(): setsid failed");
    }

    // Второй fork
    if (pid_t pid = fork(); pid < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: daemonize(): Second fork failed");
    } else if (pid > 0) {
        _exit(EXIT_SUCCESS);
    }

    umask(022);
    if (chdir("/") < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: daemonize(): chdir failed");
    }

    // Воркер наследует стандартные дескрипторы: они должны оставаться валидными
    int devNull = open("/dev/null", O_RDWR);
    if (devNull < 0) {
        throw std::system_error(errno, std::system_category(), "DaemonManager: daemonize(): open /dev/null failed");
    }
    dup2(devNull, STDIN_FILENO);
    dup2(devNull, STDOUT_FILENO);
    dup2(devNull, STDERR_FILENO);
    if (devNull > STDERR_FILENO) close(devNull);
}

void DaemonManager::writePid() {
    std::ofstream file(mPidPath, std::ios::trunc);
    if (!file) {
        throw std::system_error(errno, std::system_category(),
            "DaemonManager: writePid(): Failed to open PID file: " + mPidPath.string());
    }
    file << getpid() << '\n';
    file.flush();
    if (!file) {
        throw std::system_error(errno, std::system_category(),
            "DaemonManager: writePid(): Failed to write PID file: " + mPidPath.string());
    }
    mPidWritten = true;

    if (chmod(mPidPath.c_str(), 0644) < 0) {
        throw std::system_error(errno, std::system_category(),
            "DaemonManager: writePid(): Failed to set PID file permissions");
    }
}

void DaemonManager::cleanup() noexcept {
    if (mPidWritten) {
        std::error_code ec;
        std::filesystem::remove(mPidPath, ec);
        mPidWritten = false;
    }
}

std::optional<pid_t> DaemonManager::readRunningPid(const std::filesystem::path& pidPath) {
    auto pid = readPidFile(pidPath);
    if (pid && isAlive(*pid)) return pid;
    return std::nullopt;
}

void DaemonManager::removeStalePid() noexcept {
    std::error_code ec;
    std::filesystem::remove(mPidPath, ec);
}

} // namespace espanso
