#include "espanso/LockFile.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace espanso {

std::filesystem::path LockFile::pathFor(
    const std::filesystem::path& runtimeDir, const std::string& name) {
    return runtimeDir / ("espanso-" + name + ".lock");
}

std::optional<LockFile> LockFile::tryAcquire(
    const std::filesystem::path& runtimeDir, const std::string& name) {
    auto lockPath = pathFor(runtimeDir, name);

    int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd == -1) {
        throw std::system_error(
            errno, std::system_category(),
            "LockFile: tryAcquire(): Failed to open lock file: " +
                lockPath.string());
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) == -1) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return std::nullopt;
        }
        throw std::system_error(err, std::system_category(),
                                "LockFile: tryAcquire(): flock failed on " +
                                    lockPath.string());
    }

    return LockFile(std::move(lockPath), fd);
}

LockFile::LockFile(std::filesystem::path path, int fd)
    : mPath(std::move(path)), mFd(fd) {}

LockFile::LockFile(LockFile&& other) noexcept
    : mPath(std::move(other.mPath)), mFd(other.mFd) {
    other.mFd = -1;
}

LockFile& LockFile::operator=(LockFile&& other) noexcept {
    if (this != &other) {
        release();
        mPath = std::move(other.mPath);
        mFd = other.mFd;
        other.mFd = -1;
    }
    return *this;
}

LockFile::~LockFile() { release(); }

void LockFile::release() noexcept {
    if (mFd != -1) {
        ::flock(mFd, LOCK_UN);
        ::close(mFd);
        mFd = -1;
    }
}

std::optional<LockFile> acquireDaemonLock(
    const std::filesystem::path& runtimeDir) {
    return LockFile::tryAcquire(runtimeDir, "daemon");
}

std::optional<LockFile> acquireWorkerLock(
    const std::filesystem::path& runtimeDir) {
    return LockFile::tryAcquire(runtimeDir, "worker");
}

}  // namespace espanso
