#include "espanso/IpcChannel.hpp"

#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "espanso/compositelogger.hpp"

namespace espanso {

namespace {

sockaddr_un makeAddress(const std::filesystem::path& socketPath) {
    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    const std::string& raw = socketPath.native();
    if (raw.size() >= sizeof(addr.sun_path)) {
        throw std::length_error("IPC socket path is too long: " + raw);
    }
    std::memcpy(addr.sun_path, raw.c_str(), raw.size() + 1);
    return addr;
}

void writeAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::system_category(),
                                    "IpcClient: send failed");
        }
        sent += static_cast<size_t>(n);
    }
}

}  // namespace

std::filesystem::path endpointPath(const std::filesystem::path& runtimeDir,
                                   const std::string& endpoint) {
    return runtimeDir / (endpoint + ".sock");
}

// ---------------------------------------------------------------- IpcClient

IpcClient::IpcClient(const std::filesystem::path& runtimeDir,
                     std::string endpoint)
    : socketPath_(endpointPath(runtimeDir, endpoint)) {
    std::error_code ec;
    if (!std::filesystem::is_directory(runtimeDir, ec)) {
        throw std::system_error(
            ec ? ec : std::make_error_code(std::errc::not_a_directory),
            "IpcClient: runtime directory is not usable: " + runtimeDir.string());
    }
    makeAddress(socketPath_);
}

void IpcClient::send(const IpcEvent& event) const {
    sockaddr_un addr = makeAddress(socketPath_);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::system_category(),
                                "IpcClient: socket failed");
    }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw std::system_error(err, std::system_category(),
                                "IpcClient: unable to connect to " +
                                    socketPath_.string());
    }

    try {
        writeAll(fd, encodeLine(event));
    } catch (...) {
        ::close(fd);
        throw;
    }
    ::close(fd);
}

bool IpcClient::isPeerAbsent(const std::system_error& error) noexcept {
    if (error.code().category() != std::system_category()) return false;
    int value = error.code().value();
    return value == ENOENT || value == ECONNREFUSED;
}

// ---------------------------------------------------------------- IpcServer

IpcServer::IpcServer(const std::filesystem::path& runtimeDir,
                     std::string endpoint, Handler handler)
    : socketPath_(endpointPath(runtimeDir, endpoint)),
      endpoint_(std::move(endpoint)),
      handler_(std::move(handler)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
    if (running_.load()) return;

    sockaddr_un addr = makeAddress(socketPath_);

    listenFd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listenFd_ < 0) {
        throw std::system_error(errno, std::system_category(),
                                "IpcServer: socket failed");
    }

    ::unlink(socketPath_.c_str());

    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(listenFd_, 16) < 0) {
        int err = errno;
        ::close(listenFd_);
        listenFd_ = -1;
        throw std::system_error(err, std::system_category(),
                                "IpcServer: unable to bind " +
                                    socketPath_.string());
    }

    epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        int err = errno;
        ::close(listenFd_);
        listenFd_ = -1;
        throw std::system_error(err, std::system_category(),
                                "IpcServer: epoll_create1 failed");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = listenFd_;
    if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, listenFd_, &ev) < 0) {
        int err = errno;
        ::close(epollFd_);
        ::close(listenFd_);
        epollFd_ = listenFd_ = -1;
        throw std::system_error(err, std::system_category(),
                                "IpcServer: epoll_ctl failed");
    }

    running_ = true;
    thread_ = std::thread(&IpcServer::serveLoop, this);
    CompositeLogger::instance().info("IPC server listening on " +
                                     socketPath_.string());
}

void IpcServer::stop() noexcept {
    running_ = false;
    if (thread_.joinable()) {
        // Вызов из обработчика: цикл завершится сам и освободит ресурсы,
        // поток присоединит следующий stop() или деструктор
        if (thread_.get_id() == std::this_thread::get_id()) return;
        thread_.join();
    }
    releaseResources();
}

void IpcServer::releaseResources() noexcept {
    for (auto& [fd, buffer] : buffers_) {
        ::close(fd);
    }
    buffers_.clear();

    if (epollFd_ >= 0) {
        ::close(epollFd_);
        epollFd_ = -1;
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
        std::error_code ec;
        std::filesystem::remove(socketPath_, ec);
    }
}

void IpcServer::serveLoop() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int nfds = ::epoll_wait(epollFd_, events, MAX_EVENTS, 500);
        if (nfds < 0) {
            if (errno == EINTR) continue;
            CompositeLogger::instance().error(
                "IPC server " + endpoint_ +
                ": epoll_wait failed: " + std::string(std::strerror(errno)));
            running_ = false;
            break;
        }

        for (int i = 0; i < nfds && running_; ++i) {
            int fd = events[i].data.fd;
            if (fd == listenFd_) {
                acceptClients();
            } else if (!readClient(fd)) {
                closeClient(fd);
            }
        }
    }

    releaseResources();
}

void IpcServer::acceptClients() {
    while (true) {
        int client = ::accept4(listenFd_, nullptr, nullptr,
                               SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                CompositeLogger::instance().warning(
                    "IPC server " + endpoint_ +
                    ": accept failed: " + std::string(std::strerror(errno)));
            }
            return;
        }

        epoll_event ev{};
        ev.events = EPOLLIN | EPOLLRDHUP;
        ev.data.fd = client;
        if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, client, &ev) < 0) {
            ::close(client);
            continue;
        }
        buffers_[client];
    }
}

bool IpcServer::readClient(int fd) {
    char chunk[4096];
    auto& buffer = buffers_[fd];

    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
            size_t pos;
            while (running_ && (pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                dispatchLine(line);
            }
            if (buffer.size() > MAX_LINE_BYTES) {
                CompositeLogger::instance().warning(
                    "IPC server " + endpoint_ + ": dropping client, line too long");
                return false;
            }
            continue;
        }
        if (n == 0) {
            // Последняя строка без перевода строки тоже считается событием
            if (!buffer.empty()) {
                dispatchLine(buffer);
                buffer.clear();
            }
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

void IpcServer::closeClient(int fd) {
    ::epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
    ::close(fd);
    buffers_.erase(fd);
}

void IpcServer::dispatchLine(const std::string& line) {
    if (line.empty()) return;

    IpcEvent event;
    try {
        event = decodeLine(line);
    } catch (const std::invalid_argument& e) {
        CompositeLogger::instance().warning("IPC server " + endpoint_ +
                                            ": ignoring malformed event: " +
                                            e.what());
        return;
    }

    CompositeLogger::instance().debug("IPC server " + endpoint_ +
                                      ": received event " + toString(event.type));
    try {
        handler_(event);
    } catch (const std::exception& e) {
        CompositeLogger::instance().error("IPC server " + endpoint_ +
                                          ": event handler failed: " + e.what());
    }
}

}  // namespace espanso
