#include "espanso/SignalRouter.hpp"

#include <sys/epoll.h>

namespace espanso {

SignalRouter::SignalRouter() {
    sigemptyset(&blocked_mask_);
    if (pthread_sigmask(SIG_SETMASK, nullptr, &original_mask_) != 0) {
        throw std::system_error(errno, std::system_category(),
                                "SignalRouter: sigprocmask(GET) failed");
    }
    signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ == -1) {
        throw std::system_error(errno, std::system_category(),
                                "SignalRouter: signalfd create failed");
    }
}

void SignalRouter::blockInCurrentThread(std::initializer_list<int> signals) {
    sigset_t mask;
    sigemptyset(&mask);
    for (int signum : signals) {
        sigaddset(&mask, signum);
    }
    if (int rc = pthread_sigmask(SIG_BLOCK, &mask, nullptr); rc != 0) {
        throw std::system_error(rc, std::system_category(),
                                "SignalRouter: pthread_sigmask failed");
    }
}

void SignalRouter::registerHandler(int signum, Handler handler) {
    if (signum <= 0 || signum >= NSIG || signum == SIGKILL ||
        signum == SIGSTOP) {
        throw std::invalid_argument("SignalRouter: Invalid signal number " +
                                    std::to_string(signum));
    }

    std::lock_guard<std::mutex> lock(handlers_mutex_);

    sigaddset(&blocked_mask_, signum);
    if (int rc = pthread_sigmask(SIG_BLOCK, &blocked_mask_, nullptr); rc != 0) {
        throw std::system_error(rc, std::system_category(),
                                "SignalRouter: pthread_sigmask failed");
    }

    if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
        throw std::system_error(errno, std::system_category(),
                                "SignalRouter: signalfd configure failed");
    }

    handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
    std::lock_guard lock(handlers_mutex_);
    handlers_.erase(signum);
}

void SignalRouter::start() {
    if (running_.exchange(true)) return;

    int epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd == -1) {
        running_ = false;
        throw std::system_error(errno, std::system_category(),
                                "SignalRouter: epoll_create1 failed");
    }

    struct epoll_event ev {};
    ev.events = EPOLLIN;
    ev.data.fd = signal_fd_;
    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, signal_fd_, &ev) == -1) {
        int err = errno;
        close(epoll_fd);
        running_ = false;
        throw std::system_error(err, std::system_category(),
                                "SignalRouter: epoll_ctl failed");
    }

    worker_thread_ = std::thread([this, epoll_fd] { processSignals(epoll_fd); });
}

void SignalRouter::processSignals(int epoll_fd) {
    constexpr int MAX_EVENTS = 10;
    struct epoll_event events[MAX_EVENTS];

    while (running_) {
        int nfds = epoll_wait(epoll_fd, events, MAX_EVENTS, 500);
        if (nfds == -1) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < nfds; ++i) {
            if (events[i].data.fd != signal_fd_) continue;

            struct signalfd_siginfo fdsi;
            while (read(signal_fd_, &fdsi, sizeof(fdsi)) == sizeof(fdsi)) {
                dispatch(static_cast<int>(fdsi.ssi_signo));
            }
        }
    }

    close(epoll_fd);
}

void SignalRouter::dispatch(int signum) {
    std::vector<Handler> handlers;
    {
        std::lock_guard lock(handlers_mutex_);
        if (auto it = handlers_.find(signum); it != handlers_.end()) {
            handlers = it->second;
        }
    }
    // Обработчики вызываются без блокировки: они могут логировать и
    // отправлять значения в канал.
    for (auto& handler : handlers) {
        handler(signum);
    }
}

void SignalRouter::stop() noexcept {
    running_ = false;
    if (worker_thread_.joinable() &&
        worker_thread_.get_id() != std::this_thread::get_id()) {
        worker_thread_.join();
    }
}

SignalRouter::~SignalRouter() {
    stop();
    if (worker_thread_.joinable()) {
        worker_thread_.detach();
    }
    close(signal_fd_);
    pthread_sigmask(SIG_SETMASK, &original_mask_, nullptr);
}

}  // namespace espanso
