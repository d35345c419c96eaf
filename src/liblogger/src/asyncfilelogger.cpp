#include "espanso/asyncfilelogger.hpp"

#include <iostream>

namespace espanso {

AsyncFileLogger& AsyncFileLogger::instance() {
    static AsyncFileLogger instance;
    return instance;
}

AsyncFileLogger::AsyncFileLogger() {
    workerThread_ = std::thread(&AsyncFileLogger::processQueue, this);
}

AsyncFileLogger::~AsyncFileLogger() {
    running_ = false;
    queueCV_.notify_all();
    if (workerThread_.joinable()) {
        workerThread_.join();
    }
    BaseFileLogger::flush();
}

void AsyncFileLogger::writeToFile(const std::string& formattedMessage) {
    {
        std::lock_guard lock(queueMutex_);
        logQueue_.push(formattedMessage);
    }
    queueCV_.notify_one();
}

void AsyncFileLogger::flush() {
    {
        std::unique_lock lock(queueMutex_);
        flushRequested_ = true;
        queueCV_.notify_one();
        drainedCV_.wait_for(lock, std::chrono::seconds(2), [this] {
            return (logQueue_.empty() && !flushRequested_) || !running_;
        });
    }
    BaseFileLogger::flush();
}

void AsyncFileLogger::processQueue() {
    auto now = [] { return std::chrono::steady_clock::now(); };
    lastFlushTime_ = now();

    while (true) {
        bool forced = false;
        {
            std::unique_lock lock(queueMutex_);
            queueCV_.wait_for(lock, flushInterval_, [this] {
                return !logQueue_.empty() || flushRequested_ || !running_;
            });

            if (!running_ && logQueue_.empty()) break;

            while (!logQueue_.empty() && batchBuffer_.size() < maxBatchSize_) {
                batchBuffer_.push_back(std::move(logQueue_.front()));
                logQueue_.pop();
            }
            forced = flushRequested_ || !running_;
        }

        bool needsFlush = forced || batchBuffer_.size() >= maxBatchSize_ ||
                          (now() - lastFlushTime_) >= flushInterval_;

        if (!batchBuffer_.empty() && needsFlush) {
            flushBatch();
        }

        {
            std::lock_guard lock(queueMutex_);
            if (flushRequested_ && logQueue_.empty() && batchBuffer_.empty()) {
                flushRequested_ = false;
                drainedCV_.notify_all();
            }
        }
    }

    if (!batchBuffer_.empty()) {
        flushBatch();
    }
    drainedCV_.notify_all();
}

void AsyncFileLogger::flushBatch() {
    if (batchBuffer_.empty()) return;

    std::lock_guard fileLock(mutex_);
    try {
        for (const auto& msg : batchBuffer_) {
            writeLineLocked(msg, warnedAboutFallback_);
        }
        if (mainLogFile_.is_open()) mainLogFile_.flush();
        if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
    } catch (const std::exception& e) {
        std::cerr << "[LOGGER ERROR] Exception during async file write: "
                  << e.what() << std::endl;
    }
    batchBuffer_.clear();
    lastFlushTime_ = std::chrono::steady_clock::now();
}

void AsyncFileLogger::setFlushInterval(std::chrono::milliseconds interval) {
    std::lock_guard lock(queueMutex_);
    flushInterval_ = interval;
}

void AsyncFileLogger::setMaxBatchSize(size_t size) {
    std::lock_guard lock(queueMutex_);
    maxBatchSize_ = size;
}

}  // namespace espanso
