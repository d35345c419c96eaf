#pragma once

#include "espanso/basefilelogger.hpp"

#include <condition_variable>
#include <queue>
#include <thread>
#include <vector>

namespace espanso {

/**
 * @class AsyncFileLogger
 * @brief Файловый логгер с фоновым потоком записи и пакетным сбросом.
 *
 * @details Сообщения копятся в очереди и пишутся пачками по размеру
 * (`maxBatchSize_`) или по таймеру (`flushInterval_`). `flush()` дожидается,
 * пока очередь опустеет, и сбрасывает файл на диск.
 */
class AsyncFileLogger : public BaseFileLogger {
public:
    static AsyncFileLogger& instance();

    void setFlushInterval(std::chrono::milliseconds interval);
    void setMaxBatchSize(size_t size);
    void flush() override;

protected:
    void writeToFile(const std::string& formattedMessage) override;
    void flushBatch();

private:
    AsyncFileLogger();
    ~AsyncFileLogger() override;
    void processQueue();

    std::vector<std::string> batchBuffer_;
    std::chrono::steady_clock::time_point lastFlushTime_;
    std::chrono::milliseconds flushInterval_{100};
    size_t maxBatchSize_{100};
    std::queue<std::string> logQueue_;
    std::mutex queueMutex_;
    std::condition_variable queueCV_;
    std::condition_variable drainedCV_;
    bool flushRequested_ = false;
    std::thread workerThread_;
    std::atomic<bool> running_{true};
    bool warnedAboutFallback_ = false;
};

}  // namespace espanso
