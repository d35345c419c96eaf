#pragma once

#include "espanso/ilogger.hpp"
#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

namespace espanso {

/**
 * @class CompositeLogger
 * @brief Точка входа для логирования всех модулей: рассылает сообщения
 * по подключённым приёмникам (консоль, файлы).
 *
 * @note Приёмники подключаются при старте подкоманды, после этого
 * методы логирования могут вызываться из любых потоков (монитор воркера,
 * IPC-сервер, SignalRouter).
 */
class CompositeLogger : public ILogger {
public:
    static CompositeLogger& instance();

    CompositeLogger() = default;
    CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
        : loggers_(loggers) {}

    void addLogger(const std::shared_ptr<ILogger>& logger);

    /// Отключает все приёмники (используется при смене конфигурации логов).
    void clearLoggers();

    void init(const LogLevel level) override;

    void setLogLevel(LogLevel level) override;

    void flush() override;

    void debug(const std::string& message) override;
    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;
    void critical(const std::string& message) override;

protected:
    bool shouldSkipLog(LogLevel level) const override;
    void log(LogLevel level, const std::string& message) override;

private:
    std::vector<std::shared_ptr<ILogger>> snapshot() const;

    mutable std::mutex loggersMutex_;
    std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace espanso
