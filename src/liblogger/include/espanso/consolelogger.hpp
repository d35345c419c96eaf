#pragma once

#include "espanso/ilogger.hpp"

#define ANSI_COLOR_RESET "\033[0m"

namespace espanso {

/**
 * @class ConsoleLogger
 * @brief Вывод лога в stdout с цветовой разметкой уровней.
 *
 * @note Цвета выводятся только если stdout подключён к терминалу, поэтому
 * после демонизации (stdout -> /dev/null) и в тестах строки остаются чистыми.
 */
class ConsoleLogger : public ILogger {
public:
    static ConsoleLogger& instance();

    void init(const LogLevel level) override;
    void setLogLevel(LogLevel level) override;
    void flush() override;

protected:
    ConsoleLogger() = default;
    ~ConsoleLogger() override = default;
    void log(LogLevel level, const std::string& message) override;
    bool shouldSkipLog(LogLevel level) const override;

private:
    const char* colorFor(LogLevel level) const;
    mutable std::mutex mutex_;
};

}  // namespace espanso
