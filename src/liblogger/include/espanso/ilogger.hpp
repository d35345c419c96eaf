/**
 * @file ilogger.hpp
 * @brief Базовый интерфейс логгеров и вспомогательные компоненты форматирования.
 *
 * @details
 * Демон и воркер пишут в один и тот же лог-файл в runtime-каталоге, поэтому
 * каждая строка помечается тегом процесса (`daemon:1234`, `worker:1240`).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace espanso {

enum class LogLevel {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR,
    LOG_CRITICAL
};

class TimeFormatter {
public:
    static bool setGlobalFormat(const std::string& fmt);

    static std::string format(const std::chrono::system_clock::time_point& tp);

private:
    inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

/**
 * @class ProcessTag
 * @brief Глобальная метка процесса, добавляемая к каждой строке лога.
 *
 * @note Устанавливается один раз при старте подкоманды (daemon/worker/stop).
 */
class ProcessTag {
public:
    static void set(const std::string& role);
    static std::string get();

private:
    inline static std::mutex mutex_;
    inline static std::string tag_;
};

class ILogger {
public:
    virtual void init(const LogLevel level) = 0;

    virtual void setLogLevel(LogLevel level) = 0;
    virtual LogLevel getLogLevel() const;

    virtual void debug(const std::string& message);
    virtual void info(const std::string& message);
    virtual void warning(const std::string& message);
    virtual void error(const std::string& message);
    virtual void critical(const std::string& message);

    virtual void flush() = 0;

    virtual ~ILogger() = default;

protected:
    std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
    virtual void log(LogLevel, const std::string&) = 0;
    virtual bool shouldSkipLog(LogLevel level) const = 0;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Разбирает имя уровня ("debug", "info", ...).
 * @throw std::invalid_argument Для неизвестного имени
 */
LogLevel stringToLogLevel(const std::string& level);

/// Строка вида `<время> [<тег>] [<УРОВЕНЬ>] <сообщение>` без перевода строки.
std::string formatLogLine(LogLevel level, const std::string& message);

}  // namespace espanso
