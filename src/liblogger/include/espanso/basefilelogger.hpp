#pragma once

#include "espanso/ilogger.hpp"
#include "espanso/irotatablelogger.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>

namespace espanso {

/**
 * @brief Режим открытия основного лог-файла.
 *
 * - APPEND           — дописывать в конец (воркер, команды stop/status)
 * - CLEAN_AND_APPEND — при первом открытии в процессе очистить файл, затем
 *                      дописывать (демон очищает лог прошлой сессии)
 */
enum class FileOpenMode { APPEND, CLEAN_AND_APPEND };

class BaseFileLogger : public ILogger, public IRotatableLogger {
public:
    void init(const LogLevel level) override;
    void setLogLevel(LogLevel level) override;
    void setRotationConfig(const RotationConfig& config) override;
    RotationConfig getRotationConfig() const override;
    void flush() override;
    void setMainLogPath(const std::string& path);
    void setFallbackLogPath(const std::string& path);
    void setOpenMode(FileOpenMode mode);
    std::string getMainLogPath() const;
    std::string getFallbackLogPath() const;

protected:
    BaseFileLogger() = default;
    ~BaseFileLogger() override = default;

    void log(LogLevel level, const std::string& message) override;
    virtual void writeToFile(const std::string& formattedMessage) = 0;

    /// Переоткрывает файлы; вызывать под захваченным mutex_.
    void reopenFilesLocked();
    void reopenFiles();
    void rotateIfNeeded(const std::string& message);

    /// Записывает строку в основной или резервный файл; под mutex_.
    void writeLineLocked(const std::string& message, bool& warnedAboutFallback);

    mutable std::mutex mutex_;
    std::ofstream mainLogFile_;
    std::ofstream fallbackLogFile_;
    std::string mainLogPath_ = "espanso.log";
    std::string fallbackLogPath_ = "espanso_fallback.log";
    FileOpenMode openMode_ = FileOpenMode::APPEND;
    bool cleaned_ = false;
    RotationConfig rotationConfig_;

private:
    bool shouldSkipLog(LogLevel level) const override;
};

}  // namespace espanso
