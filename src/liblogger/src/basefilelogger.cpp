#include "espanso/basefilelogger.hpp"

#include <chrono>
#include <iostream>

namespace espanso {

void BaseFileLogger::init(const LogLevel level) {
    setLogLevel(level);
    reopenFiles();
}

void BaseFileLogger::setLogLevel(LogLevel level) {
    currentLevel_.store(level, std::memory_order_release);
}

void BaseFileLogger::setRotationConfig(const RotationConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    rotationConfig_ = config;
}

RotationConfig BaseFileLogger::getRotationConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotationConfig_;
}

void BaseFileLogger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mainLogFile_.is_open()) mainLogFile_.flush();
    if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void BaseFileLogger::log(LogLevel level, const std::string& message) {
    if (shouldSkipLog(level)) return;

    std::string line = formatLogLine(level, message) + "\n";
    rotateIfNeeded(line);
    writeToFile(line);
}

bool BaseFileLogger::shouldSkipLog(LogLevel level) const {
    return static_cast<int>(level) <
           static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

void BaseFileLogger::reopenFiles() {
    std::lock_guard lock(mutex_);
    reopenFilesLocked();
}

void BaseFileLogger::reopenFilesLocked() {
    try {
        if (mainLogFile_.is_open()) {
            mainLogFile_.close();
        }
        if (fallbackLogFile_.is_open()) {
            fallbackLogFile_.close();
        }

        std::ios::openmode mode = std::ios::app;
        if (openMode_ == FileOpenMode::CLEAN_AND_APPEND && !cleaned_) {
            mode = std::ios::trunc | std::ios::out;
        }

        mainLogFile_.open(mainLogPath_, mode);
        if (mainLogFile_.is_open()) {
            cleaned_ = true;
            return;
        }

        std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_
                  << std::endl;
        fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
        if (!fallbackLogFile_.is_open()) {
            std::cerr << "[LOGGER ERROR] Cannot open fallback log file: "
                      << fallbackLogPath_ << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[LOGGER ERROR] Exception during file open: " << e.what()
                  << std::endl;
    }
}

void BaseFileLogger::writeLineLocked(const std::string& message,
                                     bool& warnedAboutFallback) {
    if (!mainLogFile_.is_open() && !fallbackLogFile_.is_open()) {
        reopenFilesLocked();
    }

    if (mainLogFile_.is_open()) {
        mainLogFile_ << message;
        warnedAboutFallback = false;
    } else if (fallbackLogFile_.is_open()) {
        if (!warnedAboutFallback) {
            std::cerr << "[LOGGER WARNING] Main log file unavailable, switching to "
                         "fallback log file: "
                      << fallbackLogPath_ << std::endl;
            warnedAboutFallback = true;
        }
        fallbackLogFile_ << message;
    } else {
        std::cerr << "[LOGGER ERROR] No log file is open for writing: " << message;
    }
}

void BaseFileLogger::rotateIfNeeded(const std::string& message) {
    namespace fs = std::filesystem;
    std::lock_guard lock(mutex_);
    try {
        if (!rotationConfig_.enabled || !mainLogFile_.is_open()) return;

        bool needRotate = false;
        if (rotationConfig_.type == RotationType::SIZE) {
            std::error_code ec;
            auto currentSize = fs::file_size(mainLogPath_, ec);
            if (!ec &&
                currentSize + message.size() > rotationConfig_.maxFileSizeBytes) {
                needRotate = true;
            }
        }
        if (rotationConfig_.type == RotationType::TIME) {
            auto now = std::chrono::system_clock::now();
            if (now - rotationConfig_.lastRotationTime >
                rotationConfig_.rotationInterval) {
                needRotate = true;
                rotationConfig_.lastRotationTime = now;
            }
        }
        if (!needRotate) return;

        mainLogFile_.close();

        // Переименование через временное имя: второй процесс, пишущий в тот же
        // файл, продолжит запись в уже архивный inode.
        std::string tempName = mainLogPath_ + ".rotating";
        fs::rename(mainLogPath_, tempName);

        mainLogFile_.open(mainLogPath_, std::ios::app);
        if (!mainLogFile_.is_open()) {
            std::cerr << "[LOGGER ERROR] Cannot open new log file after rotation: "
                      << mainLogPath_ << std::endl;
            return;
        }

        std::string rotatedName;
        if (rotationConfig_.type == RotationType::SIZE) {
            rotatedName = mainLogPath_ + ".1";
        } else {
            rotatedName = mainLogPath_ + "_" +
                          TimeFormatter::format(std::chrono::system_clock::now());
        }
        fs::rename(tempName, rotatedName);
    } catch (const std::exception& e) {
        std::cerr << "[LOGGER ERROR] Exception during log rotation: " << e.what()
                  << std::endl;
    }
}

void BaseFileLogger::setMainLogPath(const std::string& path) {
    {
        std::lock_guard lock(mutex_);
        if (mainLogPath_ == path && mainLogFile_.is_open()) return;
        mainLogPath_ = path;
        cleaned_ = false;
    }
    reopenFiles();
}

void BaseFileLogger::setFallbackLogPath(const std::string& path) {
    {
        std::lock_guard lock(mutex_);
        if (fallbackLogPath_ == path) return;
        fallbackLogPath_ = path;
    }
    reopenFiles();
}

void BaseFileLogger::setOpenMode(FileOpenMode mode) {
    std::lock_guard lock(mutex_);
    openMode_ = mode;
}

std::string BaseFileLogger::getMainLogPath() const {
    std::lock_guard lock(mutex_);
    return mainLogPath_;
}

std::string BaseFileLogger::getFallbackLogPath() const {
    std::lock_guard lock(mutex_);
    return fallbackLogPath_;
}

}  // namespace espanso
