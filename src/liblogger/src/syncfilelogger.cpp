#include "espanso/syncfilelogger.hpp"

#include <iostream>

namespace espanso {

SyncFileLogger& SyncFileLogger::instance() {
    static SyncFileLogger instance;
    return instance;
}

void SyncFileLogger::writeToFile(const std::string& message) {
    std::lock_guard lock(mutex_);
    try {
        writeLineLocked(message, warnedAboutFallback_);
        if (mainLogFile_.is_open()) mainLogFile_.flush();
        if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
    } catch (const std::exception& e) {
        std::cerr << "[LOGGER ERROR] Exception during file write: " << e.what()
                  << std::endl;
    }
}

}  // namespace espanso
