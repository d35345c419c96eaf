#pragma once
#include "espanso/basefilelogger.hpp"

namespace espanso {

/// Синхронная запись: каждая строка сбрасывается на диск сразу, чтобы
/// сообщение о фатальной ошибке не терялось при немедленном выходе.
class SyncFileLogger : public BaseFileLogger {
public:
    static SyncFileLogger& instance();

protected:
    void writeToFile(const std::string& message) override;

private:
    SyncFileLogger() = default;
    bool warnedAboutFallback_ = false;
};

}  // namespace espanso
