/**
 * @file IpcEvent.hpp
 * @brief Закрытый набор событий, которыми обмениваются демон и воркер
 *
 * @details На проводе событие кодируется JSON-строкой с именем варианта
 * (`"Exit"`), одно событие на строку.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace espanso {

enum class IpcEventType {
    Exit,              ///< Получатель должен завершиться
    ExitAllProcesses,  ///< Демон завершает воркера, затем себя
};

struct IpcEvent {
    IpcEventType type = IpcEventType::Exit;

    static IpcEvent exit() { return IpcEvent{IpcEventType::Exit}; }
    static IpcEvent exitAllProcesses() {
        return IpcEvent{IpcEventType::ExitAllProcesses};
    }

    bool operator==(const IpcEvent& other) const { return type == other.type; }
    bool operator!=(const IpcEvent& other) const { return !(*this == other); }
};

std::string toString(IpcEventType type);

/// @throw std::invalid_argument Для неизвестного имени варианта
IpcEventType ipcEventTypeFromString(const std::string& name);

void to_json(nlohmann::json& j, const IpcEvent& event);

/// @throw std::invalid_argument Если узел не строка или вариант неизвестен
void from_json(const nlohmann::json& j, IpcEvent& event);

/// Одна строка протокола, включая завершающий '\n'.
std::string encodeLine(const IpcEvent& event);

/// @throw std::invalid_argument При некорректном JSON или варианте
IpcEvent decodeLine(const std::string& line);

}  // namespace espanso
