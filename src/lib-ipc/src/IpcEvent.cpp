#include "espanso/IpcEvent.hpp"

#include <stdexcept>

namespace espanso {

std::string toString(IpcEventType type) {
    switch (type) {
        case IpcEventType::Exit:
            return "Exit";
        case IpcEventType::ExitAllProcesses:
            return "ExitAllProcesses";
    }
    return "Unknown";
}

IpcEventType ipcEventTypeFromString(const std::string& name) {
    if (name == "Exit") return IpcEventType::Exit;
    if (name == "ExitAllProcesses") return IpcEventType::ExitAllProcesses;
    throw std::invalid_argument("IpcEvent: Unknown event variant: " + name);
}

void to_json(nlohmann::json& j, const IpcEvent& event) {
    j = toString(event.type);
}

void from_json(const nlohmann::json& j, IpcEvent& event) {
    if (!j.is_string()) {
        throw std::invalid_argument("IpcEvent: Event must be a JSON string, got " +
                                    j.dump());
    }
    event.type = ipcEventTypeFromString(j.get<std::string>());
}

std::string encodeLine(const IpcEvent& event) {
    nlohmann::json j = event;
    return j.dump() + "\n";
}

IpcEvent decodeLine(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("IpcEvent: JSON parse error: ") +
                                    e.what());
    }
    return j.get<IpcEvent>();
}

}  // namespace espanso
