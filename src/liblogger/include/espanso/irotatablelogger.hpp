#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace espanso {

enum class RotationType { NONE, SIZE, TIME };

struct RotationConfig {
    bool enabled = false;
    RotationType type = RotationType::NONE;
    size_t maxFileSizeBytes = 0;  // Порог размера файла для ротации SIZE
    std::chrono::seconds rotationInterval{0};  // например, 24h = 86400s
    std::chrono::system_clock::time_point lastRotationTime;

    RotationConfig() = default;
};

class IRotatableLogger {
public:
    virtual void setRotationConfig(const RotationConfig& config) = 0;
    virtual RotationConfig getRotationConfig() const = 0;
    virtual ~IRotatableLogger() = default;
};

}  // namespace espanso
