#include "../include/configmanager.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>

namespace {

std::optional<std::filesystem::path> optionalPath(const nlohmann::json &config,
                                                  const char *key) {
  if (!config.contains(key)) return std::nullopt;
  return std::filesystem::path(config[key].get<std::string>());
}

}  // namespace

ConfigManager &ConfigManager::instance() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::initialize(const std::string &filename) {
  std::lock_guard<std::mutex> lock(configMutex_);

  try {
    nlohmann::json config = loader_.loadFromFile(filename);
    envProcessor_.process(config);
    validator_.validateRoot(config);
    baseConfig_ = std::move(config);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }
}

void ConfigManager::reset() {
  std::lock_guard<std::mutex> lock(configMutex_);
  baseConfig_ = nlohmann::json::object();
}

ServiceSettings ConfigManager::settings() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  ServiceSettings result;

  if (baseConfig_.contains("logging")) {
    for (const auto &entry : baseConfig_["logging"]) {
      LoggerSettings logger;
      logger.type = entry.value("type", logger.type);
      logger.level = entry.value("level", logger.level);
      if (entry.contains("file")) {
        logger.file = entry["file"].get<std::string>();
      }
      result.loggers.push_back(std::move(logger));
    }
  }

  if (baseConfig_.contains("log_file")) {
    result.logFile = baseConfig_["log_file"].get<std::string>();
  }

  result.retireTimeout = std::chrono::milliseconds(
      baseConfig_.value("retire_timeout_ms", int64_t{3000}));
  result.retirePollInterval = std::chrono::milliseconds(
      baseConfig_.value("retire_poll_interval_ms", int64_t{200}));

  result.paths.runtimeDir = optionalPath(baseConfig_, "runtime_dir");
  result.paths.configDir = optionalPath(baseConfig_, "config_dir");
  result.paths.packageDir = optionalPath(baseConfig_, "package_dir");
  return result;
}
