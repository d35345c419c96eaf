/**
 * @file configmanager.hpp
 * @brief Единая точка доступа к настройкам демона и воркера
 *
 * @details Источники по возрастанию приоритета:
 * 1. Значения по умолчанию
 * 2. JSON-файл (`--config-file`), после подстановки `$ENV{VAR}` и проверки
 * 3. Аргументы командной строки (применяются в ServiceController)
 */

#pragma once

#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/environmentprocessor.hpp"
#include "../include/runtimepaths.hpp"

/// Один логгер из секции `logging`
struct LoggerSettings {
  std::string type = "console";
  std::string level = "info";
  std::optional<std::string> file;
};

/**
 * @struct ServiceSettings
 * @brief Типизированный вид конфигурации
 */
struct ServiceSettings {
  std::vector<LoggerSettings> loggers;
  std::optional<std::string> logFile;
  std::chrono::milliseconds retireTimeout{3000};
  std::chrono::milliseconds retirePollInterval{200};
  PathOverrides paths;
};

/**
 * @class ConfigManager
 * @brief Синглтон с текущей конфигурацией процесса
 *
 * @details Без вызова initialize() работает на значениях по умолчанию.
 * Ошибка загрузки не меняет ранее загруженную конфигурацию.
 */
class ConfigManager {
 public:
  static ConfigManager &instance();

  /**
   * @brief Загрузить и проверить файл конфигурации
   * @throw std::runtime_error "Config initialization failed: ..." при
   *        ошибке чтения, разбора или проверки
   */
  void initialize(const std::string &filename);

  /// Вернуться к значениям по умолчанию.
  void reset();

  /// Снимок типизированных настроек.
  ServiceSettings settings() const;

  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

 private:
  ConfigManager() = default;
  ~ConfigManager() = default;

  ConfigLoader loader_;
  ConfigValidator validator_;
  EnvironmentProcessor envProcessor_;
  nlohmann::json baseConfig_ = nlohmann::json::object();
  mutable std::mutex configMutex_;
};
