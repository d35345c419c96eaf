/**
 * @file configvalidator.hpp
 * @brief Проверка структуры JSON-конфигурации espanso
 *
 * @details Допустимые ключи верхнего уровня:
 * - `logging` — массив `{type, level, file}`
 * - `log_file` — путь журнала по умолчанию для файловых логгеров
 * - `retire_timeout_ms`, `retire_poll_interval_ms` — ожидание завершения
 *   старого воркера
 * - `runtime_dir`, `config_dir`, `package_dir` — явные каталоги
 *
 * Неизвестные ключи не считаются ошибкой.
 */

#pragma once

#include <nlohmann/json.hpp>

class ConfigValidator {
 public:
  /**
   * @brief Проверить весь документ
   * @throw std::runtime_error С описанием первого найденного нарушения
   */
  bool validateRoot(const nlohmann::json &config) const;

  /// @throw std::runtime_error При нарушении структуры или типов
  bool validateLogging(const nlohmann::json &logging) const;

  /// @throw std::runtime_error Если интервалы не положительные или
  /// интервал опроса больше таймаута
  bool validateTimings(const nlohmann::json &config) const;

 private:
  void validatePathField(const nlohmann::json &config, const char *key) const;
};
