/**
 * @file configloader.hpp
 * @brief Чтение JSON-конфигурации из файла
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @class ConfigLoader
 * @brief Загрузчик JSON-файла конфигурации
 */
class ConfigLoader {
 public:
  /**
   * @brief Загрузить конфигурацию
   * @param[in] filename Путь к JSON-файлу
   * @return Разобранный документ
   * @throw std::runtime_error Если файл не открывается или JSON некорректен
   */
  nlohmann::json loadFromFile(const std::string &filename) const;
};
