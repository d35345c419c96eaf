/**
 * @file environmentprocessor.hpp
 * @brief Подстановка переменных окружения в JSON-конфигурацию
 *
 * @details Во всех строковых узлах шаблон `$ENV{VAR}` заменяется значением
 * переменной. Поддерживается значение по умолчанию: `$ENV{VAR:-fallback}`.
 * Шаблон без значения и без умолчания остаётся в строке как есть.
 *
 * @code
 nlohmann::json cfg = R"({"log_file": "$ENV{HOME}/espanso.log"})"_json;
 EnvironmentProcessor().process(cfg);
 @endcode
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

/**
 * @class EnvironmentProcessor
 * @brief Обход JSON-дерева с раскрытием `$ENV{...}`
 *
 * @note Читает окружение через getenv(); вызывать до запуска потоков,
 * которые могут менять окружение.
 */
class EnvironmentProcessor {
 public:
  /// Раскрывает шаблоны во всех строках объекта, массивов и вложенных узлов.
  void process(nlohmann::json &config) const;

  /// Раскрывает шаблоны в одной строке.
  std::string expand(const std::string &value) const;
};
