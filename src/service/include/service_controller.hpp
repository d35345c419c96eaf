/**
 * @file service_controller.hpp
 * @brief Точка входа: разбор аргументов, конфигурация, логирование и
 * запуск выбранной подкоманды
 *
 * @details
 * 1. Разбор CLI (ArgumentParser)
 * 2. Загрузка конфигурации (ConfigManager), CLI имеет приоритет
 * 3. Блокировка SIGTERM/SIGINT до создания потоков (для SignalRouter)
 * 4. Разрешение каталогов (RuntimePathResolver)
 * 5. Демонизация для `daemon --detach` (DaemonManager)
 * 6. Инициализация логгеров
 * 7. Выполнение подкоманды
 *
 * Исключения, вышедшие из подкоманды, логируются как critical и
 * превращаются в код 101.
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "../include/argumentparser.hpp"
#include "../include/configmanager.hpp"
#include "../include/daemoncontroller.hpp"
#include "../include/runtimepaths.hpp"
#include "espanso/DaemonManager.hpp"

/**
 * @class ServiceController
 * @brief Управляет запуском подкоманд espanso
 *
 * @code
 int main(int argc, char** argv) {
     ServiceController controller;
     return controller.run(argc, argv);
 }
 @endcode
 */
class ServiceController {
 public:
  /// Поток для сообщений команд `status`/`stop` и ошибок до инициализации
  /// логгера.
  explicit ServiceController(std::ostream &out, std::ostream &err);
  ServiceController();

  /**
   * @brief Выполнить команду
   * @return Код завершения процесса
   */
  int run(int argc, char **argv);

  /// Аргументы воркера: подкоманда и опции логирования/конфигурации.
  static std::vector<std::string> workerArguments(const ParsedArgs &args);

  /// Настройки после наложения CLI поверх файла конфигурации.
  static ServiceSettings mergeSettings(ServiceSettings settings,
                                       const ParsedArgs &args);

  /**
   * @brief Настройки воркера
   *
   * @details Каталог, выставленный демоном через `ESPANSO_*_DIR`, заменяет
   * значение из файла конфигурации. Явная опция CLI остаётся главнее.
   */
  static ServiceSettings workerSettings(ServiceSettings settings,
                                        const ParsedArgs &args);

 private:
  int dispatch(const ParsedArgs &args, const ServiceSettings &settings);

  int runDaemon(const ParsedArgs &args, const ServiceSettings &settings);
  int runWorker(const ParsedArgs &args, const ServiceSettings &settings);
  int runStop(const ServiceSettings &settings);
  int runStatus(const ServiceSettings &settings);

  /**
   * @brief Настраивает CompositeLogger
   *
   * @details
   *  - Если заданы `--log-type`/`--log-level`, используются они
   *  - Иначе секция `logging` конфигурации
   *  - Иначе консоль и синхронный файл `<runtime>/espanso.log`
   *
   * Демон очищает журнал при старте, воркер дописывает в него.
   */
  void initLogger(const ParsedArgs &args, const ServiceSettings &settings,
                  const RuntimePaths &paths);

  void printVersion();

  RuntimePaths resolvePaths(const ServiceSettings &settings) const;

  std::ostream &out_;
  std::ostream &err_;
  bool loggerReady_ = false;
  std::unique_ptr<espanso::DaemonManager> daemon_;
};
