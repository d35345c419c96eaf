/**
 * @file daemoncontroller.hpp
 * @brief Протокол запуска и завершения демона
 *
 * @details Состояния:
 * 1. Захват блокировки демона
 * 2. Проверка уже работающего воркера
 * 3. Завершение старого воркера (если есть)
 * 4. Запуск нового воркера
 * 5. Обслуживание: ожидание кода завершения в канале
 * 6. Выход с полученным кодом
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <optional>

#include "../include/exitsignal.hpp"
#include "../include/runtimepaths.hpp"
#include "../include/workersupervisor.hpp"
#include "espanso/IpcChannel.hpp"

/**
 * @struct DaemonOptions
 * @brief Параметры демона, известные до запуска
 */
struct DaemonOptions {
  RuntimePaths paths;
  WorkerCommand workerCommand;
  std::chrono::milliseconds retireTimeout{3000};
  std::chrono::milliseconds retirePollInterval{200};
};

/**
 * @class DaemonController
 * @brief Гарантирует единственного воркера и возвращает код его завершения
 *
 * @details Код завершения run():
 * - 1, если демон уже работает
 * - первый код из канала: ненулевой код воркера, 0 по событию `Exit`,
 *   `ExitAllProcesses` или сигналу
 * - 100, если все отправители канала уничтожены без отправки
 *
 * Фатальные ошибки окружения (IPC-клиент, порождение воркера, bind
 * сервера) и неудачное завершение старого воркера выбрасываются
 * исключениями.
 */
class DaemonController {
 public:
  /// Вызывается сразу после запуска воркера: позволяет подключить внешние
  /// источники кода завершения (например, обработчики сигналов).
  using SenderHook = std::function<void(const ExitSender&, pid_t workerPid)>;

  explicit DaemonController(DaemonOptions options);

  /**
   * @brief Выполнить полный цикл демона
   * @return Код завершения процесса
   * @throw std::system_error При ошибках окружения
   * @throw std::runtime_error Если старый воркер не завершился вовремя
   */
  int run();

  void setSenderHook(SenderHook hook) { senderHook_ = std::move(hook); }

  /**
   * @brief Завершить ранее запущенного воркера, если он есть
   *
   * @details Если блокировка воркера свободна, ничего не отправляется.
   * Иначе воркеру отправляется `Exit`, затем блокировка проверяется с
   * интервалом retirePollInterval до retireTimeout.
   *
   * @throw std::runtime_error Если блокировка так и не освободилась
   */
  void retireExistingWorker(const espanso::IpcClient& workerClient) const;

  /**
   * @brief Остановить запущенного воркера
   *
   * @details Отправляет `Exit` в точку воркера. Если сервер воркера ещё не
   * слушает, воркеру отправляется SIGTERM.
   */
  void stopWorker(pid_t workerPid) const;

 private:
  void handleIpcEvent(const espanso::IpcEvent& event,
                      const ExitSender& exitSender) const;

  DaemonOptions options_;
  SenderHook senderHook_;
};
