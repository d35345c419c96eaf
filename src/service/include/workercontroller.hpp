/**
 * @file workercontroller.hpp
 * @brief Жизненный цикл процесса `espanso worker`
 *
 * @details Воркер владеет блокировкой `worker` всё время работы: по ней
 * демон определяет, завершился ли предыдущий воркер. Сам движок
 * подстановки текста здесь не запускается, воркер только обслуживает
 * свою точку IPC и ждёт команды на завершение.
 */

#pragma once

#include <functional>

#include "../include/exitsignal.hpp"
#include "../include/runtimepaths.hpp"
#include "espanso/IpcEvent.hpp"

class WorkerController {
 public:
  using SenderHook = std::function<void(const ExitSender&)>;

  explicit WorkerController(RuntimePaths paths);

  /**
   * @brief Выполнить цикл воркера
   * @return 1, если другой воркер уже держит блокировку; иначе код из канала
   * @throw std::system_error Если точку IPC воркера не удалось открыть
   */
  int run();

  void setSenderHook(SenderHook hook) { senderHook_ = std::move(hook); }

 private:
  void handleIpcEvent(const espanso::IpcEvent& event,
                      const ExitSender& exitSender) const;

  RuntimePaths paths_;
  SenderHook senderHook_;
};
