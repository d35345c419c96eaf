/**
 * @file workersupervisor.hpp
 * @brief Запуск процесса-воркера и наблюдение за его завершением
 */

#pragma once

#include <sys/types.h>

#include <filesystem>
#include <string>
#include <vector>

#include "../include/exitsignal.hpp"
#include "../include/runtimepaths.hpp"

/**
 * @struct WorkerCommand
 * @brief Что запускать в качестве воркера
 *
 * @details Демон передаёт собственный исполняемый файл с аргументом
 * `worker`; тесты подставляют произвольную команду.
 */
struct WorkerCommand {
  std::filesystem::path executable;
  std::vector<std::string> args;
};

/**
 * @class WorkerSupervisor
 * @brief Порождает воркера и отдаёт его код завершения в канал демона
 *
 * @details Для каждого воркера создаётся отсоединённый поток
 * `worker-status-monitor`, который владеет PID потомка до его reap.
 * Ненулевой код завершения отправляется в канал, нулевой игнорируется.
 * Завершение сигналом кода не имеет и тоже не отправляется.
 */
class WorkerSupervisor {
 public:
  static constexpr const char* MONITOR_THREAD_NAME = "worker-status-monitor";

  WorkerSupervisor(WorkerCommand command, RuntimePaths paths);

  /**
   * @brief Запустить воркера и поток наблюдения
   * @param exitSender Копия отправителя передаётся потоку наблюдения
   * @return PID запущенного процесса
   * @throw std::system_error Если posix_spawn() или создание потока
   *        завершились ошибкой
   *
   * @note Потомок получает пустую маску сигналов и обработчики по
   * умолчанию, независимо от маски вызывающего потока.
   */
  pid_t spawn(const ExitSender& exitSender) const;

  /**
   * @brief Окружение потомка: текущее окружение плюс каталоги espanso
   * @details Существующие значения ESPANSO_*_DIR заменяются.
   */
  static std::vector<std::string> buildEnvironment(const RuntimePaths& paths,
                                                   char** base);

  const WorkerCommand& command() const { return command_; }

 private:
  static void monitor(pid_t pid, ExitSender exitSender);

  WorkerCommand command_;
  RuntimePaths paths_;
};
