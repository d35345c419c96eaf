#include "../include/daemoncontroller.hpp"

#include <signal.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "../include/version.hpp"
#include "espanso/LockFile.hpp"
#include "espanso/compositelogger.hpp"

using espanso::CompositeLogger;

DaemonController::DaemonController(DaemonOptions options)
    : options_(std::move(options)) {}

int DaemonController::run() {
  auto& logger = CompositeLogger::instance();
  const auto& runtimeDir = options_.paths.runtimeDir;

  auto daemonLock = espanso::acquireDaemonLock(runtimeDir);
  if (!daemonLock) {
    logger.error("daemon is already running!");
    return exit_code::ALREADY_RUNNING;
  }

  logger.info(std::string("espanso version: ") + ESPANSO_VERSION);

  espanso::IpcClient workerClient(runtimeDir, espanso::kWorkerEndpoint);
  retireExistingWorker(workerClient);

  auto [exitSender, exitReceiver] = makeChannel<ExitCode>();

  WorkerSupervisor supervisor(options_.workerCommand, options_.paths);
  const pid_t workerPid = supervisor.spawn(exitSender);

  // Сигнал, пришедший раньше, остаётся заблокированным и ждёт в signalfd
  if (senderHook_) senderHook_(exitSender, workerPid);

  espanso::IpcServer server(
      runtimeDir, espanso::kDaemonEndpoint,
      [this, sender = exitSender](const espanso::IpcEvent& event) {
        handleIpcEvent(event, sender);
      });
  server.start();

  // Собственная копия главного цикла не должна удерживать канал открытым
  exitSender.reset();

  int exitCode = exit_code::SUCCESS;
  if (auto code = exitReceiver.recv()) {
    exitCode = *code;
  } else {
    logger.error(
        "received error when unwrapping exit_code: all senders disconnected");
    exitCode = exit_code::CHANNEL_CLOSED;
  }

  logger.info("daemon exiting with code " + std::to_string(exitCode));
  return exitCode;
}

void DaemonController::retireExistingWorker(
    const espanso::IpcClient& workerClient) const {
  auto& logger = CompositeLogger::instance();
  const auto& runtimeDir = options_.paths.runtimeDir;

  if (espanso::acquireWorkerLock(runtimeDir)) {
    return;
  }

  logger.warning(
      "a worker process is already running, sending termination signal...");
  try {
    workerClient.send(espanso::IpcEvent::exit());
  } catch (const std::system_error& e) {
    logger.error(
        std::string("unable to send termination signal to worker process: ") +
        e.what());
  }

  const auto start = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - start < options_.retireTimeout) {
    if (espanso::acquireWorkerLock(runtimeDir)) {
      return;
    }
    std::this_thread::sleep_for(options_.retirePollInterval);
  }

  throw std::runtime_error(
      "could not terminate worker process, please kill it manually, otherwise "
      "espanso won't start");
}

void DaemonController::stopWorker(pid_t workerPid) const {
  auto& logger = CompositeLogger::instance();
  try {
    espanso::IpcClient(options_.paths.runtimeDir, espanso::kWorkerEndpoint)
        .send(espanso::IpcEvent::exit());
    return;
  } catch (const std::system_error& e) {
    if (!espanso::IpcClient::isPeerAbsent(e)) {
      logger.warning(std::string("unable to send Exit to the worker: ") +
                     e.what());
    }
  }

  // Воркер ещё не поднял сервер: SIGTERM он заблокировал при старте и
  // обработает через SignalRouter, как Exit
  logger.info("worker endpoint is not ready, sending SIGTERM to pid " +
              std::to_string(workerPid));
  if (::kill(workerPid, SIGTERM) < 0 && errno != ESRCH) {
    logger.error(std::string("unable to signal the worker: ") +
                 std::system_category().message(errno));
  }
}

void DaemonController::handleIpcEvent(const espanso::IpcEvent& event,
                                      const ExitSender& exitSender) const {
  auto& logger = CompositeLogger::instance();

  switch (event.type) {
    case espanso::IpcEventType::Exit:
      logger.info("received Exit event, terminating daemon");
      break;
    case espanso::IpcEventType::ExitAllProcesses: {
      logger.info("received ExitAllProcesses event, terminating worker first");
      try {
        espanso::IpcClient(options_.paths.runtimeDir, espanso::kWorkerEndpoint)
            .send(espanso::IpcEvent::exit());
      } catch (const std::system_error& e) {
        logger.error(std::string("unable to forward Exit to the worker: ") +
                     e.what());
      }
      break;
    }
  }

  if (!exitSender.send(exit_code::SUCCESS)) {
    logger.warning("exit code already consumed, ignoring " +
                   espanso::toString(event.type));
  }
}
