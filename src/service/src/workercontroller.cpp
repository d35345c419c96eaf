#include "../include/workercontroller.hpp"

#include <system_error>

#include "espanso/IpcChannel.hpp"
#include "espanso/LockFile.hpp"
#include "espanso/compositelogger.hpp"

using espanso::CompositeLogger;

WorkerController::WorkerController(RuntimePaths paths)
    : paths_(std::move(paths)) {}

int WorkerController::run() {
  auto& logger = CompositeLogger::instance();

  auto workerLock = espanso::acquireWorkerLock(paths_.runtimeDir);
  if (!workerLock) {
    logger.error("worker is already running!");
    return exit_code::ALREADY_RUNNING;
  }

  logger.info("worker started, config dir: " + paths_.configDir.string() +
              ", package dir: " + paths_.packageDir.string());

  auto [exitSender, exitReceiver] = makeChannel<ExitCode>();
  if (senderHook_) senderHook_(exitSender);

  espanso::IpcServer server(
      paths_.runtimeDir, espanso::kWorkerEndpoint,
      [this, sender = exitSender](const espanso::IpcEvent& event) {
        handleIpcEvent(event, sender);
      });
  server.start();
  exitSender.reset();

  int exitCode = exit_code::CHANNEL_CLOSED;
  if (auto code = exitReceiver.recv()) {
    exitCode = *code;
  } else {
    logger.error("worker exit channel closed unexpectedly");
  }

  logger.info("worker exiting with code " + std::to_string(exitCode));
  return exitCode;
}

void WorkerController::handleIpcEvent(const espanso::IpcEvent& event,
                                      const ExitSender& exitSender) const {
  auto& logger = CompositeLogger::instance();

  if (event.type == espanso::IpcEventType::ExitAllProcesses) {
    // Демон сам пришлёт Exit после получения события
    try {
      espanso::IpcClient(paths_.runtimeDir, espanso::kDaemonEndpoint)
          .send(espanso::IpcEvent::exitAllProcesses());
    } catch (const std::system_error& e) {
      logger.error(std::string("unable to notify the daemon: ") + e.what());
    }
  } else {
    logger.info("received Exit event, terminating worker");
  }

  if (!exitSender.send(exit_code::SUCCESS)) {
    logger.debug("exit code already consumed, ignoring " +
                 espanso::toString(event.type));
  }
}
