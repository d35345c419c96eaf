/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 */

#include "../include/service_controller.hpp"

#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "../include/version.hpp"
#include "../include/workercontroller.hpp"
#include "espanso/IpcChannel.hpp"
#include "espanso/LockFile.hpp"
#include "espanso/SignalRouter.hpp"
#include "espanso/asyncfilelogger.hpp"
#include "espanso/compositelogger.hpp"
#include "espanso/consolelogger.hpp"
#include "espanso/syncfilelogger.hpp"

using espanso::CompositeLogger;

namespace {

constexpr const char *kDefaultLogName = "espanso.log";

// Регистрирует SIGTERM/SIGINT: сигнал превращается в код 0 в канале
void routeTerminationSignals(const ExitSender &sender,
                             std::function<void()> beforeExit) {
  auto &router = espanso::SignalRouter::instance();
  for (int signum : {SIGTERM, SIGINT}) {
    router.registerHandler(signum, [sender, beforeExit](int sig) {
      CompositeLogger::instance().info("received signal " +
                                       std::to_string(sig) + ", shutting down");
      if (beforeExit) beforeExit();
      if (!sender.send(exit_code::SUCCESS)) {
        CompositeLogger::instance().debug("exit code already consumed");
      }
    });
  }
  router.start();
}

// Снимает обработчики при любом выходе из подкоманды
class SignalRoutingGuard {
 public:
  SignalRoutingGuard() = default;
  ~SignalRoutingGuard() {
    auto &router = espanso::SignalRouter::instance();
    router.stop();
    router.unregisterHandler(SIGTERM);
    router.unregisterHandler(SIGINT);
  }
  SignalRoutingGuard(const SignalRoutingGuard &) = delete;
  SignalRoutingGuard &operator=(const SignalRoutingGuard &) = delete;
};

}  // namespace

ServiceController::ServiceController(std::ostream &out, std::ostream &err)
    : out_(out), err_(err) {}

ServiceController::ServiceController() : ServiceController(std::cout, std::cerr) {}

int ServiceController::run(int argc, char **argv) {
  ParsedArgs args;
  try {
    args = ArgumentParser().parse(argc, argv);
  } catch (const std::invalid_argument &e) {
    err_ << e.what() << "\n\n";
    ArgumentParser::printHelp(err_);
    return exit_code::INVALID_USAGE;
  }

  if (args.help_message) {
    ArgumentParser::printHelp(out_);
    return exit_code::SUCCESS;
  }
  if (args.version_message) {
    printVersion();
    return exit_code::SUCCESS;
  }

  espanso::ProcessTag::set(ArgumentParser::commandName(args.command));

  try {
    if (args.config_path) {
      ConfigManager::instance().initialize(*args.config_path);
    }
    ServiceSettings settings =
        mergeSettings(ConfigManager::instance().settings(), args);

    if (args.command == Command::Daemon || args.command == Command::Worker) {
      // signalfd получает только сигналы, заблокированные во всех потоках
      espanso::SignalRouter::blockInCurrentThread({SIGTERM, SIGINT});
    }

    return dispatch(args, settings);
  } catch (const std::exception &e) {
    if (loggerReady_) {
      CompositeLogger::instance().critical(e.what());
      CompositeLogger::instance().flush();
    } else {
      err_ << "espanso: " << e.what() << std::endl;
    }
    if (daemon_) daemon_->cleanup();
    return exit_code::FATAL;
  }
}

int ServiceController::dispatch(const ParsedArgs &args,
                                const ServiceSettings &settings) {
  switch (args.command) {
    case Command::Daemon:
      return runDaemon(args, settings);
    case Command::Worker:
      return runWorker(args, settings);
    case Command::Stop:
      return runStop(settings);
    case Command::Status:
      return runStatus(settings);
    case Command::None:
      break;
  }
  throw std::invalid_argument("No command given");
}

ServiceSettings ServiceController::mergeSettings(ServiceSettings settings,
                                                 const ParsedArgs &args) {
  if (args.runtime_dir) settings.paths.runtimeDir = *args.runtime_dir;
  if (args.config_dir) settings.paths.configDir = *args.config_dir;
  if (args.package_dir) settings.paths.packageDir = *args.package_dir;
  return settings;
}

ServiceSettings ServiceController::workerSettings(ServiceSettings settings,
                                                  const ParsedArgs &args) {
  // Каталоги из окружения демона важнее файла конфигурации: относительный
  // путь из файла воркер разрешил бы от своего рабочего каталога
  auto preferEnvironment = [](std::optional<std::filesystem::path> &dir,
                              const std::optional<std::string> &cliValue,
                              const char *name) {
    const char *value = std::getenv(name);
    if (!cliValue && value != nullptr && *value != '\0') dir.reset();
  };
  preferEnvironment(settings.paths.runtimeDir, args.runtime_dir,
                    env_var::RUNTIME_DIR);
  preferEnvironment(settings.paths.configDir, args.config_dir,
                    env_var::CONFIG_DIR);
  preferEnvironment(settings.paths.packageDir, args.package_dir,
                    env_var::PACKAGE_DIR);
  return settings;
}

std::vector<std::string> ServiceController::workerArguments(
    const ParsedArgs &args) {
  std::vector<std::string> result{"worker"};
  if (args.config_path) {
    result.push_back("--config-file=" +
                     std::filesystem::absolute(*args.config_path).string());
  }
  if (!args.logger_types.empty()) {
    std::string types;
    for (const auto &type : args.logger_types) {
      if (!types.empty()) types += ",";
      types += type;
    }
    result.push_back("--log-type=" + types);
  }
  if (args.log_level) {
    result.push_back("--log-level=" + *args.log_level);
  }
  return result;
}

RuntimePaths ServiceController::resolvePaths(
    const ServiceSettings &settings) const {
  std::filesystem::path exeDir;
  try {
    exeDir = currentExecutablePath().parent_path();
  } catch (const std::system_error &e) {
    // Без пути к исполняемому файлу портативный режим просто недоступен
    err_ << "espanso: " << e.what() << std::endl;
  }
  return RuntimePathResolver(exeDir).resolve(settings.paths);
}

int ServiceController::runDaemon(const ParsedArgs &args,
                                 const ServiceSettings &settings) {
  RuntimePaths paths = resolvePaths(settings);

  if (args.detach) {
    // Проверка до fork(): иначе ошибку уже некому будет показать
    if (!espanso::acquireDaemonLock(paths.runtimeDir)) {
      err_ << "daemon is already running!" << std::endl;
      return exit_code::ALREADY_RUNNING;
    }
    daemon_ = std::make_unique<espanso::DaemonManager>(
        espanso::daemonPidPath(paths.runtimeDir));
    daemon_->daemonize();
    daemon_->writePid();
  }

  initLogger(args, settings, paths);

  DaemonOptions options;
  options.paths = paths;
  options.workerCommand = WorkerCommand{currentExecutablePath(),
                                        workerArguments(args)};
  options.retireTimeout = settings.retireTimeout;
  options.retirePollInterval = settings.retirePollInterval;

  DaemonController controller(std::move(options));
  SignalRoutingGuard signalGuard;
  controller.setSenderHook(
      [&controller](const ExitSender &sender, pid_t workerPid) {
        routeTerminationSignals(sender, [&controller, workerPid] {
          controller.stopWorker(workerPid);
        });
      });

  int code = controller.run();
  CompositeLogger::instance().flush();
  return code;
}

int ServiceController::runWorker(const ParsedArgs &args,
                                 const ServiceSettings &settings) {
  RuntimePaths paths = resolvePaths(workerSettings(settings, args));
  initLogger(args, settings, paths);

  WorkerController controller(paths);
  SignalRoutingGuard signalGuard;
  controller.setSenderHook([](const ExitSender &sender) {
    routeTerminationSignals(sender, nullptr);
  });

  int code = controller.run();
  CompositeLogger::instance().flush();
  return code;
}

int ServiceController::runStop(const ServiceSettings &settings) {
  RuntimePaths paths = resolvePaths(settings);

  espanso::IpcClient client(paths.runtimeDir, espanso::kDaemonEndpoint);
  try {
    client.send(espanso::IpcEvent::exitAllProcesses());
  } catch (const std::system_error &e) {
    if (espanso::IpcClient::isPeerAbsent(e)) {
      err_ << "daemon is not running" << std::endl;
      return exit_code::NOT_RUNNING;
    }
    throw;
  }

  // Демон отпускает блокировку последней, после остановки воркера
  const auto start = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - start < settings.retireTimeout) {
    if (espanso::acquireDaemonLock(paths.runtimeDir)) {
      out_ << "espanso stopped" << std::endl;
      return exit_code::SUCCESS;
    }
    std::this_thread::sleep_for(settings.retirePollInterval);
  }
  throw std::runtime_error("daemon did not stop within " +
                           std::to_string(settings.retireTimeout.count()) +
                           " ms");
}

int ServiceController::runStatus(const ServiceSettings &settings) {
  RuntimePaths paths = resolvePaths(settings);

  if (espanso::acquireDaemonLock(paths.runtimeDir)) {
    out_ << "espanso is not running" << std::endl;
    return exit_code::NOT_RUNNING;
  }

  out_ << "espanso is running";
  if (auto pid = espanso::DaemonManager::readRunningPid(
          espanso::daemonPidPath(paths.runtimeDir))) {
    out_ << " (pid " << *pid << ")";
  }
  out_ << std::endl;
  return exit_code::SUCCESS;
}

void ServiceController::initLogger(const ParsedArgs &args,
                                   const ServiceSettings &settings,
                                   const RuntimePaths &paths) {
  auto &composite_logger = CompositeLogger::instance();
  composite_logger.clearLoggers();

  // Синглтоны логгеров живут до конца процесса
  auto getSingletonPtr = [](auto &singleton) {
    return std::shared_ptr<std::remove_reference_t<decltype(singleton)>>(
        &singleton, [](auto *) {});
  };

  const bool isDaemon = args.command == Command::Daemon;
  const espanso::FileOpenMode openMode = isDaemon
                                             ? espanso::FileOpenMode::CLEAN_AND_APPEND
                                             : espanso::FileOpenMode::APPEND;
  const std::string defaultFile =
      settings.logFile.value_or((paths.runtimeDir / kDefaultLogName).string());

  auto addLogger = [&](const std::string &type, const std::string &file,
                       std::optional<espanso::LogLevel> level) {
    if (type == "console") {
      auto &logger = espanso::ConsoleLogger::instance();
      if (level) logger.setLogLevel(*level);
      composite_logger.addLogger(getSingletonPtr(logger));
    } else if (type == "async_file") {
      auto &logger = espanso::AsyncFileLogger::instance();
      logger.setOpenMode(openMode);
      logger.setMainLogPath(file);
      if (level) logger.setLogLevel(*level);
      composite_logger.addLogger(getSingletonPtr(logger));
    } else if (type == "sync_file") {
      auto &logger = espanso::SyncFileLogger::instance();
      logger.setOpenMode(openMode);
      logger.setMainLogPath(file);
      if (level) logger.setLogLevel(*level);
      composite_logger.addLogger(getSingletonPtr(logger));
    }
  };

  if (!args.logger_types.empty()) {
    for (const auto &type : args.logger_types) {
      addLogger(type, defaultFile, std::nullopt);
    }
  } else if (!settings.loggers.empty()) {
    for (const auto &entry : settings.loggers) {
      addLogger(entry.type, entry.file.value_or(defaultFile),
                espanso::stringToLogLevel(entry.level));
    }
  } else {
    addLogger("console", defaultFile, std::nullopt);
    addLogger("sync_file", defaultFile, std::nullopt);
  }

  if (args.log_level.has_value()) {
    composite_logger.setLogLevel(espanso::stringToLogLevel(*args.log_level));
  }
  loggerReady_ = true;
}

void ServiceController::printVersion() {
  out_ << "espanso " << ESPANSO_VERSION << "\n";
}
