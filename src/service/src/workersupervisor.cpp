#include "../include/workersupervisor.hpp"

#include <pthread.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>

#include <cerrno>
#include <system_error>
#include <thread>

#include "espanso/compositelogger.hpp"

extern char** environ;

namespace {

// RAII для posix_spawnattr_t
class SpawnAttributes {
 public:
  SpawnAttributes() {
    if (int rc = posix_spawnattr_init(&attr_); rc != 0) {
      throw std::system_error(rc, std::system_category(),
                              "WorkerSupervisor: posix_spawnattr_init failed");
    }
  }
  ~SpawnAttributes() { posix_spawnattr_destroy(&attr_); }

  SpawnAttributes(const SpawnAttributes&) = delete;
  SpawnAttributes& operator=(const SpawnAttributes&) = delete;

  // Маска потомка пустая, обработчики сброшены: демон блокирует
  // SIGTERM/SIGINT ради signalfd, воркер должен их получать
  void resetSignals() {
    sigset_t empty;
    sigemptyset(&empty);
    sigset_t defaults;
    sigfillset(&defaults);
    sigdelset(&defaults, SIGKILL);
    sigdelset(&defaults, SIGSTOP);

    check(posix_spawnattr_setsigmask(&attr_, &empty));
    check(posix_spawnattr_setsigdefault(&attr_, &defaults));
    check(posix_spawnattr_setflags(
        &attr_, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF));
  }

  posix_spawnattr_t* get() { return &attr_; }

 private:
  static void check(int rc) {
    if (rc != 0) {
      throw std::system_error(rc, std::system_category(),
                              "WorkerSupervisor: spawn attributes");
    }
  }

  posix_spawnattr_t attr_;
};

bool hasKey(const std::string& entry, const char* key) {
  std::string prefix = std::string(key) + "=";
  return entry.compare(0, prefix.size(), prefix) == 0;
}

std::vector<char*> toArgv(std::vector<std::string>& strings) {
  std::vector<char*> result;
  result.reserve(strings.size() + 1);
  for (auto& s : strings) result.push_back(s.data());
  result.push_back(nullptr);
  return result;
}

}  // namespace

WorkerSupervisor::WorkerSupervisor(WorkerCommand command, RuntimePaths paths)
    : command_(std::move(command)), paths_(std::move(paths)) {}

std::vector<std::string> WorkerSupervisor::buildEnvironment(
    const RuntimePaths& paths, char** base) {
  std::vector<std::string> env;
  for (char** it = base; it != nullptr && *it != nullptr; ++it) {
    std::string entry(*it);
    if (hasKey(entry, env_var::CONFIG_DIR) ||
        hasKey(entry, env_var::PACKAGE_DIR) ||
        hasKey(entry, env_var::RUNTIME_DIR)) {
      continue;
    }
    env.push_back(std::move(entry));
  }
  env.push_back(std::string(env_var::CONFIG_DIR) + "=" +
                paths.configDir.string());
  env.push_back(std::string(env_var::PACKAGE_DIR) + "=" +
                paths.packageDir.string());
  env.push_back(std::string(env_var::RUNTIME_DIR) + "=" +
                paths.runtimeDir.string());
  return env;
}

pid_t WorkerSupervisor::spawn(const ExitSender& exitSender) const {
  espanso::CompositeLogger::instance().info("spawning the worker process...");

  std::vector<std::string> argvStrings;
  argvStrings.push_back(command_.executable.string());
  argvStrings.insert(argvStrings.end(), command_.args.begin(),
                     command_.args.end());
  std::vector<std::string> envStrings = buildEnvironment(paths_, environ);

  std::vector<char*> argv = toArgv(argvStrings);
  std::vector<char*> envp = toArgv(envStrings);

  SpawnAttributes attributes;
  attributes.resetSignals();

  pid_t pid = 0;
  int rc = posix_spawn(&pid, argvStrings.front().c_str(), nullptr,
                       attributes.get(), argv.data(), envp.data());
  if (rc != 0) {
    throw std::system_error(rc, std::system_category(),
                            "unable to spawn worker process " +
                                command_.executable.string());
  }

  espanso::CompositeLogger::instance().debug("worker process started with pid " +
                                             std::to_string(pid));

  try {
    std::thread(&WorkerSupervisor::monitor, pid, exitSender).detach();
  } catch (const std::system_error& e) {
    // Без наблюдателя потомок остался бы зомби без владельца
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    throw std::system_error(e.code(),
                            "Unable to spawn worker monitor thread");
  }
  return pid;
}

void WorkerSupervisor::monitor(pid_t pid, ExitSender exitSender) {
  std::string name = std::string(MONITOR_THREAD_NAME).substr(0, 15);
  pthread_setname_np(pthread_self(), name.c_str());

  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid, &status, 0);
  } while (rc < 0 && errno == EINTR);

  auto& logger = espanso::CompositeLogger::instance();
  if (rc < 0) {
    logger.error("unable to wait for worker process " + std::to_string(pid) +
                 ": " + std::error_code(errno, std::system_category()).message());
    return;
  }

  if (WIFEXITED(status)) {
    int code = WEXITSTATUS(status);
    if (code == 0) {
      logger.info("worker process exited successfully");
      return;
    }
    logger.error("worker process exited with non-zero code: " +
                 std::to_string(code) + ", exiting");
    if (!exitSender.send(code)) {
      logger.error("unable to forward worker exit code");
    }
  } else if (WIFSIGNALED(status)) {
    logger.warning("worker process terminated by signal " +
                   std::to_string(WTERMSIG(status)));
  }
}
