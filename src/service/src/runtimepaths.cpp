#include "../include/runtimepaths.hpp"

#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include "espanso/compositelogger.hpp"

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> envPath(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') return std::nullopt;
  return fs::path(value);
}

}  // namespace

RuntimePathResolver::RuntimePathResolver(fs::path executableDir)
    : executableDir_(std::move(executableDir)) {}

bool RuntimePathResolver::isPortable() const {
  std::error_code ec;
  return !executableDir_.empty() &&
         fs::is_directory(executableDir_ / ".espanso", ec);
}

fs::path RuntimePathResolver::resolveRuntimeDir(
    const std::optional<fs::path>& overrideDir) const {
  if (overrideDir) {
    return fs::absolute(*overrideDir);
  }

  if (auto fromEnv = envPath(env_var::RUNTIME_DIR)) {
    return fs::absolute(*fromEnv);
  }

  fs::path dir = defaultRuntimeDir();
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::system_error(ec, "Unable to create runtime directory " +
                                    dir.string());
  }
  espanso::CompositeLogger::instance().debug("using runtime dir: " +
                                             dir.string());
  return dir;
}

fs::path RuntimePathResolver::defaultRuntimeDir() const {
  if (isPortable()) {
    return fs::absolute(executableDir_ / ".espanso-runtime");
  }
  if (auto xdgRuntime = envPath("XDG_RUNTIME_DIR")) {
    return fs::absolute(*xdgRuntime / "espanso");
  }
  if (auto xdgCache = envPath("XDG_CACHE_HOME")) {
    return fs::absolute(*xdgCache / "espanso");
  }
  if (auto home = envPath("HOME")) {
    return fs::absolute(*home / ".cache" / "espanso");
  }
  throw std::runtime_error(
      "Unable to determine the runtime directory: none of XDG_RUNTIME_DIR, "
      "XDG_CACHE_HOME, HOME is set");
}

fs::path RuntimePathResolver::resolveConfigDir(
    const std::optional<fs::path>& overrideDir) const {
  if (overrideDir) return fs::absolute(*overrideDir);
  if (auto fromEnv = envPath(env_var::CONFIG_DIR)) return fs::absolute(*fromEnv);
  if (isPortable()) return fs::absolute(executableDir_ / ".espanso");
  if (auto xdgConfig = envPath("XDG_CONFIG_HOME")) {
    return fs::absolute(*xdgConfig / "espanso");
  }
  if (auto home = envPath("HOME")) {
    return fs::absolute(*home / ".config" / "espanso");
  }
  throw std::runtime_error(
      "Unable to determine the config directory: neither XDG_CONFIG_HOME nor "
      "HOME is set");
}

fs::path RuntimePathResolver::resolvePackageDir(
    const std::optional<fs::path>& overrideDir,
    const fs::path& configDir) const {
  if (overrideDir) return fs::absolute(*overrideDir);
  if (auto fromEnv = envPath(env_var::PACKAGE_DIR)) {
    return fs::absolute(*fromEnv);
  }
  return configDir / "match" / "packages";
}

RuntimePaths RuntimePathResolver::resolve(const PathOverrides& overrides) const {
  RuntimePaths paths;
  paths.runtimeDir = resolveRuntimeDir(overrides.runtimeDir);
  paths.configDir = resolveConfigDir(overrides.configDir);
  paths.packageDir = resolvePackageDir(overrides.packageDir, paths.configDir);
  return paths;
}

fs::path currentExecutablePath() {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    throw std::system_error(ec, "Unable to obtain the espanso executable path");
  }
  return exe;
}
