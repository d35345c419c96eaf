/**
 * @file runtimepaths.hpp
 * @brief Каталоги конфигурации, пакетов и времени выполнения
 *
 * @details Демон и воркер используют общий runtime-каталог: в нём лежат
 * файлы блокировок, сокеты IPC, PID-файл и журнал. Воркер получает все
 * три каталога через переменные окружения, которые выставляет демон.
 */

#pragma once

#include <filesystem>
#include <optional>

/// Имена переменных окружения, передаваемых воркеру
namespace env_var {
inline constexpr const char* CONFIG_DIR = "ESPANSO_CONFIG_DIR";
inline constexpr const char* PACKAGE_DIR = "ESPANSO_PACKAGE_DIR";
inline constexpr const char* RUNTIME_DIR = "ESPANSO_RUNTIME_DIR";
}  // namespace env_var

/**
 * @struct RuntimePaths
 * @brief Абсолютные пути, неизменяемые после разрешения
 */
struct RuntimePaths {
  std::filesystem::path configDir;
  std::filesystem::path packageDir;
  std::filesystem::path runtimeDir;
};

/**
 * @struct PathOverrides
 * @brief Явно заданные каталоги (CLI или файл конфигурации)
 */
struct PathOverrides {
  std::optional<std::filesystem::path> configDir;
  std::optional<std::filesystem::path> packageDir;
  std::optional<std::filesystem::path> runtimeDir;
};

/**
 * @class RuntimePathResolver
 * @brief Определяет каталоги по приоритету: явное значение, окружение,
 * значение по умолчанию
 *
 * @details Портативный режим включается, если рядом с исполняемым файлом
 * есть каталог `.espanso`. Тогда runtime-каталог `<exe_dir>/.espanso-runtime`,
 * конфигурация в `<exe_dir>/.espanso`.
 */
class RuntimePathResolver {
 public:
  /// @param executableDir Каталог исполняемого файла (для портативного режима)
  explicit RuntimePathResolver(std::filesystem::path executableDir);

  /**
   * @brief runtime-каталог
   *
   * @details Явное значение возвращается как есть (абсолютным), без
   * создания. Значение из `ESPANSO_RUNTIME_DIR` тоже. Каталог по умолчанию
   * создаётся вместе с родителями.
   *
   * @throw std::system_error Если каталог по умолчанию не удалось создать
   * @throw std::runtime_error Если не задан ни один из XDG_RUNTIME_DIR,
   *        XDG_CACHE_HOME, HOME
   */
  std::filesystem::path resolveRuntimeDir(
      const std::optional<std::filesystem::path>& overrideDir) const;

  /// Каталог конфигурации: явное значение, окружение, портативный, XDG.
  std::filesystem::path resolveConfigDir(
      const std::optional<std::filesystem::path>& overrideDir) const;

  /// Каталог пакетов: явное значение, окружение, `<config>/match/packages`.
  std::filesystem::path resolvePackageDir(
      const std::optional<std::filesystem::path>& overrideDir,
      const std::filesystem::path& configDir) const;

  /**
   * @brief Все три каталога разом
   * @post runtimeDir существует
   */
  RuntimePaths resolve(const PathOverrides& overrides) const;

  bool isPortable() const;

 private:
  std::filesystem::path defaultRuntimeDir() const;

  std::filesystem::path executableDir_;
};

/// Путь исполняемого файла текущего процесса (по /proc/self/exe).
/// @throw std::system_error Если ссылка недоступна
std::filesystem::path currentExecutablePath();
