/**
 * @file DaemonManager.hpp
 * @brief Отсоединение демона от терминала и PID-файл
 *
 * @details Используется командой `espanso daemon --detach`:
 * - Демонизация через двойной fork
 * - PID-файл `<runtime>/espanso-daemon.pid` для команды `status`
 * - Удаление PID-файла при завершении
 */

#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <system_error>

namespace espanso {

/**
 * @class DaemonManager
 * @brief RAII-обёртка над PID-файлом демона
 *
 * @details Единственность демона обеспечивает блокировка `daemon`,
 * PID-файл носит справочный характер. Создаётся только после того, как
 * блокировка показала, что демон не запущен, поэтому прежний файл всегда
 * считается устаревшим, даже если его PID занят другим процессом.
 *
 * @warning daemonize() нужно вызывать до запуска любых потоков:
 * после fork() в потомке остаётся только вызывающий поток.
 */
class DaemonManager {
public:

    /**
     * @brief Конструктор с путём к PID-файлу
     * @note Прежний PID-файл удаляется
     */
    explicit DaemonManager(const std::filesystem::path& pidPath);

    /// Удаляет PID-файл, если он был записан этим экземпляром.
    ~DaemonManager();

    DaemonManager(const DaemonManager& other) = delete;
    DaemonManager& operator=(const DaemonManager& other) = delete;

    /**
     * @brief Демонизирует текущий процесс
     * @throw std::system_error При ошибках fork(), setsid(), open()
     *
     * @note Последовательность:
     * 1. fork() и завершение родителя
     * 2. setsid()
     * 3. Второй fork()
     * 4. umask(022), рабочий каталог `/`
     * 5. stdin/stdout/stderr перенаправляются в /dev/null
     */
    void daemonize();

    /**
     * @brief Записывает PID текущего процесса в файл (права 0644)
     * @throw std::system_error При ошибке открытия или записи
     */
    void writePid();

    void cleanup() noexcept;

    const std::filesystem::path& pidPath() const { return mPidPath; }

    /// PID из файла, если файл есть и процесс жив.
    static std::optional<pid_t> readRunningPid(const std::filesystem::path& pidPath);

private:

    void removeStalePid() noexcept;

    std::filesystem::path mPidPath; ///< Абсолютный путь к PID-файлу
    bool mPidWritten = false;       ///< Не удалять чужой файл
};

/// Стандартный путь PID-файла демона.
std::filesystem::path daemonPidPath(const std::filesystem::path& runtimeDir);

} // namespace espanso
