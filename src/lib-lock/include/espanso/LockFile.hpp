/**
 * @file LockFile.hpp
 * @brief Эксклюзивные рекомендательные блокировки ролей процессов
 *
 * @details Каждая роль (`daemon`, `worker`) владеет файлом
 * `espanso-<роль>.lock` в runtime-каталоге. Владение определяется только
 * блокировкой flock(), а не содержимым файла: после падения процесса ядро
 * снимает блокировку само, и следующий захват проходит без ручной очистки.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace espanso {

/**
 * @class LockFile
 * @brief RAII-владение именованной блокировкой
 *
 * @details Объект существует только в захваченном состоянии: его создаёт
 * tryAcquire(), а деструктор (или перемещение в другой объект) освобождает
 * дескриптор. Время жизни объекта и есть критическая секция.
 *
 * @note flock() привязан к открытому файловому описанию, поэтому два
 * захвата одного имени внутри одного процесса тоже конфликтуют.
 */
class LockFile {
public:
    /**
     * @brief Неблокирующая попытка захвата
     * @param runtimeDir Runtime-каталог (должен существовать)
     * @param name Имя роли, например "daemon"
     * @return Объект-владелец или std::nullopt, если блокировка занята
     * @throw std::system_error Если файл блокировки нельзя открыть или
     *        flock() вернул ошибку, отличную от EWOULDBLOCK
     *
     * @code
     * auto lock = espanso::LockFile::tryAcquire(paths.runtime, "daemon");
     * if (!lock) {
     *     // другой демон уже работает
     * }
     * @endcode
     */
    static std::optional<LockFile> tryAcquire(
        const std::filesystem::path& runtimeDir, const std::string& name);

    /// Полный путь файла блокировки для роли.
    static std::filesystem::path pathFor(const std::filesystem::path& runtimeDir,
                                         const std::string& name);

    LockFile(LockFile&& other) noexcept;
    LockFile& operator=(LockFile&& other) noexcept;
    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    ~LockFile();

    /// Досрочно снимает блокировку; повторный вызов безопасен.
    void release() noexcept;

    const std::filesystem::path& path() const { return mPath; }

private:
    LockFile(std::filesystem::path path, int fd);

    std::filesystem::path mPath;  ///< Файл блокировки
    int mFd = -1;                 ///< Дескриптор с установленным LOCK_EX
};

/// Захват блокировки демона (`espanso-daemon.lock`).
std::optional<LockFile> acquireDaemonLock(
    const std::filesystem::path& runtimeDir);

/// Захват блокировки воркера (`espanso-worker.lock`).
std::optional<LockFile> acquireWorkerLock(
    const std::filesystem::path& runtimeDir);

}  // namespace espanso
