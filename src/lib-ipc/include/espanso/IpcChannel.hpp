/**
 * @file IpcChannel.hpp
 * @brief Клиент и сервер обмена событиями через Unix domain socket
 *
 * @details Точка обмена — файл `<runtime>/<endpoint>.sock`. В каждом
 * runtime-каталоге один сервер на роль: демон слушает `espansodaemonv2`,
 * воркер — `espansoworkerv2`. Клиенты кратковременные: одно подключение на
 * одну отправку. Доставка не чаще одного раза, порядок гарантирован только
 * внутри одного подключения.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

#include "espanso/IpcEvent.hpp"

namespace espanso {

inline constexpr const char* kDaemonEndpoint = "espansodaemonv2";
inline constexpr const char* kWorkerEndpoint = "espansoworkerv2";

/// Путь сокета для точки обмена.
std::filesystem::path endpointPath(const std::filesystem::path& runtimeDir,
                                   const std::string& endpoint);

/**
 * @class IpcClient
 * @brief Отправитель событий в сервер другой роли
 */
class IpcClient {
public:
    /**
     * @brief Привязка клиента к точке обмена
     * @throw std::system_error Если runtime-каталог недоступен
     * @throw std::length_error Если путь сокета не помещается в sun_path
     */
    IpcClient(const std::filesystem::path& runtimeDir, std::string endpoint);

    /**
     * @brief Отправить событие
     * @throw std::system_error При ошибке подключения или записи. Отсутствие
     *        сервера (нет сокета или никто не слушает) проверяется через
     *        isPeerAbsent() и является штатной ситуацией.
     */
    void send(const IpcEvent& event) const;

    /// true, если ошибка означает «на той стороне никто не слушает».
    static bool isPeerAbsent(const std::system_error& error) noexcept;

    const std::filesystem::path& socketPath() const { return socketPath_; }

private:
    std::filesystem::path socketPath_;
};

/**
 * @class IpcServer
 * @brief Приём событий в отдельном потоке
 *
 * @details Один поток обслуживает слушающий сокет и все подключения
 * через epoll, поэтому медленный клиент не блокирует остальных.
 * Каждое принятое событие передаётся в обработчик в потоке сервера.
 * Некорректные строки логируются и отбрасываются.
 */
class IpcServer {
public:
    using Handler = std::function<void(const IpcEvent&)>;

    IpcServer(const std::filesystem::path& runtimeDir, std::string endpoint,
              Handler handler);
    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    /**
     * @brief Создать сокет, привязать его и запустить поток приёма
     * @throw std::system_error При ошибках socket/bind/listen/epoll
     *
     * @note Оставшийся от упавшего процесса файл сокета удаляется перед
     * bind(): вызывающая сторона уже владеет блокировкой своей роли.
     */
    void start();

    /**
     * @brief Остановить поток и удалить файл сокета
     *
     * @note Допустим вызов из обработчика: цикл приёма завершается после
     * возврата из обработчика, закрывает подключения и удаляет сокет.
     */
    void stop() noexcept;

    bool isRunning() const noexcept { return running_.load(); }

    const std::filesystem::path& socketPath() const { return socketPath_; }

private:
    void serveLoop();
    void acceptClients();
    bool readClient(int fd);
    void closeClient(int fd);
    void dispatchLine(const std::string& line);
    void releaseResources() noexcept;

    static constexpr size_t MAX_LINE_BYTES = 64 * 1024;

    std::filesystem::path socketPath_;
    std::string endpoint_;
    Handler handler_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    int listenFd_ = -1;
    int epollFd_ = -1;
    std::unordered_map<int, std::string> buffers_;  ///< Недочитанные строки
};

}  // namespace espanso
