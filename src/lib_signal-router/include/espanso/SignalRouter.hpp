/**
 * @file SignalRouter.hpp
 * @brief Асинхронный маршрутизатор POSIX-сигналов
 *
 * @details Реализует обработку сигналов через signalfd и epoll в отдельном
 * потоке. В демоне и воркере SIGTERM/SIGINT превращаются в код завершения,
 * который отправляется в канал сигналов выхода.
 */
#pragma once

#include <sys/signalfd.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace espanso {

/**
 * @class SignalRouter
 * @brief Потокобезопасный менеджер обработки сигналов
 *
 * @note Основные возможности:
 * - Асинхронная обработка через отдельный поток
 * - Поддержка нескольких обработчиков на сигнал
 * - Восстановление исходной маски сигналов при разрушении
 *
 * @warning
 * - Только для Linux систем
 * - Не поддерживает SIGKILL и SIGSTOP
 * - signalfd получает только сигналы, заблокированные во всех потоках
 *   процесса; поэтому маску нужно выставить через blockInCurrentThread()
 *   до создания любых потоков. Дочерние процессы маску наследуют, её
 *   сбрасывает WorkerSupervisor при запуске воркера.
 */
class SignalRouter {
public:
    using Handler = std::function<void(int)>;  ///< Тип обработчика сигналов

    /**
     * @brief Получить экземпляр SignalRouter (Singleton)
     */
    static SignalRouter& instance() {
        static SignalRouter router;
        return router;
    }

    /**
     * @brief Блокирует сигналы в вызывающем потоке.
     *
     * @details Вызывается первым делом в main(): потоки, созданные позже,
     * унаследуют маску, и сигнал гарантированно попадёт в signalfd.
     *
     * @throw std::system_error При ошибке pthread_sigmask
     */
    static void blockInCurrentThread(std::initializer_list<int> signals);

    /**
     * @brief Зарегистрировать обработчик для сигнала
     * @param signum Номер сигнала (например, SIGTERM)
     * @param handler Функция-обработчик, вызывается в потоке роутера
     * @throw std::invalid_argument При неверном номере сигнала
     * @throw std::system_error При ошибках системных вызовов
     *
     * @code
     * router.registerHandler(SIGTERM, [sender](int) mutable {
     *     sender.send(0);
     * });
     * @endcode
     */
    void registerHandler(int signum, Handler handler);

    /**
     * @brief Удалить все обработчики для сигнала
     */
    void unregisterHandler(int signum);

    /**
     * @brief Запустить обработку сигналов
     * @throw std::system_error При ошибках epoll
     *
     * @note Повторный вызов при работающем потоке игнорируется
     */
    void start();

    /**
     * @brief Остановить обработку сигналов
     */
    void stop() noexcept;

    bool isRunning() const noexcept { return running_.load(); }

    ~SignalRouter();

    SignalRouter(const SignalRouter&) = delete;
    SignalRouter& operator=(const SignalRouter&) = delete;

private:
    SignalRouter();
    void processSignals(int epoll_fd);  ///< Основной цикл обработки
    void dispatch(int signum);

    std::unordered_map<int, std::vector<Handler>> handlers_;
    std::mutex handlers_mutex_;
    std::atomic<bool> running_{false};
    std::thread worker_thread_;
    int signal_fd_ = -1;
    sigset_t original_mask_;
    sigset_t blocked_mask_{};
};

}  // namespace espanso
