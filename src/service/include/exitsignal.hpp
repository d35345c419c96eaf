/**
 * @file exitsignal.hpp
 * @brief Канал кода завершения: много отправителей, один получатель
 *
 * @details Отправители копируются в каждый поток-источник (монитор
 * воркера, IPC-сервер, обработчик сигналов). Получатель принадлежит
 * главному циклу демона и читает ровно одно значение. Когда уничтожен
 * последний отправитель, ожидание завершается пустым результатом.
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace detail {

template <typename T>
struct ChannelState {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<T> queue;
  size_t senders = 0;
  bool receiverAlive = true;
};

}  // namespace detail

template <typename T>
class ChannelReceiver;

/**
 * @class ChannelSender
 * @brief Копируемый конец канала для записи
 */
template <typename T>
class ChannelSender {
 public:
  ChannelSender(const ChannelSender& other) : state_(other.state_) {
    attach();
  }

  ChannelSender(ChannelSender&& other) noexcept
      : state_(std::move(other.state_)) {}

  ChannelSender& operator=(ChannelSender other) noexcept {
    std::swap(state_, other.state_);
    return *this;
  }

  ~ChannelSender() { detach(); }

  /**
   * @brief Отправить значение
   * @return false, если получатель уже уничтожен
   */
  bool send(T value) const {
    if (!state_) return false;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->receiverAlive) return false;
      state_->queue.push_back(std::move(value));
    }
    state_->cv.notify_one();
    return true;
  }

  /// Явно отказаться от отправки; эквивалентно уничтожению копии.
  void reset() { detach(); }

 private:
  template <typename U>
  friend std::pair<ChannelSender<U>, ChannelReceiver<U>> makeChannel();

  explicit ChannelSender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {
    attach();
  }

  void attach() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->senders;
  }

  void detach() {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      --state_->senders;
    }
    state_->cv.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * @class ChannelReceiver
 * @brief Единственный конец канала для чтения (только перемещение)
 */
template <typename T>
class ChannelReceiver {
 public:
  ChannelReceiver(ChannelReceiver&&) noexcept = default;
  ChannelReceiver& operator=(ChannelReceiver&&) noexcept = default;
  ChannelReceiver(const ChannelReceiver&) = delete;
  ChannelReceiver& operator=(const ChannelReceiver&) = delete;

  ~ChannelReceiver() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->receiverAlive = false;
  }

  /**
   * @brief Дождаться значения
   * @return Первое значение из очереди или std::nullopt, если очередь
   *         пуста и отправителей больше нет
   */
  std::optional<T> recv() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] {
      return !state_->queue.empty() || state_->senders == 0;
    });
    if (state_->queue.empty()) return std::nullopt;
    T value = std::move(state_->queue.front());
    state_->queue.pop_front();
    return value;
  }

 private:
  template <typename U>
  friend std::pair<ChannelSender<U>, ChannelReceiver<U>> makeChannel();

  explicit ChannelReceiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::ChannelState<T>> state_;
};

/// Создать связанную пару отправитель/получатель.
template <typename T>
std::pair<ChannelSender<T>, ChannelReceiver<T>> makeChannel() {
  auto state = std::make_shared<detail::ChannelState<T>>();
  return {ChannelSender<T>(state), ChannelReceiver<T>(state)};
}

/// Код завершения процесса
using ExitCode = int;
using ExitSender = ChannelSender<ExitCode>;
using ExitReceiver = ChannelReceiver<ExitCode>;

/// Коды завершения демона и воркера
namespace exit_code {
inline constexpr ExitCode SUCCESS = 0;
inline constexpr ExitCode ALREADY_RUNNING = 1;
inline constexpr ExitCode NOT_RUNNING = 2;
inline constexpr ExitCode INVALID_USAGE = 64;
inline constexpr ExitCode CHANNEL_CLOSED = 100;
inline constexpr ExitCode FATAL = 101;
}  // namespace exit_code
