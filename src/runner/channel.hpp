#pragma once
/// @file channel.hpp
/// @brief Closable multi-producer / multi-consumer handoff channel.
///
/// With capacity 0 the channel is a rendezvous: a value is only accepted
/// when a receiver is already parked in receive(), so try_send() doubles as
/// an "is anyone idle?" check. A positive capacity adds a FIFO buffer in
/// front of the waiting receivers.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace loadgen {

template <typename T> class Channel {
public:
  explicit Channel(std::size_t capacity = 0) : capacity_{capacity} {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /// @brief Hand @p value over, blocking until it is accepted.
  /// @param stop Abandons the send when stop is requested.
  /// @return false if the channel closed or @p stop fired first; the value
  ///         is dropped in that case.
  auto send(T value, std::stop_token stop = {}) -> bool {
    std::unique_lock lock(mutex_);
    const bool ready = send_cv_.wait(lock, stop, [this] {
      return closed_ || has_room();
    });
    if (!ready || closed_) {
      return false;
    }
    queue_.push_back(std::move(value));
    recv_cv_.notify_one();
    return true;
  }

  /// @brief Hand @p value over only if it can be accepted right now.
  auto try_send(T value) -> bool {
    std::lock_guard lock(mutex_);
    if (closed_ || !has_room()) {
      return false;
    }
    queue_.push_back(std::move(value));
    recv_cv_.notify_one();
    return true;
  }

  /// @brief Take the next value, blocking until one arrives.
  /// @return std::nullopt once the channel is closed and empty.
  auto receive() -> std::optional<T> {
    std::unique_lock lock(mutex_);
    ++waiting_receivers_;
    // A parked receiver is room for one more sender.
    send_cv_.notify_one();
    recv_cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    --waiting_receivers_;

    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    send_cv_.notify_one();
    return value;
  }

  /// @brief Close the channel. Buffered values stay receivable. Idempotent.
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    recv_cv_.notify_all();
    send_cv_.notify_all();
  }

  [[nodiscard]] auto closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
  }

private:
  // Every queued value is owed to either a buffer slot or a parked receiver.
  [[nodiscard]] auto has_room() const -> bool {
    return queue_.size() < capacity_ + waiting_receivers_;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable_any send_cv_;
  std::condition_variable_any recv_cv_;
  std::deque<T> queue_;
  std::size_t waiting_receivers_ = 0;
  bool closed_ = false;
};

} // namespace loadgen
