#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace servant::runtime {

// Unbounded FIFO queue between any number of senders and one receiver.
// Closing is final: later pushes are refused, and items still queued are
// handed back to whoever closed it.
template <typename T>
class Mailbox {
 public:
  // Returns false, leaving `item` untouched, when the mailbox is closed.
  auto Push(T& item) -> bool {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // Blocks until an item is available. Returns nullopt once the mailbox is
  // closed and drained, or as soon as `stop` is requested.
  auto Pop(std::stop_token stop) -> std::optional<T> {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, stop, [&] { return !items_.empty() || closed_; });
    if (stop.stop_requested() || items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  // Close and return whatever was still queued.
  auto Close() -> std::vector<T> {
    std::vector<T> pending;
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
      while (!items_.empty()) {
        pending.push_back(std::move(items_.front()));
        items_.pop_front();
      }
    }
    cv_.notify_all();
    return pending;
  }

  [[nodiscard]] auto Closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  [[nodiscard]] auto Size() const -> size_t {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace servant::runtime
