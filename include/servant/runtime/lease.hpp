#pragma once

#include <functional>
#include <utility>

namespace servant::runtime {

// Gives back something borrowed for the duration of one call (a pool worker)
// when it goes out of scope. An empty lease releases nothing.
class Lease {
 public:
  Lease() = default;
  explicit Lease(std::function<void()> release) : release_(std::move(release)) {
  }

  ~Lease() {
    Release();
  }

  Lease(const Lease&) = delete;
  auto operator=(const Lease&) -> Lease& = delete;

  Lease(Lease&& other) noexcept : release_(std::exchange(other.release_, {})) {
  }
  auto operator=(Lease&& other) noexcept -> Lease& {
    if (this != &other) {
      Release();
      release_ = std::exchange(other.release_, {});
    }
    return *this;
  }

  void Release() {
    if (release_) {
      auto release = std::exchange(release_, {});
      release();
    }
  }

 private:
  std::function<void()> release_;
};

}  // namespace servant::runtime
