#pragma once

#include <unistd.h>

namespace bootforge::common {

/// Owning POSIX file descriptor; closes on destruction.
class unique_fd final {
 public:
  unique_fd() = default;
  explicit unique_fd(const int fd) : fd_{fd} {}
  ~unique_fd() { reset(); }

  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  unique_fd(unique_fd&& other) noexcept : fd_{other.release()} {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

  int release() {
    auto fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset(const int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_{-1};
};

}  // namespace bootforge::common
