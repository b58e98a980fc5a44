#pragma once

#include <atomic>
#include <memory>

namespace bootforge::common {

/// Cooperative cancellation flag scoped to one workflow run.
///
/// Copies share the flag. `cancel` is async-signal-safe, so a SIGINT handler
/// may raise it through `raw_flag`.
class cancel_signal final {
 public:
  cancel_signal() : flag_{std::make_shared<std::atomic<bool>>(false)} {}

  void cancel() const { flag_->store(true, std::memory_order_release); }

  bool cancelled() const { return flag_->load(std::memory_order_acquire); }

  std::atomic<bool>* raw_flag() const { return flag_.get(); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace bootforge::common
