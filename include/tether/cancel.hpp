#pragma once

#include <atomic>
#include <memory>

namespace tether {

/**
 * Shared cancellation flag. Copies observe the same flag, so a caller can
 * keep one copy and hand another to an asynchronous save or load.
 *
 * Operations check the token before each store call; a cancelled call
 * fails with StoreOperationFailed wrapping Aborted("cancelled"). Records
 * committed before that point stay committed.
 */
class CancelToken {
 public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() { flag_->store(true, std::memory_order_release); }
  bool cancelled() const { return flag_->load(std::memory_order_acquire); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace tether
