#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace jobstore::util {

/*
  Advisory cancellation.

  Checked at every store call boundary: a cancelled token stops the next
  call from being issued and discards the result of one already in flight.
  Store-side writes that already happened are not undone.
*/
class CancellationSource;

class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancelled() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

  void ThrowIfCancelled(const std::string& context) const {
    if (IsCancelled()) {
      throw OperationCancelled(context + ": cancelled");
    }
  }

  // A token that is never cancelled.
  static CancellationToken None() {
    return CancellationToken{};
  }

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {
  }

  std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
 public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {
  }

  CancellationToken Token() const {
    return CancellationToken(flag_);
  }

  void Cancel() {
    flag_->store(true, std::memory_order_release);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace jobstore::util
