#pragma once

#include <atomic>

namespace gridrun::execution {

// Cooperative cancellation flag. A token also reports cancelled when its
// parent is, so a per-template fail-fast token can hang off the pipeline-wide
// abort token. Observed only at step boundaries.
class CancellationToken {
public:
  explicit CancellationToken(const CancellationToken* parent = nullptr) : parent_(parent) {}

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // Returns true for the call that flipped the flag.
  bool Cancel() {
    bool expected = false;
    return cancelled_.compare_exchange_strong(expected, true);
  }

  bool IsCancelled() const {
    if (cancelled_.load()) {
      return true;
    }
    return parent_ != nullptr && parent_->IsCancelled();
  }

private:
  std::atomic<bool> cancelled_{false};
  const CancellationToken* parent_ = nullptr;
};

} // namespace gridrun::execution
