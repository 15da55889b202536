#pragma once

namespace crowdfund::execution {

/// Scoped busy flag. Only the outermost guard on a flag acquires it; nested
/// guards report failure and leave the flag untouched. The flag is cleared
/// when the acquiring guard leaves scope.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(bool& busy) : busy_{busy}, acquired_{!busy} {
    if (acquired_) {
      busy_ = true;
    }
  }

  ~reentrancy_guard() {
    if (acquired_) {
      busy_ = false;
    }
  }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;
  reentrancy_guard(reentrancy_guard&&) = delete;
  reentrancy_guard& operator=(reentrancy_guard&&) = delete;

  bool acquired() const { return acquired_; }
  explicit operator bool() const { return acquired_; }

 private:
  bool& busy_;
  bool acquired_;
};

}  // namespace crowdfund::execution
