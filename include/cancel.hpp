#pragma once
#include "errors.hpp"
#include <atomic>
#include <memory>

// Copies share one flag, so a caller can keep a copy and cancel from another thread.
class CancelToken {
public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  bool cancelled() const { return flag_->load(); }
  void check() const { if (cancelled()) throw Cancelled(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};
