// Copyright (c) 2024 liudegui. MIT License.
//
// sqlcred::Context -- caller-supplied cancellation for lifecycle calls.
//
// Design:
//   - Cancel() may be called from any thread while an operation runs
//   - Optional deadline fixed at construction
//   - Check() is polled before every database call
//   - Connections watch the context while a statement runs and abort it
//     once Check() fails (SQLite progress handler, MySQL KILL QUERY)

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "sqlcred/error.hpp"

namespace sqlcred {

// ---------------------------------------------------------------------------
// Context
// ---------------------------------------------------------------------------

class Context {
 public:
  using Clock = std::chrono::steady_clock;

  Context() = default;

  explicit Context(std::chrono::milliseconds timeout)
      : has_deadline_(true), deadline_(Clock::now() + timeout) {}

  // Shared by reference with the canceller; no copy or move.
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  /// A context that is never cancelled and has no deadline.
  static const Context& Background() {
    static const Context background;
    return background;
  }

  void Cancel() { cancelled_.store(true, std::memory_order_release); }

  bool Cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  bool HasDeadline() const { return has_deadline_; }

  Error Check() const {
    if (Cancelled()) {
      return Error::Make(ErrorCode::kCancelled, "context canceled");
    }
    if (has_deadline_ && Clock::now() >= deadline_) {
      return Error::Make(ErrorCode::kCancelled, "context deadline exceeded");
    }
    return Error::Ok();
  }

 private:
  std::atomic<bool> cancelled_{false};
  bool has_deadline_ = false;
  Clock::time_point deadline_{};
};

}  // namespace sqlcred
