#pragma once

#include <atomic>
#include <memory>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/use_awaitable.hpp>

#include "ecolog/utils/broadcast_event.hpp"

namespace ecolog::utils {

// Shared cancellation handle. Copies observe the same state, so a supervisor
// keeps one copy and hands others to the tasks it spawns.
//
// Tasks either poll IsCancelled() between units of work or race their work
// against WaitCancelled().
class CancellationToken {
 public:
  explicit CancellationToken(asio::any_io_executor executor)
      : state_(std::make_shared<State>(executor)) {
  }

  auto Cancel() -> void {
    if (!state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
      state_->event.Set();
    }
  }

  [[nodiscard]] auto IsCancelled() const -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

  // Completes when Cancel() is called, or early when this wait is itself
  // cancelled through its cancellation slot.
  auto WaitCancelled() const -> asio::awaitable<void> {
    if (IsCancelled()) {
      co_return;
    }
    auto state = state_;
    co_await state->event.AsyncWait(asio::use_awaitable);
  }

 private:
  struct State {
    explicit State(asio::any_io_executor exec) : event(exec) {
    }
    std::atomic<bool> cancelled{false};
    BroadcastEvent event;
  };

  std::shared_ptr<State> state_;
};

}  // namespace ecolog::utils
