#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>

#include <asio/any_io_executor.hpp>
#include <asio/associated_cancellation_slot.hpp>
#include <asio/async_result.hpp>
#include <asio/cancellation_type.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

namespace ecolog::utils {

// One-shot signal that wakes every waiter at once.
//
// Waiters that arrive after Set() complete immediately. The waiter table is
// guarded by an internal strand; the ready flag is atomic so IsSet() can be
// polled from any thread.
//
// A wait bound to a cancellation slot (for example one side of an
// awaitable_operators race) completes early when cancellation is emitted.
// Such a wait completes like a normal one, so racing callers check IsSet()
// to tell the two apart.
//
// State lives behind a shared_ptr so handlers queued on the strand stay valid
// after the event object itself is destroyed.
class BroadcastEvent {
 public:
  explicit BroadcastEvent(asio::any_io_executor executor)
      : state_(std::make_shared<State>(executor)) {
  }

  ~BroadcastEvent() = default;

  BroadcastEvent(const BroadcastEvent&) = delete;
  auto operator=(const BroadcastEvent&) -> BroadcastEvent& = delete;
  BroadcastEvent(BroadcastEvent&&) = delete;
  auto operator=(BroadcastEvent&&) -> BroadcastEvent& = delete;

  template <typename CompletionToken>
  auto AsyncWait(CompletionToken&& token) {
    return asio::async_initiate<CompletionToken, void()>(
        [state = state_](auto handler) {
          auto slot = asio::get_associated_cancellation_slot(handler);
          auto id = state->next_id.fetch_add(1, std::memory_order_relaxed);
          if (slot.is_connected()) {
            slot.assign([state, id](asio::cancellation_type /*type*/) {
              asio::post(state->strand, [state, id]() {
                auto it = state->waiters.find(id);
                if (it == state->waiters.end()) {
                  return;
                }
                auto waiter = std::move(it->second);
                state->waiters.erase(it);
                asio::post(state->executor, [w = std::move(waiter)]() {
                  w->Invoke();
                });
              });
            });
          }
          asio::post(
              state->strand, [state, id, h = std::move(handler)]() mutable {
                if (state->ready.load(std::memory_order_acquire)) {
                  asio::post(state->executor, std::move(h));
                  return;
                }
                state->waiters.emplace(
                    id, std::make_unique<ConcreteHandler<decltype(h)>>(
                            std::move(h)));
              });
        },
        std::forward<CompletionToken>(token));
  }

  // Idempotent, callable from any thread
  auto Set() -> void {
    asio::post(state_->strand, [state = state_]() {
      if (state->ready.exchange(true, std::memory_order_acq_rel)) {
        return;
      }
      auto waiters = std::move(state->waiters);
      state->waiters.clear();
      for (auto& [id, handler] : waiters) {
        asio::post(state->executor, [h = std::move(handler)]() {
          h->Invoke();
        });
      }
    });
  }

  // Flips once the strand has processed Set(), so a poll immediately after
  // Set() may still see false.
  [[nodiscard]] auto IsSet() const -> bool {
    return state_->ready.load(std::memory_order_acquire);
  }

 private:
  struct Handler {
    virtual ~Handler() = default;
    Handler() = default;
    Handler(const Handler&) = delete;
    auto operator=(const Handler&) -> Handler& = delete;
    Handler(Handler&&) = delete;
    auto operator=(Handler&&) -> Handler& = delete;
    virtual auto Invoke() -> void = 0;
  };

  template <typename F>
  struct ConcreteHandler : Handler {
    explicit ConcreteHandler(F&& f) : func(std::move(f)) {
    }
    auto Invoke() -> void override {
      std::move(func)();
    }
    F func;
  };

  struct State {
    explicit State(asio::any_io_executor exec)
        : executor(exec), strand(asio::make_strand(exec)) {
    }

    asio::any_io_executor executor;
    asio::strand<asio::any_io_executor> strand;
    std::atomic<bool> ready{false};
    std::atomic<uint64_t> next_id{0};
    std::map<uint64_t, std::unique_ptr<Handler>> waiters;
  };

  std::shared_ptr<State> state_;
};

}  // namespace ecolog::utils
