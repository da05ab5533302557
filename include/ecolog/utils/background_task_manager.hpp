#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "ecolog/utils/broadcast_event.hpp"
#include "ecolog/utils/cancellation_token.hpp"

namespace ecolog::utils {

// Owns long-lived background coroutines (indexing, refresh) and joins them on
// shutdown.
//
// Each spawned awaitable is stored in a TrackedTask and awaited by a light
// detached runner that signals `done` when the work finishes. The work frame
// is released as soon as it completes, not when the io_context stops.
class BackgroundTaskManager {
 public:
  BackgroundTaskManager(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~BackgroundTaskManager() = default;

  BackgroundTaskManager(const BackgroundTaskManager&) = delete;
  auto operator=(const BackgroundTaskManager&)
      -> BackgroundTaskManager& = delete;
  BackgroundTaskManager(BackgroundTaskManager&&) = delete;
  auto operator=(BackgroundTaskManager&&) -> BackgroundTaskManager& = delete;

  auto Spawn(std::string name, asio::awaitable<void> task) -> void;

  // Races the task against the manager's token; a cancelled task is abandoned
  // at its next suspension point.
  auto SpawnCancellable(std::string name, asio::awaitable<void> task) -> void;

  [[nodiscard]] auto Token() const -> CancellationToken {
    return token_;
  }

  auto Cancel() -> void {
    token_.Cancel();
  }

  [[nodiscard]] auto IsCancelled() const -> bool {
    return token_.IsCancelled();
  }

  // Cancels, then waits for every tracked task to finish
  auto Shutdown() -> asio::awaitable<void>;

  [[nodiscard]] auto ActiveCount() const -> std::size_t;

 private:
  struct TrackedTask {
    TrackedTask(
        std::string task_name, asio::awaitable<void> work,
        asio::any_io_executor executor)
        : name(std::move(task_name)), task(std::move(work)), done(executor) {
    }

    std::string name;
    std::optional<asio::awaitable<void>> task;
    BroadcastEvent done;
  };

  static auto RaceWithToken(
      asio::awaitable<void> work, CancellationToken token,
      std::shared_ptr<spdlog::logger> logger, std::string name)
      -> asio::awaitable<void>;

  asio::any_io_executor executor_;
  std::shared_ptr<spdlog::logger> logger_;
  CancellationToken token_;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<TrackedTask>> tasks_;
};

}  // namespace ecolog::utils
