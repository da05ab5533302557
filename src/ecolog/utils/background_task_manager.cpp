#include "ecolog/utils/background_task_manager.hpp"

#include <algorithm>
#include <exception>
#include <variant>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/use_awaitable.hpp>

namespace ecolog::utils {

BackgroundTaskManager::BackgroundTaskManager(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      logger_(logger ? logger : spdlog::default_logger()),
      token_(executor) {
}

auto BackgroundTaskManager::Spawn(std::string name, asio::awaitable<void> task)
    -> void {
  auto tracked =
      std::make_shared<TrackedTask>(std::move(name), std::move(task), executor_);
  {
    std::lock_guard lock(mutex_);
    std::erase_if(tasks_, [](const auto& t) { return t->done.IsSet(); });
    tasks_.push_back(tracked);
  }

  logger_->debug("Background task '{}' started", tracked->name);
  asio::co_spawn(
      executor_,
      [tracked, logger = logger_]() -> asio::awaitable<void> {
        try {
          co_await std::move(*tracked->task);
          logger->debug("Background task '{}' finished", tracked->name);
        } catch (const std::exception& e) {
          logger->warn(
              "Background task '{}' terminated with error: {}", tracked->name,
              e.what());
        } catch (...) {
          logger->warn(
              "Background task '{}' terminated with unknown exception",
              tracked->name);
        }
        tracked->task.reset();
        tracked->done.Set();
      },
      asio::detached);
}

auto BackgroundTaskManager::SpawnCancellable(
    std::string name, asio::awaitable<void> task) -> void {
  auto raced = RaceWithToken(std::move(task), token_, logger_, name);
  Spawn(std::move(name), std::move(raced));
}

auto BackgroundTaskManager::RaceWithToken(
    asio::awaitable<void> work, CancellationToken token,
    std::shared_ptr<spdlog::logger> logger, std::string name)
    -> asio::awaitable<void> {
  using asio::experimental::awaitable_operators::operator||;

  if (token.IsCancelled()) {
    logger->debug("Background task '{}' cancelled before start", name);
    co_return;
  }
  auto result = co_await (std::move(work) || token.WaitCancelled());
  if (result.index() == 1 && token.IsCancelled()) {
    logger->debug("Background task '{}' cancelled", name);
  }
}

auto BackgroundTaskManager::Shutdown() -> asio::awaitable<void> {
  token_.Cancel();

  std::vector<std::shared_ptr<TrackedTask>> pending;
  {
    std::lock_guard lock(mutex_);
    pending.swap(tasks_);
  }

  logger_->debug("Waiting for {} background task(s)", pending.size());
  for (const auto& tracked : pending) {
    co_await tracked->done.AsyncWait(asio::use_awaitable);
  }
}

auto BackgroundTaskManager::ActiveCount() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return std::ranges::count_if(
      tasks_, [](const auto& t) { return !t->done.IsSet(); });
}

}  // namespace ecolog::utils
