#include "ecolog/utils/background_task_manager.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/ecolog/common/async_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using ecolog::test::RunAsyncTest;
using ecolog::test::Sleep;
using ecolog::utils::BackgroundTaskManager;
using ecolog::utils::CancellationToken;
using std::chrono::milliseconds;

namespace {

auto CountAfter(
    asio::any_io_executor executor, milliseconds delay,
    std::shared_ptr<std::atomic<int>> counter) -> asio::awaitable<void> {
  co_await Sleep(executor, delay);
  counter->fetch_add(1);
}

auto Fail() -> asio::awaitable<void> {
  throw std::runtime_error("boom");
  co_return;
}

}  // namespace

TEST_CASE("Spawned tasks run to completion", "[background_task_manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    BackgroundTaskManager tasks(executor);
    auto counter = std::make_shared<std::atomic<int>>(0);

    tasks.Spawn("first", CountAfter(executor, milliseconds(10), counter));
    tasks.Spawn("second", CountAfter(executor, milliseconds(20), counter));
    CHECK(tasks.ActiveCount() == 2);

    co_await Sleep(executor, milliseconds(80));
    CHECK(counter->load() == 2);
    CHECK(tasks.ActiveCount() == 0);

    co_await tasks.Shutdown();
    CHECK(tasks.IsCancelled());
  });
}

TEST_CASE("A throwing task is contained", "[background_task_manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    BackgroundTaskManager tasks(executor);
    auto counter = std::make_shared<std::atomic<int>>(0);

    tasks.Spawn("failing", Fail());
    tasks.Spawn("healthy", CountAfter(executor, milliseconds(10), counter));

    co_await Sleep(executor, milliseconds(50));
    CHECK(counter->load() == 1);
    CHECK(tasks.ActiveCount() == 0);
    co_await tasks.Shutdown();
  });
}

TEST_CASE("Shutdown abandons cancellable tasks", "[background_task_manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    BackgroundTaskManager tasks(executor);
    auto counter = std::make_shared<std::atomic<int>>(0);

    tasks.SpawnCancellable(
        "slow", CountAfter(executor, milliseconds(5000), counter));
    co_await Sleep(executor, milliseconds(10));
    CHECK(tasks.ActiveCount() == 1);

    auto start = std::chrono::steady_clock::now();
    co_await tasks.Shutdown();
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(elapsed < milliseconds(1000));
    CHECK(counter->load() == 0);
    CHECK(tasks.ActiveCount() == 0);

    // Nothing new starts once cancelled
    tasks.SpawnCancellable("late", CountAfter(executor, milliseconds(1), counter));
    co_await Sleep(executor, milliseconds(30));
    CHECK(counter->load() == 0);
  });
}

TEST_CASE("Cancellation tokens share state across copies", "[background_task_manager]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    CancellationToken token(executor);
    auto copy = token;
    auto woken = std::make_shared<std::atomic<bool>>(false);

    asio::co_spawn(
        executor,
        [copy, woken]() -> asio::awaitable<void> {
          co_await copy.WaitCancelled();
          woken->store(true);
        },
        asio::detached);

    co_await Sleep(executor, milliseconds(20));
    CHECK_FALSE(woken->load());
    CHECK_FALSE(copy.IsCancelled());

    token.Cancel();
    token.Cancel();
    co_await Sleep(executor, milliseconds(20));
    CHECK(woken->load());
    CHECK(copy.IsCancelled());

    // Already cancelled: returns at once
    co_await copy.WaitCancelled();
  });
}
