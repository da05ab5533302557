#include "ecolog/utils/broadcast_event.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <variant>

#include <asio.hpp>
#include <asio/experimental/awaitable_operators.hpp>
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
using ecolog::utils::BroadcastEvent;
using std::chrono::milliseconds;

namespace {

auto SpawnWaiters(
    asio::any_io_executor executor, std::shared_ptr<BroadcastEvent> event,
    std::shared_ptr<std::atomic<int>> counter, int count) -> void {
  for (int i = 0; i < count; ++i) {
    asio::co_spawn(
        executor,
        [event, counter]() -> asio::awaitable<void> {
          co_await event->AsyncWait(asio::use_awaitable);
          counter->fetch_add(1, std::memory_order_relaxed);
        },
        asio::detached);
  }
}

}  // namespace

TEST_CASE("A set event releases late joiners immediately", "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    BroadcastEvent event(executor);
    CHECK_FALSE(event.IsSet());

    event.Set();
    co_await event.AsyncWait(asio::use_awaitable);
    co_await event.AsyncWait(asio::use_awaitable);

    CHECK(event.IsSet());
  });
}

TEST_CASE("Set wakes every pending waiter once", "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto event = std::make_shared<BroadcastEvent>(executor);
    auto woken = std::make_shared<std::atomic<int>>(0);

    SpawnWaiters(executor, event, woken, 20);
    co_await Sleep(executor, milliseconds(30));
    CHECK(woken->load() == 0);

    // Repeated sets are no-ops
    event->Set();
    event->Set();
    co_await Sleep(executor, milliseconds(30));
    CHECK(woken->load() == 20);

    SpawnWaiters(executor, event, woken, 3);
    co_await Sleep(executor, milliseconds(30));
    CHECK(woken->load() == 23);
  });
}

TEST_CASE("A published result is visible to every waiter", "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto event = std::make_shared<BroadcastEvent>(executor);
    auto published = std::make_shared<std::atomic<int>>(0);
    auto seen = std::make_shared<std::atomic<int>>(0);

    for (int i = 0; i < 2; ++i) {
      asio::co_spawn(
          executor,
          [event, published, seen]() -> asio::awaitable<void> {
            co_await event->AsyncWait(asio::use_awaitable);
            seen->fetch_add(published->load(std::memory_order_acquire));
          },
          asio::detached);
    }

    asio::co_spawn(
        executor,
        [event, published, executor]() -> asio::awaitable<void> {
          co_await Sleep(executor, milliseconds(20));
          published->store(7, std::memory_order_release);
          event->Set();
        },
        asio::detached);

    co_await Sleep(executor, milliseconds(100));
    CHECK(seen->load() == 14);
  });
}

TEST_CASE("A cancelled wait completes without the event", "[broadcast_event]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    using asio::experimental::awaitable_operators::operator||;

    BroadcastEvent event(executor);
    asio::steady_timer timer(executor, milliseconds(20));

    // The timer wins; the losing wait is cancelled through its slot
    auto result = co_await (
        event.AsyncWait(asio::use_awaitable) ||
        timer.async_wait(asio::use_awaitable));

    CHECK(result.index() == 1);
    CHECK_FALSE(event.IsSet());

    // The event still works for later waiters
    event.Set();
    co_await event.AsyncWait(asio::use_awaitable);
    CHECK(event.IsSet());
  });
}
