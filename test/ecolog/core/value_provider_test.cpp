#include "ecolog/core/value_provider.hpp"

#include <chrono>
#include <memory>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/ecolog/common/async_fixture.hpp"
#include "test/ecolog/common/fixture_value_provider.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using ecolog::EcologErrorCode;
using ecolog::GuardedValueProvider;
using ecolog::test::FixtureValueProvider;
using ecolog::test::RunAsyncTest;
using std::chrono::milliseconds;

TEST_CASE("GuardedValueProvider passes through fast lookups", "[value_provider]") {
  RunAsyncTest([](asio::any_io_executor /*executor*/) -> asio::awaitable<void> {
    auto provider =
        std::make_shared<FixtureValueProvider>(FixtureValueProvider::Standard());
    GuardedValueProvider guarded(provider);

    auto found = co_await guarded.Lookup("PORT", "file:///app.ts");
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    CHECK((*found)->value == "8080");

    auto missing = co_await guarded.Lookup("NOT_SET", "file:///app.ts");
    REQUIRE(missing.has_value());
    CHECK_FALSE(missing->has_value());

    auto all = co_await guarded.LookupAll("file:///app.ts");
    REQUIRE(all.has_value());
    CHECK(all->size() == 4);
  });
}

TEST_CASE("GuardedValueProvider times out slow lookups", "[value_provider]") {
  RunAsyncTest([](asio::any_io_executor /*executor*/) -> asio::awaitable<void> {
    auto provider = std::make_shared<FixtureValueProvider>(
        FixtureValueProvider::Standard(), milliseconds(500));
    GuardedValueProvider guarded(
        provider, nullptr, milliseconds(20), milliseconds(40));

    auto start = std::chrono::steady_clock::now();
    auto result = co_await guarded.Lookup("PORT", "file:///app.ts");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == EcologErrorCode::Timeout);
    CHECK(elapsed < milliseconds(400));

    auto all = co_await guarded.LookupAll("file:///app.ts");
    REQUIRE_FALSE(all.has_value());
    CHECK(all.error().code() == EcologErrorCode::Timeout);
  });
}

TEST_CASE("GuardedValueProvider times out slow refreshes", "[value_provider]") {
  RunAsyncTest([](asio::any_io_executor /*executor*/) -> asio::awaitable<void> {
    auto provider = std::make_shared<FixtureValueProvider>(
        FixtureValueProvider::Standard(), milliseconds(300));
    GuardedValueProvider guarded(
        provider, nullptr, milliseconds(20), milliseconds(30));

    auto result = co_await guarded.Refresh({.force = true});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == EcologErrorCode::Timeout);
    // The abandoned refresh never completed
    CHECK(provider->RefreshCount() == 0);
  });
}

TEST_CASE("GuardedValueProvider refresh within deadline", "[value_provider]") {
  RunAsyncTest([](asio::any_io_executor /*executor*/) -> asio::awaitable<void> {
    auto provider =
        std::make_shared<FixtureValueProvider>(FixtureValueProvider::Standard());
    GuardedValueProvider guarded(provider);

    auto result = co_await guarded.Refresh({});
    CHECK(result.has_value());
    CHECK(provider->RefreshCount() == 1);
  });
}

TEST_CASE("GuardedValueProvider reports provider failures", "[value_provider]") {
  RunAsyncTest([](asio::any_io_executor /*executor*/) -> asio::awaitable<void> {
    auto provider =
        std::make_shared<FixtureValueProvider>(FixtureValueProvider::Standard());
    provider->SetThrowOnLookup(true);
    GuardedValueProvider guarded(provider);

    auto result = co_await guarded.Lookup("PORT", "file:///app.ts");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == EcologErrorCode::Internal);
  });
}
