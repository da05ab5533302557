#include "ecolog/core/value_provider.hpp"

#include <exception>
#include <variant>

#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace ecolog {

namespace {

template <typename T>
auto WithDeadline(
    asio::awaitable<T> call, std::chrono::milliseconds timeout,
    std::string what, std::shared_ptr<spdlog::logger> logger)
    -> asio::awaitable<std::expected<T, EcologError>> {
  using asio::experimental::awaitable_operators::operator||;

  auto executor = co_await asio::this_coro::executor;
  asio::steady_timer deadline(executor, timeout);
  try {
    auto result =
        co_await (std::move(call) || deadline.async_wait(asio::use_awaitable));
    if (result.index() == 1) {
      logger->warn("{} timed out after {}ms", what, timeout.count());
      co_return EcologError::Unexpected(EcologErrorCode::Timeout, what);
    }
    co_return std::get<0>(std::move(result));
  } catch (const std::exception& e) {
    logger->error("{} failed: {}", what, e.what());
    co_return EcologError::Unexpected(EcologErrorCode::Internal, e.what());
  }
}

}  // namespace

GuardedValueProvider::GuardedValueProvider(
    std::shared_ptr<EnvValueProvider> provider,
    std::shared_ptr<spdlog::logger> logger,
    std::chrono::milliseconds lookup_timeout,
    std::chrono::milliseconds refresh_timeout)
    : provider_(std::move(provider)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      lookup_timeout_(lookup_timeout),
      refresh_timeout_(refresh_timeout) {
}

auto GuardedValueProvider::Lookup(std::string name, std::string file_context)
    -> asio::awaitable<
        std::expected<std::optional<ResolvedVariable>, EcologError>> {
  auto what = fmt::format("Lookup of '{}'", name);
  co_return co_await WithDeadline(
      provider_->Lookup(std::move(name), std::move(file_context)),
      lookup_timeout_, std::move(what), logger_);
}

auto GuardedValueProvider::LookupAll(std::string file_context)
    -> asio::awaitable<
        std::expected<std::vector<ResolvedVariable>, EcologError>> {
  co_return co_await WithDeadline(
      provider_->LookupAll(std::move(file_context)), lookup_timeout_,
      "Lookup of all variables", logger_);
}

auto GuardedValueProvider::Refresh(RefreshOptions options)
    -> asio::awaitable<std::expected<void, EcologError>> {
  using asio::experimental::awaitable_operators::operator||;

  auto executor = co_await asio::this_coro::executor;
  asio::steady_timer deadline(executor, refresh_timeout_);
  try {
    auto result = co_await (
        provider_->Refresh(options) || deadline.async_wait(asio::use_awaitable));
    if (result.index() == 1) {
      logger_->warn("Refresh timed out after {}ms", refresh_timeout_.count());
      co_return EcologError::Unexpected(EcologErrorCode::Timeout, "refresh");
    }
    co_return std::expected<void, EcologError>{};
  } catch (const std::exception& e) {
    logger_->error("Refresh failed: {}", e.what());
    co_return EcologError::Unexpected(EcologErrorCode::Internal, e.what());
  }
}

}  // namespace ecolog
