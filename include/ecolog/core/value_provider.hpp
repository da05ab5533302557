#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "ecolog/core/config_file.hpp"
#include "ecolog/core/range.hpp"
#include "ecolog/error/error.hpp"

namespace ecolog {

// Where a value was defined, e.g. a line of a .env file
struct ValueLocation {
  std::string uri;
  Range range;
};

struct ResolvedVariable {
  std::string name;
  std::string value;
  std::optional<ValueLocation> location;
};

struct RefreshOptions {
  // Re-read sources even when they look unchanged
  bool force = false;
};

// Supplies variable values. Implemented outside the analysis core (dotenv
// files, the process environment, remote secret stores).
class EnvValueProvider {
 public:
  EnvValueProvider() = default;
  EnvValueProvider(const EnvValueProvider&) = delete;
  EnvValueProvider(EnvValueProvider&&) = delete;
  auto operator=(const EnvValueProvider&) -> EnvValueProvider& = delete;
  auto operator=(EnvValueProvider&&) -> EnvValueProvider& = delete;
  virtual ~EnvValueProvider() = default;

  // `file_context` is the URI of the file asking, for per-directory sources
  virtual auto Lookup(std::string name, std::string file_context)
      -> asio::awaitable<std::optional<ResolvedVariable>> = 0;

  virtual auto LookupAll(std::string file_context)
      -> asio::awaitable<std::vector<ResolvedVariable>> = 0;

  virtual auto Refresh(RefreshOptions options) -> asio::awaitable<void> = 0;
};

// Runs every provider call against a deadline. A call that misses it, or
// throws, yields an error that callers treat as "no value".
class GuardedValueProvider {
 public:
  GuardedValueProvider(
      std::shared_ptr<EnvValueProvider> provider,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      std::chrono::milliseconds lookup_timeout = kDefaultLookupTimeout,
      std::chrono::milliseconds refresh_timeout = kDefaultRefreshTimeout);

  auto Lookup(std::string name, std::string file_context)
      -> asio::awaitable<
          std::expected<std::optional<ResolvedVariable>, EcologError>>;

  auto LookupAll(std::string file_context)
      -> asio::awaitable<
          std::expected<std::vector<ResolvedVariable>, EcologError>>;

  auto Refresh(RefreshOptions options)
      -> asio::awaitable<std::expected<void, EcologError>>;

  [[nodiscard]] auto LookupTimeout() const -> std::chrono::milliseconds {
    return lookup_timeout_;
  }

  [[nodiscard]] auto RefreshTimeout() const -> std::chrono::milliseconds {
    return refresh_timeout_;
  }

 private:
  std::shared_ptr<EnvValueProvider> provider_;
  std::shared_ptr<spdlog::logger> logger_;
  std::chrono::milliseconds lookup_timeout_;
  std::chrono::milliseconds refresh_timeout_;
};

}  // namespace ecolog
