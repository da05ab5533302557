#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace ecolog::utils {

// Logs "<operation> completed (<duration>)" on destruction. Durations past
// the optional slow threshold are logged at warn instead of debug.
class ScopedTimer {
 public:
  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer(ScopedTimer &&) = delete;
  auto operator=(const ScopedTimer &) -> ScopedTimer & = delete;
  auto operator=(ScopedTimer &&) -> ScopedTimer & = delete;
  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger,
      std::optional<std::chrono::milliseconds> slow_threshold = std::nullopt);
  ~ScopedTimer();

  [[nodiscard]] auto GetElapsed() const -> std::chrono::milliseconds;

  // "123ms" or "1.2s"
  static auto FormatDuration(std::chrono::milliseconds duration) -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
  std::optional<std::chrono::milliseconds> slow_threshold_;
};

}  // namespace ecolog::utils
