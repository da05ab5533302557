#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "ecolog/core/analysis_types.hpp"
#include "ecolog/utils/canonical_path.hpp"

namespace ecolog {

inline constexpr std::string_view kConfigFileName = ".ecolog";

inline constexpr auto kDefaultLookupTimeout = std::chrono::milliseconds(5000);
inline constexpr auto kDefaultRefreshTimeout =
    std::chrono::milliseconds(10000);

// Contents of a .ecolog configuration file
class EcologConfigFile {
 public:
  struct Features {
    bool hover = true;
    bool completion = true;
    bool diagnostics = true;
    bool definition = true;
  };

  // Strict mode limits hover and completion to names the analysis resolved
  struct Strict {
    bool hover = true;
    bool completion = true;
  };

  explicit EcologConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> EcologConfigFile;

  // Returns std::nullopt if the file doesn't exist or cannot be parsed
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<EcologConfigFile>;

  // `<root>/.ecolog`, or the defaults when it is missing or malformed
  static auto LoadForWorkspace(
      const CanonicalPath& workspace_root,
      std::shared_ptr<spdlog::logger> logger = nullptr) -> EcologConfigFile;

  [[nodiscard]] auto GetFeatures() const -> const Features& {
    return features_;
  }

  [[nodiscard]] auto GetStrict() const -> const Strict& {
    return strict_;
  }

  [[nodiscard]] auto GetDebounceDelay() const -> std::chrono::milliseconds {
    return debounce_delay_;
  }

  [[nodiscard]] auto GetExcludePatterns() const
      -> const std::vector<std::string>& {
    return exclude_patterns_;
  }

  [[nodiscard]] auto GetLookupTimeout() const -> std::chrono::milliseconds {
    return lookup_timeout_;
  }

  [[nodiscard]] auto GetRefreshTimeout() const -> std::chrono::milliseconds {
    return refresh_timeout_;
  }

  // Takes a path relative to the workspace root with forward slashes
  [[nodiscard]] auto ShouldIncludeFile(std::string_view relative_path) const
      -> bool;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  Features features_;
  Strict strict_;
  std::chrono::milliseconds debounce_delay_ = kDefaultDebounceDelay;

  // Regexes matched against whole workspace-relative paths
  std::vector<std::string> exclude_patterns_;

  std::chrono::milliseconds lookup_timeout_ = kDefaultLookupTimeout;
  std::chrono::milliseconds refresh_timeout_ = kDefaultRefreshTimeout;
};

}  // namespace ecolog
