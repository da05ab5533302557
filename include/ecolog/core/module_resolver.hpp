#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "ecolog/utils/canonical_path.hpp"

namespace ecolog {

// Resolves relative import specifiers ("./config", "../env") to files inside
// the workspace. Package imports and absolute paths are not resolved.
//
// Candidates are tried in order: the specifier as written, the specifier with
// each extension appended, then `<specifier>/index<ext>`. Results, including
// misses, are cached per (specifier, importing directory) until Invalidate().
class ModuleResolver {
 public:
  explicit ModuleResolver(
      CanonicalPath workspace_root,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Resolve(
      std::string_view specifier, const CanonicalPath& importing_file,
      const std::vector<std::string>& extensions) const
      -> std::optional<CanonicalPath>;

  auto Invalidate() -> void;

  [[nodiscard]] auto WorkspaceRoot() const -> const CanonicalPath& {
    return workspace_root_;
  }

  [[nodiscard]] auto CacheSize() const -> std::size_t;

  static auto IsRelativeSpecifier(std::string_view specifier) -> bool;

 private:
  [[nodiscard]] auto Probe(
      const std::filesystem::path& base,
      const std::vector<std::string>& extensions) const
      -> std::optional<CanonicalPath>;

  CanonicalPath workspace_root_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex cache_mutex_;
  mutable std::unordered_map<std::string, std::optional<CanonicalPath>> cache_;
};

}  // namespace ecolog
