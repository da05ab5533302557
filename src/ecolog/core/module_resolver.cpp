#include "ecolog/core/module_resolver.hpp"

#include <system_error>

#include "ecolog/utils/path_utils.hpp"

namespace ecolog {

namespace {

auto IsRegularFile(const std::filesystem::path& path) -> bool {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

auto CacheKey(
    std::string_view specifier, const std::filesystem::path& importing_dir,
    const std::vector<std::string>& extensions) -> std::string {
  std::string key(specifier);
  key += '\n';
  key += importing_dir.string();
  for (const auto& ext : extensions) {
    key += '\n';
    key += ext;
  }
  return key;
}

}  // namespace

ModuleResolver::ModuleResolver(
    CanonicalPath workspace_root, std::shared_ptr<spdlog::logger> logger)
    : workspace_root_(std::move(workspace_root)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto ModuleResolver::IsRelativeSpecifier(std::string_view specifier) -> bool {
  return specifier.starts_with("./") || specifier.starts_with("../");
}

auto ModuleResolver::Resolve(
    std::string_view specifier, const CanonicalPath& importing_file,
    const std::vector<std::string>& extensions) const
    -> std::optional<CanonicalPath> {
  if (!IsRelativeSpecifier(specifier)) {
    return std::nullopt;
  }

  auto importing_dir = importing_file.Path().parent_path();
  auto key = CacheKey(specifier, importing_dir, extensions);
  {
    std::scoped_lock lock(cache_mutex_);
    if (auto it = cache_.find(key); it != cache_.end()) {
      return it->second;
    }
  }

  std::optional<CanonicalPath> result;
  auto base = NormalizeLexically(importing_dir / std::filesystem::path(specifier));
  if (CanonicalPath(base).IsSubPathOf(workspace_root_)) {
    result = Probe(base, extensions);
  } else {
    logger_->debug(
        "Import {} from {} escapes the workspace", specifier, importing_file);
  }

  std::scoped_lock lock(cache_mutex_);
  cache_.insert_or_assign(std::move(key), result);
  return result;
}

auto ModuleResolver::Probe(
    const std::filesystem::path& base,
    const std::vector<std::string>& extensions) const
    -> std::optional<CanonicalPath> {
  if (IsRegularFile(base)) {
    return CanonicalPath(base);
  }

  // Appended, not replaced: "settings.input" -> "settings.input.ts"
  for (const auto& ext : extensions) {
    std::filesystem::path candidate = base;
    candidate += ext;
    if (IsRegularFile(candidate)) {
      return CanonicalPath(candidate);
    }
  }

  for (const auto& ext : extensions) {
    auto candidate = base / ("index" + ext);
    if (IsRegularFile(candidate)) {
      return CanonicalPath(candidate);
    }
  }
  return std::nullopt;
}

auto ModuleResolver::Invalidate() -> void {
  std::scoped_lock lock(cache_mutex_);
  cache_.clear();
}

auto ModuleResolver::CacheSize() const -> std::size_t {
  std::scoped_lock lock(cache_mutex_);
  return cache_.size();
}

}  // namespace ecolog
