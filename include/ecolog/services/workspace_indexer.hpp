#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "ecolog/core/config_file.hpp"
#include "ecolog/core/module_resolver.hpp"
#include "ecolog/error/error.hpp"
#include "ecolog/language/language_registry.hpp"
#include "ecolog/services/workspace_index.hpp"
#include "ecolog/utils/canonical_path.hpp"
#include "ecolog/utils/cancellation_token.hpp"

namespace ecolog::services {

// Fills the WorkspaceIndex with the exports of every supported file under
// the workspace root.
//
// Files are parsed and analyzed on a dedicated pool; a full scan spreads the
// discovered files over WorkerCount() workers that poll the cancellation
// token before each file. A file that fails is counted and logged, and the
// scan goes on.
class WorkspaceIndexer {
 public:
  WorkspaceIndexer(
      std::shared_ptr<const language::LanguageRegistry> registry,
      std::shared_ptr<WorkspaceIndex> index,
      std::shared_ptr<ModuleResolver> module_resolver,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~WorkspaceIndexer();

  WorkspaceIndexer(const WorkspaceIndexer&) = delete;
  auto operator=(const WorkspaceIndexer&) -> WorkspaceIndexer& = delete;
  WorkspaceIndexer(WorkspaceIndexer&&) = delete;
  auto operator=(WorkspaceIndexer&&) -> WorkspaceIndexer& = delete;

  // Fails only for an unreadable root or cancellation; per-file failures are
  // reflected in the index statistics
  auto IndexWorkspace(
      const CanonicalPath& root, const EcologConfigFile& config,
      utils::CancellationToken token)
      -> asio::awaitable<std::expected<void, EcologError>>;

  auto OnFileChanged(const CanonicalPath& path)
      -> asio::awaitable<std::expected<void, EcologError>>;

  auto OnFileDeleted(const CanonicalPath& path) -> void;

  // Supported files under `root`, skipping ignored directories and excluded
  // paths, sorted
  [[nodiscard]] auto DiscoverFiles(
      const CanonicalPath& root, const EcologConfigFile& config) const
      -> std::vector<CanonicalPath>;

  // Parses and analyzes one file without touching any index
  static auto IndexFile(
      const language::LanguageSupport& language, const CanonicalPath& path,
      std::shared_ptr<spdlog::logger> logger) -> std::expected<IndexedFile, EcologError>;

  // min(max(cpus / 2, 1), 4)
  static auto WorkerCount() -> std::size_t;

 private:
  // Re-indexes `path` unless the stored entry has the same mtime
  auto IndexPath(const CanonicalPath& path) -> std::expected<void, EcologError>;

  std::shared_ptr<const language::LanguageRegistry> registry_;
  std::shared_ptr<WorkspaceIndex> index_;
  std::shared_ptr<ModuleResolver> module_resolver_;
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<asio::thread_pool> index_pool_;
};

}  // namespace ecolog::services
