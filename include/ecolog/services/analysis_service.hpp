#pragma once

#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "ecolog/core/analysis_types.hpp"
#include "ecolog/core/config_file.hpp"
#include "ecolog/core/module_resolver.hpp"
#include "ecolog/core/value_provider.hpp"
#include "ecolog/error/error.hpp"
#include "ecolog/features/diagnostics_provider.hpp"
#include "ecolog/language/language_registry.hpp"
#include "ecolog/services/cross_module_resolver.hpp"
#include "ecolog/services/document_manager.hpp"
#include "ecolog/services/workspace_index.hpp"
#include "ecolog/services/workspace_indexer.hpp"
#include "ecolog/utils/background_task_manager.hpp"
#include "ecolog/utils/canonical_path.hpp"

namespace ecolog::services {

// Entry point for request handlers: open documents, the workspace index and
// position queries that span both.
class AnalysisService {
 public:
  // A null registry means every bundled language; a null value provider
  // disables diagnostics
  AnalysisService(
      asio::any_io_executor executor, CanonicalPath workspace_root,
      std::shared_ptr<const language::LanguageRegistry> registry = nullptr,
      std::shared_ptr<EnvValueProvider> values = nullptr,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      EcologConfigFile config = EcologConfigFile::CreateDefault());

  AnalysisService(const AnalysisService&) = delete;
  auto operator=(const AnalysisService&) -> AnalysisService& = delete;
  AnalysisService(AnalysisService&&) = delete;
  auto operator=(AnalysisService&&) -> AnalysisService& = delete;
  ~AnalysisService() = default;

  // Document lifecycle
  auto Open(std::string uri, std::string language_id, int version, std::string text)
      -> asio::awaitable<void>;
  auto Change(std::string uri, int version, std::string text)
      -> asio::awaitable<void>;
  auto Close(std::string uri) -> asio::awaitable<void>;
  auto Flush(std::string uri) -> asio::awaitable<void>;

  // Per-document queries over the latest published analysis
  [[nodiscard]] auto Get(const std::string& uri) const
      -> std::shared_ptr<const DocumentSnapshot>;
  [[nodiscard]] auto ReferenceAt(const std::string& uri, const Position& pos) const
      -> std::optional<Reference>;
  [[nodiscard]] auto CompletionContextAt(
      const std::string& uri, const Position& pos) const
      -> std::optional<std::string>;
  [[nodiscard]] auto SyntaxErrors(const std::string& uri) const
      -> std::vector<language::SyntaxErrorFact>;
  [[nodiscard]] auto FindEnvVarUsages(
      const std::string& uri, std::string_view name) const
      -> std::vector<Reference>;
  [[nodiscard]] auto AllEnvVars(const std::string& uri) const
      -> std::vector<std::string>;

  // Canonical variable under the cursor, following imports into indexed files
  [[nodiscard]] auto Resolve(const std::string& uri, const Position& pos) const
      -> std::optional<Resolution>;

  // Indexed exports, or those of the open document when it is not indexed
  [[nodiscard]] auto ExportsOf(const std::string& uri) const
      -> std::optional<ExportIndexEntry>;

  [[nodiscard]] auto ResolveModuleSpecifier(
      std::string_view specifier, const std::string& importing_uri,
      std::string_view language_id) const -> std::optional<std::string>;

  auto IndexWorkspace(const EcologConfigFile& config)
      -> asio::awaitable<std::expected<void, EcologError>>;

  // Indexes as a cancellable background task
  auto StartWorkspaceIndexing() -> void;

  auto OnFileChanged(const std::string& uri)
      -> asio::awaitable<std::expected<void, EcologError>>;
  auto OnFileDeleted(const std::string& uri) -> void;

  // Undefined-variable warnings; empty when no value provider is attached
  auto Diagnostics(std::string uri)
      -> asio::awaitable<std::vector<features::Diagnostic>>;

  auto ApplyConfig(EcologConfigFile config) -> asio::awaitable<void>;

  [[nodiscard]] auto IndexStatistics() const -> IndexStats {
    return index_->Stats();
  }

  [[nodiscard]] auto Config() const -> EcologConfigFile {
    std::scoped_lock lock(config_mutex_);
    return config_;
  }

  [[nodiscard]] auto Documents() -> DocumentManager& {
    return *documents_;
  }

  // Cancels background indexing and waits for it to stop
  auto Shutdown() -> asio::awaitable<void>;

 private:
  auto RunWorkspaceIndexing() -> asio::awaitable<void>;

  // Import-derived resolution of the identifier or property at `pos`
  [[nodiscard]] auto ResolveImportedToken(
      const std::string& uri, const DocumentSnapshot& snapshot,
      const Position& pos) const -> std::optional<Resolution>;

  asio::any_io_executor executor_;
  CanonicalPath workspace_root_;
  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex config_mutex_;
  EcologConfigFile config_;

  std::shared_ptr<const language::LanguageRegistry> registry_;
  std::shared_ptr<WorkspaceIndex> index_;
  std::shared_ptr<ModuleResolver> module_resolver_;
  std::unique_ptr<DocumentManager> documents_;
  std::unique_ptr<WorkspaceIndexer> indexer_;
  std::unique_ptr<CrossModuleResolver> cross_module_;
  std::unique_ptr<features::DiagnosticsProvider> diagnostics_;
  std::unique_ptr<utils::BackgroundTaskManager> tasks_;
};

}  // namespace ecolog::services
