#include "ecolog/services/workspace_indexer.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <sstream>
#include <thread>
#include <unordered_set>

#include "ecolog/semantic/analysis_pipeline.hpp"
#include "ecolog/semantic/binding_resolver.hpp"
#include "ecolog/utils/broadcast_event.hpp"
#include "ecolog/utils/path_utils.hpp"
#include "ecolog/utils/scoped_timer.hpp"

namespace ecolog::services {

namespace {

auto ReadFile(const CanonicalPath& path) -> std::expected<std::string, EcologError> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.Path(), ec)) {
    return EcologError::Unexpected(EcologErrorCode::FileNotFound, path.String());
  }
  std::ifstream file(path.Path(), std::ios::binary);
  if (!file) {
    return EcologError::Unexpected(
        EcologErrorCode::FileAccessDenied, path.String());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace

WorkspaceIndexer::WorkspaceIndexer(
    std::shared_ptr<const language::LanguageRegistry> registry,
    std::shared_ptr<WorkspaceIndex> index,
    std::shared_ptr<ModuleResolver> module_resolver,
    std::shared_ptr<spdlog::logger> logger)
    : registry_(std::move(registry)),
      index_(std::move(index)),
      module_resolver_(std::move(module_resolver)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      index_pool_(std::make_unique<asio::thread_pool>(WorkerCount())) {
}

WorkspaceIndexer::~WorkspaceIndexer() {
  index_pool_->join();
}

auto WorkspaceIndexer::WorkerCount() -> std::size_t {
  const auto hw_threads = std::thread::hardware_concurrency();
  return std::min<std::size_t>(std::max<std::size_t>(hw_threads / 2, 1), 4);
}

auto WorkspaceIndexer::DiscoverFiles(
    const CanonicalPath& root, const EcologConfigFile& config) const
    -> std::vector<CanonicalPath> {
  std::vector<CanonicalPath> files;
  std::error_code ec;
  auto it = std::filesystem::recursive_directory_iterator(
      root.Path(), std::filesystem::directory_options::skip_permission_denied,
      ec);
  if (ec) {
    logger_->warn("Cannot scan {}: {}", root, ec.message());
    return files;
  }

  for (; it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    if (ec) {
      logger_->warn("Error while scanning {}: {}", root, ec.message());
      break;
    }
    const auto& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      if (IsIgnoredDirectory(entry.path())) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(type_ec) || !registry_->ForPath(entry.path())) {
      continue;
    }

    CanonicalPath path(entry.path());
    if (!config.ShouldIncludeFile(path.RelativeTo(root))) {
      logger_->debug("Excluded from index: {}", path);
      continue;
    }
    files.push_back(std::move(path));
  }

  std::ranges::sort(files);
  return files;
}

auto WorkspaceIndexer::IndexFile(
    const language::LanguageSupport& language, const CanonicalPath& path,
    std::shared_ptr<spdlog::logger> logger)
    -> std::expected<IndexedFile, EcologError> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  std::error_code ec;
  auto modified = std::filesystem::last_write_time(path.Path(), ec);
  auto text = ReadFile(path);
  if (!text) {
    return std::unexpected(text.error());
  }

  auto tree = language.Parse(std::move(*text));
  if (!tree) {
    return std::unexpected(tree.error());
  }

  auto analysis = semantic::AnalysisPipeline::Analyze(language, **tree, logger);
  auto references = semantic::BindingResolver::CollectReferences(analysis);

  return IndexedFile{
      .language_id = language.Id(),
      .exports = semantic::AnalysisPipeline::BuildExportEntry(language, analysis),
      .env_vars = semantic::BindingResolver::AllEnvVars(references),
      .modified = ec ? std::filesystem::file_time_type{} : modified};
}

auto WorkspaceIndexer::IndexPath(const CanonicalPath& path)
    -> std::expected<void, EcologError> {
  auto language = registry_->ForPath(path.Path());
  if (!language) {
    return EcologError::Unexpected(
        EcologErrorCode::UnsupportedLanguage, path.String());
  }

  auto uri = path.ToUri();
  std::error_code ec;
  auto modified = std::filesystem::last_write_time(path.Path(), ec);
  if (!ec && !index_->IsStale(uri, modified)) {
    logger_->debug("Index entry for {} is current", path);
    return {};
  }

  try {
    auto file = IndexFile(*language, path, logger_);
    if (!file) {
      return std::unexpected(file.error());
    }
    index_->Update(uri, std::move(*file));
    return {};
  } catch (const std::exception& e) {
    logger_->error("Internal error while indexing {}: {}", path, e.what());
    return EcologError::Unexpected(EcologErrorCode::Internal, e.what());
  }
}

auto WorkspaceIndexer::IndexWorkspace(
    const CanonicalPath& root, const EcologConfigFile& config,
    utils::CancellationToken token)
    -> asio::awaitable<std::expected<void, EcologError>> {
  std::error_code ec;
  if (!std::filesystem::is_directory(root.Path(), ec)) {
    co_return EcologError::Unexpected(
        EcologErrorCode::FileNotFound, root.String());
  }

  utils::ScopedTimer timer("Workspace indexing", logger_);
  auto files = DiscoverFiles(root, config);
  index_->BeginRun(files.size());
  logger_->debug(
      "Indexing {} file(s) under {} with {} worker(s)", files.size(), root,
      WorkerCount());

  std::atomic<std::size_t> next{0};
  std::atomic<std::size_t> failures{0};

  // Workers start together on the pool; the last one to finish signals
  // `all_done`
  const auto worker_count = std::min(WorkerCount(), files.size());
  auto remaining = std::make_shared<std::atomic<std::size_t>>(worker_count);
  utils::BroadcastEvent all_done(co_await asio::this_coro::executor);

  for (std::size_t w = 0; w < worker_count; ++w) {
    asio::co_spawn(
        index_pool_->get_executor(),
        [this, &files, &next, &failures, &token]() -> asio::awaitable<void> {
          while (!token.IsCancelled()) {
            auto i = next.fetch_add(1, std::memory_order_acq_rel);
            if (i >= files.size()) {
              break;
            }
            index_->MarkStarted();
            auto result = IndexPath(files[i]);
            if (result) {
              index_->MarkIndexed();
            } else {
              index_->MarkFailed();
              failures.fetch_add(1, std::memory_order_acq_rel);
              logger_->warn(
                  "Failed to index {}: {}", files[i], result.error().message());
            }
          }
          co_return;
        },
        [this, remaining, &all_done](std::exception_ptr error) {
          if (error) {
            try {
              std::rethrow_exception(error);
            } catch (const std::exception& e) {
              logger_->error("Indexing worker terminated: {}", e.what());
            } catch (...) {
              logger_->error("Indexing worker terminated with unknown exception");
            }
          }
          if (remaining->fetch_sub(1, std::memory_order_acq_rel) == 1) {
            all_done.Set();
          }
        });
  }

  if (worker_count > 0) {
    co_await all_done.AsyncWait(asio::use_awaitable);
  }

  if (token.IsCancelled()) {
    logger_->debug("Workspace indexing cancelled");
    co_return EcologError::Unexpected(
        EcologErrorCode::Cancelled, "workspace indexing");
  }

  // Drop entries of files that disappeared since the previous scan
  std::unordered_set<std::string> discovered;
  for (const auto& file : files) {
    discovered.insert(file.ToUri());
  }
  for (const auto& uri : index_->Uris()) {
    if (!discovered.contains(uri)) {
      index_->Remove(uri);
    }
  }
  module_resolver_->Invalidate();

  auto stats = index_->Stats();
  logger_->debug(
      "Indexed {} file(s), {} failed, {} export(s), {} env var(s)",
      stats.indexed_files, failures.load(), stats.export_count,
      stats.env_var_count);
  co_return std::expected<void, EcologError>{};
}

auto WorkspaceIndexer::OnFileChanged(const CanonicalPath& path)
    -> asio::awaitable<std::expected<void, EcologError>> {
  module_resolver_->Invalidate();
  auto result = co_await asio::co_spawn(
      index_pool_->get_executor(),
      [this, path]() -> asio::awaitable<std::expected<void, EcologError>> {
        co_return IndexPath(path);
      },
      asio::use_awaitable);
  if (!result) {
    logger_->warn("Failed to re-index {}: {}", path, result.error().message());
  }
  co_return result;
}

auto WorkspaceIndexer::OnFileDeleted(const CanonicalPath& path) -> void {
  module_resolver_->Invalidate();
  if (index_->Remove(path.ToUri())) {
    logger_->debug("Removed {} from the workspace index", path);
  }
}

}  // namespace ecolog::services
