#include "ecolog/services/document_manager.hpp"

#include <algorithm>
#include <thread>

#include "ecolog/semantic/binding_resolver.hpp"

namespace ecolog::services {

namespace {

auto AnalysisPoolSize() -> std::size_t {
  const auto hw_threads = std::thread::hardware_concurrency();
  return std::max<std::size_t>(1, hw_threads / 2);
}

}  // namespace

DocumentManager::DocumentManager(
    asio::any_io_executor executor,
    std::shared_ptr<const language::LanguageRegistry> registry,
    std::shared_ptr<spdlog::logger> logger,
    std::chrono::milliseconds debounce_delay)
    : executor_(executor),
      strand_(asio::make_strand(executor)),
      analysis_pool_(std::make_unique<asio::thread_pool>(AnalysisPoolSize())),
      registry_(std::move(registry)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      debounce_delay_(debounce_delay) {
}

DocumentManager::~DocumentManager() {
  analysis_pool_->join();
}

auto DocumentManager::AnalyzeText(
    std::shared_ptr<const language::LanguageSupport> language, std::string uri,
    std::string language_id, int version, std::string text,
    std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<const DocumentSnapshot> {
  if (!logger) {
    logger = spdlog::default_logger();
  }
  auto snapshot = std::make_shared<DocumentSnapshot>();
  snapshot->uri = std::move(uri);
  snapshot->language_id = std::move(language_id);
  snapshot->version = version;
  if (!language) {
    return snapshot;
  }

  auto tree = language->Parse(std::move(text));
  if (!tree) {
    logger->warn(
        "Parse failed for {}: {}", snapshot->uri, tree.error().message());
    return snapshot;
  }

  snapshot->language = language;
  snapshot->tree = *tree;
  snapshot->analysis =
      semantic::AnalysisPipeline::Analyze(*language, **tree, logger);
  snapshot->references =
      semantic::BindingResolver::CollectReferences(snapshot->analysis);
  return snapshot;
}

auto DocumentManager::FindEntry(const std::string& uri) const
    -> std::shared_ptr<DocumentEntry> {
  std::shared_lock lock(documents_mutex_);
  auto it = documents_.find(uri);
  return it == documents_.end() ? nullptr : it->second;
}

auto DocumentManager::Open(
    std::string uri, std::string language_id, int version, std::string text)
    -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);
  CancelTimer(uri);

  auto language = registry_->ForDocument(uri, language_id);
  if (!language) {
    logger_->debug(
        "No language for {} ({}); document accepted without analysis", uri,
        language_id);
  }

  auto entry = std::make_shared<DocumentEntry>();
  entry->language_id = std::move(language_id);
  entry->language = std::move(language);
  entry->version = version;
  entry->text = std::move(text);
  {
    std::unique_lock lock(documents_mutex_);
    if (auto it = documents_.find(uri); it != documents_.end()) {
      std::scoped_lock entry_lock(it->second->mutex);
      entry->generation = it->second->generation + 1;
    }
    documents_.insert_or_assign(uri, entry);
  }

  logger_->debug("Document opened: {} (version {})", uri, version);
  co_await Analyze(std::move(uri));
}

auto DocumentManager::Change(std::string uri, int version, std::string text)
    -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto entry = FindEntry(uri);
  if (!entry) {
    logger_->debug("Change for unopened document ignored: {}", uri);
    co_return;
  }
  {
    std::scoped_lock lock(entry->mutex);
    entry->version = version;
    entry->text = std::move(text);
    ++entry->generation;
  }
  ScheduleDebouncedAnalysis(std::move(uri));
}

auto DocumentManager::Close(std::string uri) -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);
  CancelTimer(uri);

  std::unique_lock lock(documents_mutex_);
  if (auto it = documents_.find(uri); it != documents_.end()) {
    {
      // In-flight analyses compare generations; make theirs stale
      std::scoped_lock entry_lock(it->second->mutex);
      ++it->second->generation;
    }
    documents_.erase(it);
    logger_->debug("Document closed: {}", uri);
  }
}

auto DocumentManager::Flush(std::string uri) -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto entry = FindEntry(uri);
  if (!entry) {
    co_return;
  }
  bool pending = timers_.contains(uri);
  bool stale = false;
  {
    std::scoped_lock lock(entry->mutex);
    stale = !entry->snapshot || entry->snapshot->version != entry->version;
  }
  CancelTimer(uri);
  if (pending || stale) {
    co_await Analyze(std::move(uri));
  }
}

auto DocumentManager::CancelTimer(const std::string& uri) -> void {
  auto it = timers_.find(uri);
  if (it != timers_.end()) {
    it->second.cancel();
    timers_.erase(it);
  }
}

auto DocumentManager::ScheduleDebouncedAnalysis(std::string uri) -> void {
  logger_->debug(
      "Scheduling debounced analysis for {} ({}ms delay)", uri,
      debounce_delay_.count());

  CancelTimer(uri);

  auto [timer_it, inserted] = timers_.try_emplace(uri, strand_);
  timer_it->second.expires_after(debounce_delay_);
  timer_it->second.async_wait([this, uri](std::error_code ec) {
    if (ec) {
      return;
    }
    asio::co_spawn(
        strand_,
        [this, uri]() -> asio::awaitable<void> {
          // A newer change may have replaced this timer before it ran
          auto it = timers_.find(uri);
          if (it == timers_.end() ||
              it->second.expiry() > asio::steady_timer::clock_type::now()) {
            co_return;
          }
          timers_.erase(it);
          logger_->debug("Debounce expired for {}, analyzing", uri);
          co_await Analyze(uri);
        },
        asio::detached);
  });
}

auto DocumentManager::Analyze(std::string uri) -> asio::awaitable<void> {
  auto entry = FindEntry(uri);
  if (!entry) {
    co_return;
  }

  std::shared_ptr<const language::LanguageSupport> language;
  std::string language_id;
  std::string text;
  int version = 0;
  uint64_t generation = 0;
  {
    std::scoped_lock lock(entry->mutex);
    language = entry->language;
    language_id = entry->language_id;
    text = entry->text;
    version = entry->version;
    generation = entry->generation;
  }

  auto snapshot = co_await asio::co_spawn(
      analysis_pool_->get_executor(),
      [language, uri, language_id, version, text = std::move(text),
       logger = logger_]() mutable
          -> asio::awaitable<std::shared_ptr<const DocumentSnapshot>> {
        co_return AnalyzeText(
            language, uri, language_id, version, std::move(text), logger);
      },
      asio::use_awaitable);

  co_await asio::post(strand_, asio::use_awaitable);

  std::scoped_lock lock(entry->mutex);
  if (entry->generation != generation) {
    logger_->debug(
        "Discarding analysis of {} version {}: superseded", uri, version);
    co_return;
  }
  entry->snapshot = std::move(snapshot);
  completed_analyses_.fetch_add(1, std::memory_order_acq_rel);
  logger_->debug("Analysis published for {} (version {})", uri, version);
}

auto DocumentManager::SetDebounceDelay(std::chrono::milliseconds delay)
    -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);
  debounce_delay_ = delay;
  logger_->debug("Debounce delay set to {}ms", delay.count());
}

auto DocumentManager::Get(const std::string& uri) const
    -> std::shared_ptr<const DocumentSnapshot> {
  auto entry = FindEntry(uri);
  if (!entry) {
    return nullptr;
  }
  std::scoped_lock lock(entry->mutex);
  return entry->snapshot;
}

auto DocumentManager::IsOpen(const std::string& uri) const -> bool {
  return FindEntry(uri) != nullptr;
}

auto DocumentManager::OpenUris() const -> std::vector<std::string> {
  std::shared_lock lock(documents_mutex_);
  std::vector<std::string> uris;
  uris.reserve(documents_.size());
  for (const auto& [uri, entry] : documents_) {
    uris.push_back(uri);
  }
  return uris;
}

auto DocumentManager::ReferenceAt(
    const std::string& uri, const Position& pos) const
    -> std::optional<Reference> {
  auto snapshot = Get(uri);
  if (!snapshot) {
    return std::nullopt;
  }
  return semantic::BindingResolver::ReferenceAt(snapshot->references, pos);
}

auto DocumentManager::CompletionContextAt(
    const std::string& uri, const Position& pos) const
    -> std::optional<std::string> {
  auto snapshot = Get(uri);
  if (!snapshot || !snapshot->language || !snapshot->tree) {
    return std::nullopt;
  }
  return semantic::BindingResolver::CompletionContextAt(
      *snapshot->language, *snapshot->tree, snapshot->analysis, pos);
}

auto DocumentManager::SyntaxErrors(const std::string& uri) const
    -> std::vector<language::SyntaxErrorFact> {
  auto snapshot = Get(uri);
  if (!snapshot) {
    return {};
  }
  return snapshot->analysis.syntax_errors;
}

auto DocumentManager::FindEnvVarUsages(
    const std::string& uri, std::string_view name) const
    -> std::vector<Reference> {
  auto snapshot = Get(uri);
  if (!snapshot) {
    return {};
  }
  return semantic::BindingResolver::FindEnvVarUsages(snapshot->references, name);
}

auto DocumentManager::AllEnvVars(const std::string& uri) const
    -> std::vector<std::string> {
  auto snapshot = Get(uri);
  if (!snapshot) {
    return {};
  }
  return semantic::BindingResolver::AllEnvVars(snapshot->references);
}

}  // namespace ecolog::services
