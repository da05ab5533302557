#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "ecolog/core/analysis_types.hpp"
#include "ecolog/language/language_registry.hpp"
#include "ecolog/language/language_support.hpp"
#include "ecolog/language/query_engine.hpp"
#include "ecolog/semantic/analysis_pipeline.hpp"
#include "ecolog/syntax/ts_node.hpp"

namespace ecolog::services {

// Immutable result of analyzing one version of one document
struct DocumentSnapshot {
  std::string uri;
  std::string language_id;
  int version = 0;
  // Null for unsupported languages and unparseable text
  std::shared_ptr<const language::LanguageSupport> language;
  std::shared_ptr<const syntax::SyntaxTree> tree;
  semantic::DocumentAnalysis analysis;
  std::vector<Reference> references;
};

// Open documents and their latest analysis.
//
// Lifecycle calls and debounce timers run on a strand of the service
// executor. Parsing and analysis run on a thread pool. Each document carries
// a generation counter bumped by every edit; an analysis publishes its
// snapshot only if no newer edit arrived while it ran.
class DocumentManager {
 public:
  DocumentManager(
      asio::any_io_executor executor,
      std::shared_ptr<const language::LanguageRegistry> registry,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      std::chrono::milliseconds debounce_delay = kDefaultDebounceDelay);

  ~DocumentManager();

  DocumentManager(const DocumentManager&) = delete;
  auto operator=(const DocumentManager&) -> DocumentManager& = delete;
  DocumentManager(DocumentManager&&) = delete;
  auto operator=(DocumentManager&&) -> DocumentManager& = delete;

  // Analyzes immediately; re-opening replaces the previous state
  auto Open(std::string uri, std::string language_id, int version, std::string text)
      -> asio::awaitable<void>;

  // Full-text change, analyzed after the debounce delay
  auto Change(std::string uri, int version, std::string text)
      -> asio::awaitable<void>;

  auto Close(std::string uri) -> asio::awaitable<void>;

  // Runs a pending analysis now instead of waiting for its timer
  auto Flush(std::string uri) -> asio::awaitable<void>;

  [[nodiscard]] auto Get(const std::string& uri) const
      -> std::shared_ptr<const DocumentSnapshot>;

  [[nodiscard]] auto IsOpen(const std::string& uri) const -> bool;

  [[nodiscard]] auto OpenUris() const -> std::vector<std::string>;

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

  // Number of analyses that published a snapshot
  [[nodiscard]] auto CompletedAnalyses() const -> uint64_t {
    return completed_analyses_.load(std::memory_order_acquire);
  }

  // Applies to changes scheduled after it returns
  auto SetDebounceDelay(std::chrono::milliseconds delay) -> asio::awaitable<void>;

  // Parses and analyzes text outside any open document
  static auto AnalyzeText(
      std::shared_ptr<const language::LanguageSupport> language,
      std::string uri, std::string language_id, int version, std::string text,
      std::shared_ptr<spdlog::logger> logger)
      -> std::shared_ptr<const DocumentSnapshot>;

 private:
  struct DocumentEntry {
    std::mutex mutex;
    std::string language_id;
    std::shared_ptr<const language::LanguageSupport> language;
    int version = 0;
    std::string text;
    uint64_t generation = 0;
    std::shared_ptr<const DocumentSnapshot> snapshot;
  };

  [[nodiscard]] auto FindEntry(const std::string& uri) const
      -> std::shared_ptr<DocumentEntry>;

  auto Analyze(std::string uri) -> asio::awaitable<void>;

  auto ScheduleDebouncedAnalysis(std::string uri) -> void;

  auto CancelTimer(const std::string& uri) -> void;

  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;
  std::unique_ptr<asio::thread_pool> analysis_pool_;
  std::shared_ptr<const language::LanguageRegistry> registry_;
  std::shared_ptr<spdlog::logger> logger_;
  std::chrono::milliseconds debounce_delay_;

  mutable std::shared_mutex documents_mutex_;
  std::unordered_map<std::string, std::shared_ptr<DocumentEntry>> documents_;

  // Strand-only
  std::unordered_map<std::string, asio::steady_timer> timers_;

  std::atomic<uint64_t> completed_analyses_{0};
};

}  // namespace ecolog::services
