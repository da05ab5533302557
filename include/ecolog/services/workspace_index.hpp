#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "ecolog/core/analysis_types.hpp"

namespace ecolog::services {

// What the indexer keeps for one workspace file
struct IndexedFile {
  std::string language_id;
  ExportIndexEntry exports;
  // Canonical names the file reads, sorted
  std::vector<std::string> env_vars;
  std::filesystem::file_time_type modified{};
};

struct IndexStats {
  std::size_t total_files = 0;
  std::size_t indexed_files = 0;
  std::size_t in_progress = 0;
  std::size_t failed_files = 0;
  // Most files indexed at once during the current run
  std::size_t peak_in_progress = 0;
  // Entries currently stored
  std::size_t file_count = 0;
  std::size_t env_var_count = 0;
  std::size_t export_count = 0;

  [[nodiscard]] auto Percentage() const -> double {
    if (total_files == 0) {
      return 100.0;
    }
    return 100.0 * static_cast<double>(indexed_files + failed_files) /
           static_cast<double>(total_files);
  }
};

// URI -> exports of every indexed file. Readers share the lock; each Update
// replaces one entry whole, so a reader sees either the old or the new entry.
class WorkspaceIndex {
 public:
  explicit WorkspaceIndex(std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Update(const std::string& uri, IndexedFile file) -> void;

  auto Remove(const std::string& uri) -> bool;

  [[nodiscard]] auto Find(const std::string& uri) const
      -> std::shared_ptr<const IndexedFile>;

  [[nodiscard]] auto ExportsOf(const std::string& uri) const
      -> std::optional<ExportIndexEntry>;

  [[nodiscard]] auto Contains(const std::string& uri) const -> bool;

  // True when the file is absent or was indexed at a different mtime
  [[nodiscard]] auto IsStale(
      const std::string& uri, std::filesystem::file_time_type modified) const
      -> bool;

  // Files reading `name`
  [[nodiscard]] auto FilesReading(const std::string& name) const
      -> std::vector<std::string>;

  [[nodiscard]] auto Uris() const -> std::vector<std::string>;

  // Progress counters, driven by the indexer
  auto BeginRun(std::size_t total_files) -> void;
  auto MarkStarted() -> void;
  auto MarkIndexed() -> void;
  auto MarkFailed() -> void;

  [[nodiscard]] auto Stats() const -> IndexStats;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const IndexedFile>> files_;

  std::atomic<std::size_t> total_files_{0};
  std::atomic<std::size_t> indexed_files_{0};
  std::atomic<std::size_t> in_progress_{0};
  std::atomic<std::size_t> failed_files_{0};
  std::atomic<std::size_t> peak_in_progress_{0};
};

}  // namespace ecolog::services
