#include "ecolog/services/workspace_index.hpp"

#include <algorithm>
#include <mutex>
#include <set>

namespace ecolog::services {

WorkspaceIndex::WorkspaceIndex(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto WorkspaceIndex::Update(const std::string& uri, IndexedFile file) -> void {
  auto entry = std::make_shared<const IndexedFile>(std::move(file));
  std::unique_lock lock(mutex_);
  files_.insert_or_assign(uri, std::move(entry));
}

auto WorkspaceIndex::Remove(const std::string& uri) -> bool {
  std::unique_lock lock(mutex_);
  return files_.erase(uri) > 0;
}

auto WorkspaceIndex::Find(const std::string& uri) const
    -> std::shared_ptr<const IndexedFile> {
  std::shared_lock lock(mutex_);
  auto it = files_.find(uri);
  return it == files_.end() ? nullptr : it->second;
}

auto WorkspaceIndex::ExportsOf(const std::string& uri) const
    -> std::optional<ExportIndexEntry> {
  auto file = Find(uri);
  if (!file) {
    return std::nullopt;
  }
  return file->exports;
}

auto WorkspaceIndex::Contains(const std::string& uri) const -> bool {
  return Find(uri) != nullptr;
}

auto WorkspaceIndex::IsStale(
    const std::string& uri, std::filesystem::file_time_type modified) const
    -> bool {
  auto file = Find(uri);
  return !file || file->modified != modified;
}

auto WorkspaceIndex::FilesReading(const std::string& name) const
    -> std::vector<std::string> {
  std::vector<std::string> uris;
  std::shared_lock lock(mutex_);
  for (const auto& [uri, file] : files_) {
    if (std::binary_search(file->env_vars.begin(), file->env_vars.end(), name)) {
      uris.push_back(uri);
    }
  }
  std::ranges::sort(uris);
  return uris;
}

auto WorkspaceIndex::Uris() const -> std::vector<std::string> {
  std::vector<std::string> uris;
  {
    std::shared_lock lock(mutex_);
    uris.reserve(files_.size());
    for (const auto& [uri, file] : files_) {
      uris.push_back(uri);
    }
  }
  std::ranges::sort(uris);
  return uris;
}

auto WorkspaceIndex::BeginRun(std::size_t total_files) -> void {
  total_files_.store(total_files, std::memory_order_release);
  indexed_files_.store(0, std::memory_order_release);
  in_progress_.store(0, std::memory_order_release);
  failed_files_.store(0, std::memory_order_release);
  peak_in_progress_.store(0, std::memory_order_release);
}

auto WorkspaceIndex::MarkStarted() -> void {
  auto current = in_progress_.fetch_add(1, std::memory_order_acq_rel) + 1;
  auto peak = peak_in_progress_.load(std::memory_order_acquire);
  while (current > peak &&
         !peak_in_progress_.compare_exchange_weak(
             peak, current, std::memory_order_acq_rel)) {
  }
}

auto WorkspaceIndex::MarkIndexed() -> void {
  indexed_files_.fetch_add(1, std::memory_order_acq_rel);
  in_progress_.fetch_sub(1, std::memory_order_acq_rel);
}

auto WorkspaceIndex::MarkFailed() -> void {
  failed_files_.fetch_add(1, std::memory_order_acq_rel);
  in_progress_.fetch_sub(1, std::memory_order_acq_rel);
}

auto WorkspaceIndex::Stats() const -> IndexStats {
  IndexStats stats{
      .total_files = total_files_.load(std::memory_order_acquire),
      .indexed_files = indexed_files_.load(std::memory_order_acquire),
      .in_progress = in_progress_.load(std::memory_order_acquire),
      .failed_files = failed_files_.load(std::memory_order_acquire),
      .peak_in_progress = peak_in_progress_.load(std::memory_order_acquire)};

  std::set<std::string_view> env_vars;
  std::shared_lock lock(mutex_);
  stats.file_count = files_.size();
  for (const auto& [uri, file] : files_) {
    stats.export_count += file->exports.ExportCount();
    env_vars.insert(file->env_vars.begin(), file->env_vars.end());
  }
  stats.env_var_count = env_vars.size();
  return stats;
}

}  // namespace ecolog::services
