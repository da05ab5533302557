#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "ecolog/error/error.hpp"
#include "ecolog/language/language_profile.hpp"
#include "ecolog/language/language_support.hpp"

namespace ecolog::language {

// Maps language ids and file extensions to registered languages
class LanguageRegistry {
 public:
  explicit LanguageRegistry(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Registry with every bundled profile. Profiles whose grammar cannot be
  // loaded are logged and skipped.
  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::shared_ptr<LanguageRegistry>;

  auto Register(LanguageProfile profile) -> std::expected<void, EcologError>;

  [[nodiscard]] auto ByLanguageId(std::string_view language_id) const
      -> std::shared_ptr<const LanguageSupport>;

  [[nodiscard]] auto ByExtension(std::string_view extension) const
      -> std::shared_ptr<const LanguageSupport>;

  [[nodiscard]] auto ForPath(const std::filesystem::path& path) const
      -> std::shared_ptr<const LanguageSupport>;

  // Editor language id first, then the URI's extension
  [[nodiscard]] auto ForDocument(
      std::string_view uri, std::string_view language_id) const
      -> std::shared_ptr<const LanguageSupport>;

  [[nodiscard]] auto Languages() const
      -> std::vector<std::shared_ptr<const LanguageSupport>>;

  [[nodiscard]] auto SupportedExtensions() const -> std::vector<std::string>;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::shared_mutex mutex_;
  std::vector<std::shared_ptr<const LanguageSupport>> languages_;
  std::unordered_map<std::string, std::shared_ptr<const LanguageSupport>>
      by_id_;
  std::unordered_map<std::string, std::shared_ptr<const LanguageSupport>>
      by_extension_;
};

}  // namespace ecolog::language
