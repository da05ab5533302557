#include "ecolog/language/language_registry.hpp"

#include <mutex>

#include "ecolog/language/builtin_profiles.hpp"
#include "ecolog/utils/path_utils.hpp"

namespace ecolog::language {

LanguageRegistry::LanguageRegistry(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto LanguageRegistry::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<LanguageRegistry> {
  auto registry = std::make_shared<LanguageRegistry>(logger);
  for (auto& profile : BuiltinProfiles()) {
    auto id = profile.id;
    if (auto result = registry->Register(std::move(profile)); !result) {
      registry->logger_->warn(
          "Language {} unavailable: {}", id, result.error().message());
    }
  }
  return registry;
}

auto LanguageRegistry::Register(LanguageProfile profile)
    -> std::expected<void, EcologError> {
  auto support = LanguageSupport::Create(std::move(profile), logger_);
  if (!support) {
    return std::unexpected(support.error());
  }

  std::unique_lock lock(mutex_);
  const auto& language = *support;
  languages_.push_back(language);
  by_id_[language->Id()] = language;
  for (const auto& alias : language->Profile().language_ids) {
    by_id_[alias] = language;
  }
  for (const auto& extension : language->Profile().extensions) {
    by_extension_[extension] = language;
  }
  return {};
}

auto LanguageRegistry::ByLanguageId(std::string_view language_id) const
    -> std::shared_ptr<const LanguageSupport> {
  std::shared_lock lock(mutex_);
  auto it = by_id_.find(std::string(language_id));
  return it == by_id_.end() ? nullptr : it->second;
}

auto LanguageRegistry::ByExtension(std::string_view extension) const
    -> std::shared_ptr<const LanguageSupport> {
  std::shared_lock lock(mutex_);
  auto it = by_extension_.find(std::string(extension));
  return it == by_extension_.end() ? nullptr : it->second;
}

auto LanguageRegistry::ForPath(const std::filesystem::path& path) const
    -> std::shared_ptr<const LanguageSupport> {
  auto extension = ExtensionOf(path);
  if (extension.empty()) {
    return nullptr;
  }
  return ByExtension(extension);
}

auto LanguageRegistry::ForDocument(
    std::string_view uri, std::string_view language_id) const
    -> std::shared_ptr<const LanguageSupport> {
  if (!language_id.empty()) {
    if (auto language = ByLanguageId(language_id)) {
      return language;
    }
  }
  return ForPath(UriToPath(uri));
}

auto LanguageRegistry::Languages() const
    -> std::vector<std::shared_ptr<const LanguageSupport>> {
  std::shared_lock lock(mutex_);
  return languages_;
}

auto LanguageRegistry::SupportedExtensions() const -> std::vector<std::string> {
  std::shared_lock lock(mutex_);
  std::vector<std::string> extensions;
  extensions.reserve(by_extension_.size());
  for (const auto& [extension, language] : by_extension_) {
    extensions.push_back(extension);
  }
  return extensions;
}

}  // namespace ecolog::language
