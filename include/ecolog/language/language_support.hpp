#pragma once

#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "ecolog/error/error.hpp"
#include "ecolog/language/language_profile.hpp"
#include "ecolog/syntax/compiled_query.hpp"
#include "ecolog/syntax/ts_node.hpp"

namespace ecolog::language {

// A registered language: the profile plus its compiled queries. Immutable
// once created and shared by every document of that language.
class LanguageSupport {
 public:
  // Fails when the grammar is missing or built for an incompatible
  // tree-sitter ABI. Individual queries that fail to compile are logged and
  // left disabled.
  static auto Create(
      LanguageProfile profile, std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::expected<std::shared_ptr<const LanguageSupport>, EcologError>;

  LanguageSupport(const LanguageSupport&) = delete;
  auto operator=(const LanguageSupport&) -> LanguageSupport& = delete;
  LanguageSupport(LanguageSupport&&) = delete;
  auto operator=(LanguageSupport&&) -> LanguageSupport& = delete;
  ~LanguageSupport() = default;

  [[nodiscard]] auto Id() const -> const std::string& {
    return profile_.id;
  }

  [[nodiscard]] auto Profile() const -> const LanguageProfile& {
    return profile_;
  }

  [[nodiscard]] auto Grammar() const -> const TSLanguage* {
    return grammar_;
  }

  // Nothing when the profile has no such query or it failed to compile
  [[nodiscard]] auto Query(QueryKind kind) const
      -> const syntax::CompiledQuery*;

  auto Parse(std::string source) const
      -> std::expected<std::shared_ptr<const syntax::SyntaxTree>, EcologError>;

  [[nodiscard]] auto IsStandardEnvObject(std::string_view text) const -> bool;
  [[nodiscard]] auto IsKnownEnvModule(std::string_view module) const -> bool;
  [[nodiscard]] auto IsRootNode(std::string_view kind) const -> bool;
  [[nodiscard]] auto ScopeKindOf(std::string_view kind) const
      -> std::optional<ScopeKind>;
  [[nodiscard]] auto IsIdentifierKind(std::string_view kind) const -> bool;
  [[nodiscard]] auto FindPropertyAccessForm(std::string_view kind) const
      -> const PropertyAccessForm*;

  // True when the text before the cursor ends with a completion trigger
  [[nodiscard]] auto IsValidCompletionTrigger(std::string_view line_prefix) const
      -> bool;

  // Text without one pair of matching surrounding quotes
  static auto StripQuotes(std::string_view text) -> std::string_view;

 private:
  LanguageSupport(LanguageProfile profile, const TSLanguage* grammar);

  LanguageProfile profile_;
  const TSLanguage* grammar_;
  std::array<std::optional<syntax::CompiledQuery>, kQueryKindCount> queries_;
};

}  // namespace ecolog::language
