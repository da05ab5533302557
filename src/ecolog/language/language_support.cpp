#include "ecolog/language/language_support.hpp"

#include <algorithm>

namespace ecolog::language {

namespace {

struct ParserDeleter {
  auto operator()(TSParser* parser) const -> void {
    ts_parser_delete(parser);
  }
};

auto Contains(const std::vector<std::string>& values, std::string_view text)
    -> bool {
  return std::ranges::find(values, text) != values.end();
}

}  // namespace

LanguageSupport::LanguageSupport(
    LanguageProfile profile, const TSLanguage* grammar)
    : profile_(std::move(profile)), grammar_(grammar) {
}

auto LanguageSupport::Create(
    LanguageProfile profile, std::shared_ptr<spdlog::logger> logger)
    -> std::expected<std::shared_ptr<const LanguageSupport>, EcologError> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  if (profile.grammar == nullptr) {
    return EcologError::Unexpected(
        EcologErrorCode::UnsupportedLanguage,
        fmt::format("{} has no grammar", profile.id));
  }
  const TSLanguage* grammar = profile.grammar();
  if (grammar == nullptr) {
    return EcologError::Unexpected(
        EcologErrorCode::UnsupportedLanguage,
        fmt::format("{} grammar entry point returned null", profile.id));
  }
  auto version = ts_language_version(grammar);
  if (version < TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION ||
      version > TREE_SITTER_LANGUAGE_VERSION) {
    return EcologError::Unexpected(
        EcologErrorCode::UnsupportedLanguage,
        fmt::format(
            "{} grammar ABI {} is outside [{}, {}]", profile.id, version,
            TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION,
            TREE_SITTER_LANGUAGE_VERSION));
  }

  std::shared_ptr<LanguageSupport> support(
      new LanguageSupport(std::move(profile), grammar));

  for (auto kind : kAllQueryKinds) {
    auto index = static_cast<std::size_t>(kind);
    auto source = support->profile_.queries[index];
    if (source.empty()) {
      continue;
    }
    auto compiled = syntax::CompiledQuery::Compile(grammar, source);
    if (!compiled) {
      logger->error(
          "{} {} query disabled: {}", support->Id(), ToString(kind),
          compiled.error().message());
      continue;
    }
    support->queries_[index].emplace(std::move(*compiled));
  }

  logger->debug(
      "Registered language {} ({} extension(s))", support->Id(),
      support->profile_.extensions.size());
  return support;
}

auto LanguageSupport::Query(QueryKind kind) const
    -> const syntax::CompiledQuery* {
  const auto& query = queries_[static_cast<std::size_t>(kind)];
  return query ? &*query : nullptr;
}

auto LanguageSupport::Parse(std::string source) const
    -> std::expected<std::shared_ptr<const syntax::SyntaxTree>, EcologError> {
  std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
  if (!ts_parser_set_language(parser.get(), grammar_)) {
    return EcologError::Unexpected(
        EcologErrorCode::ParseFailed,
        fmt::format("parser rejected {} grammar", Id()));
  }

  syntax::TreePtr tree(ts_parser_parse_string(
      parser.get(), nullptr, source.data(),
      static_cast<uint32_t>(source.size())));
  if (!tree) {
    return EcologError::Unexpected(
        EcologErrorCode::ParseFailed, fmt::format("{} parse aborted", Id()));
  }
  return std::make_shared<const syntax::SyntaxTree>(
      std::move(source), std::move(tree));
}

auto LanguageSupport::IsStandardEnvObject(std::string_view text) const
    -> bool {
  return Contains(profile_.standard_env_objects, text);
}

auto LanguageSupport::IsKnownEnvModule(std::string_view module) const -> bool {
  return Contains(profile_.known_env_modules, module);
}

auto LanguageSupport::IsRootNode(std::string_view kind) const -> bool {
  return Contains(profile_.root_node_kinds, kind);
}

auto LanguageSupport::ScopeKindOf(std::string_view kind) const
    -> std::optional<ScopeKind> {
  auto it = profile_.scope_nodes.find(std::string(kind));
  if (it == profile_.scope_nodes.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto LanguageSupport::IsIdentifierKind(std::string_view kind) const -> bool {
  return Contains(profile_.identifier_kinds, kind);
}

auto LanguageSupport::FindPropertyAccessForm(std::string_view kind) const
    -> const PropertyAccessForm* {
  auto it = std::ranges::find_if(
      profile_.property_accesses,
      [kind](const auto& form) { return form.node_kind == kind; });
  return it == profile_.property_accesses.end() ? nullptr : &*it;
}

auto LanguageSupport::IsValidCompletionTrigger(
    std::string_view line_prefix) const -> bool {
  return std::ranges::any_of(
      profile_.completion_triggers, [line_prefix](const auto& trigger) {
        return line_prefix.ends_with(trigger);
      });
}

auto LanguageSupport::StripQuotes(std::string_view text) -> std::string_view {
  if (text.size() >= 2) {
    char first = text.front();
    char last = text.back();
    if ((first == '"' || first == '\'' || first == '`') && first == last) {
      return text.substr(1, text.size() - 2);
    }
  }
  return text;
}

}  // namespace ecolog::language
