#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <tree_sitter/api.h>

#include "ecolog/core/analysis_types.hpp"

namespace ecolog::language {

// Query categories every profile may provide. A missing or uncompilable
// category simply yields no facts.
enum class QueryKind : std::size_t {
  kReference,
  kBinding,
  kImport,
  kExport,
  kReassignment,
  kIdentifier,
  kAssignment,
  kDestructure,
  kCompletion,
};

inline constexpr std::size_t kQueryKindCount = 9;

[[nodiscard]] auto ToString(QueryKind kind) -> std::string_view;

inline constexpr std::array<QueryKind, kQueryKindCount> kAllQueryKinds = {
    QueryKind::kReference,    QueryKind::kBinding,
    QueryKind::kImport,       QueryKind::kExport,
    QueryKind::kReassignment, QueryKind::kIdentifier,
    QueryKind::kAssignment,   QueryKind::kDestructure,
    QueryKind::kCompletion};

// Node shape of `obj.prop` / `obj["prop"]` in one grammar. Empty field names
// mean positional: the object is the first named child and the property the
// named sibling after it.
struct PropertyAccessForm {
  std::string node_kind;
  std::string object_field;
  std::string property_field;
  // The property is a string literal key rather than an identifier
  bool subscript = false;
};

using GrammarFn = const TSLanguage* (*)();

// Everything that makes one language recognizable: grammar, declarative
// queries, and the names that denote the environment in that language.
struct LanguageProfile {
  std::string id;
  // Editor language ids mapping to this profile, besides `id`
  std::vector<std::string> language_ids;
  // File extensions including the dot
  std::vector<std::string> extensions;
  GrammarFn grammar = nullptr;
  std::array<std::string_view, kQueryKindCount> queries{};

  std::vector<std::string> standard_env_objects;
  // Canonical name recorded for `x = <env object>` aliases
  std::optional<std::string> default_env_object;
  // Modules whose imported names denote environment access
  std::vector<std::string> known_env_modules;
  std::vector<std::string> completion_triggers;
  std::vector<PropertyAccessForm> property_accesses;

  std::vector<std::string> root_node_kinds;
  std::unordered_map<std::string, ScopeKind> scope_nodes;
  // Node kinds that can name an imported symbol at a cursor position
  std::vector<std::string> identifier_kinds;

  auto SetQuery(QueryKind kind, std::string_view source) -> LanguageProfile& {
    queries[static_cast<std::size_t>(kind)] = source;
    return *this;
  }
};

// Function, class, loop and conditional node kinds shared by the bundled
// grammars
[[nodiscard]] auto DefaultScopeNodes()
    -> std::unordered_map<std::string, ScopeKind>;

[[nodiscard]] auto DefaultRootNodeKinds() -> std::vector<std::string>;

}  // namespace ecolog::language
