#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/ecmascript_queries.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

auto MakeEcmaScriptBase(std::string id, GrammarFn grammar) -> LanguageProfile {
  LanguageProfile profile;
  profile.id = std::move(id);
  profile.grammar = grammar;
  profile.SetQuery(QueryKind::kReference, ecmascript::kReferenceQuery)
      .SetQuery(QueryKind::kBinding, ecmascript::kBindingQuery)
      .SetQuery(QueryKind::kImport, ecmascript::kImportQuery)
      .SetQuery(QueryKind::kExport, ecmascript::kExportQuery)
      .SetQuery(QueryKind::kReassignment, ecmascript::kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, ecmascript::kIdentifierQuery)
      .SetQuery(QueryKind::kAssignment, ecmascript::kAssignmentQuery)
      .SetQuery(QueryKind::kDestructure, ecmascript::kDestructureQuery)
      .SetQuery(QueryKind::kCompletion, ecmascript::kCompletionQuery);

  profile.standard_env_objects = {"process.env", "import.meta.env"};
  profile.default_env_object = "process.env";
  profile.known_env_modules = {"process", "node:process"};
  profile.completion_triggers = {".", "[\"", "['"};
  profile.property_accesses = {
      {.node_kind = "member_expression",
       .object_field = "object",
       .property_field = "property"},
      {.node_kind = "subscript_expression",
       .object_field = "object",
       .property_field = "index",
       .subscript = true},
  };
  profile.root_node_kinds = {"program"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("statement_block", ScopeKind::kBlock);
  profile.identifier_kinds = {
      "identifier", "property_identifier", "shorthand_property_identifier",
      "shorthand_property_identifier_pattern"};
  return profile;
}

}  // namespace

auto MakeJavaScriptProfile() -> LanguageProfile {
  auto profile = MakeEcmaScriptBase("javascript", tree_sitter_javascript);
  profile.language_ids = {"javascriptreact"};
  profile.extensions = {".js", ".jsx", ".mjs", ".cjs"};
  return profile;
}

auto MakeTypeScriptProfile() -> LanguageProfile {
  auto profile = MakeEcmaScriptBase("typescript", tree_sitter_typescript);
  profile.extensions = {".ts", ".mts", ".cts"};
  return profile;
}

auto MakeTsxProfile() -> LanguageProfile {
  auto profile = MakeEcmaScriptBase("typescriptreact", tree_sitter_tsx);
  profile.extensions = {".tsx"};
  return profile;
}

}  // namespace ecolog::language
