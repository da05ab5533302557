#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

constexpr std::string_view kReferenceQuery = R"scm(
(method_invocation
  object: (identifier) @object
  name: (identifier) @_method
  arguments: (argument_list . (string_literal) @env_var_name)
  (#eq? @_method "getenv")) @env_access

(method_invocation
  object: (method_invocation
    object: (identifier) @object
    name: (identifier) @_getenv
    arguments: (argument_list))
  name: (identifier) @_method
  arguments: (argument_list
    .
    (string_literal) @env_var_name
    (string_literal)? @env_default_value)
  (#eq? @_getenv "getenv")
  (#any-of? @_method "get" "getOrDefault" "containsKey")) @env_access
)scm";

constexpr std::string_view kBindingQuery = R"scm(
(variable_declarator
  name: (identifier) @binding_name
  value: (method_invocation
    object: (identifier) @_object
    name: (identifier) @_method
    arguments: (argument_list . (string_literal) @bound_env_var))
  (#eq? @_object "System")
  (#eq? @_method "getenv")) @env_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(import_declaration
  (scoped_identifier
    scope: (_) @import_path
    name: (identifier) @original_name)) @import_stmt
)scm";

constexpr std::string_view kExportQuery = R"scm(
(field_declaration
  (modifiers "static")
  declarator: (variable_declarator
    name: (identifier) @export_name
    value: (_) @export_value)) @export_stmt
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment_expression left: (identifier) @reassigned_name)
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
)scm";

constexpr std::string_view kAssignmentQuery = R"scm(
(variable_declarator
  name: (identifier) @assignment_target
  value: (identifier) @assignment_source) @assignment
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(method_invocation
  object: (_) @object
  name: (identifier) @_method
  (#eq? @_method "getenv")) @completion_target
)scm";

}  // namespace

auto MakeJavaProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "java";
  profile.extensions = {".java"};
  profile.grammar = tree_sitter_java;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kBinding, kBindingQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kExport, kExportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kAssignment, kAssignmentQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"System"};
  profile.completion_triggers = {"(\""};
  profile.root_node_kinds = {"program"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("constructor_declaration", ScopeKind::kFunction);
  profile.scope_nodes.emplace("lambda_expression", ScopeKind::kFunction);
  profile.scope_nodes.emplace("enhanced_for_statement", ScopeKind::kLoop);
  profile.scope_nodes.emplace("block", ScopeKind::kBlock);
  profile.identifier_kinds = {"identifier"};
  return profile;
}

}  // namespace ecolog::language
