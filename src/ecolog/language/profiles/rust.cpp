#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

constexpr std::string_view kReferenceQuery = R"scm(
(call_expression
  function: (scoped_identifier
    path: (_) @object
    name: (identifier) @_function)
  arguments: (arguments . (string_literal) @env_var_name)
  (#any-of? @_function "var" "var_os")) @env_access

(call_expression
  function: (identifier) @object
  arguments: (arguments . (string_literal) @env_var_name)) @env_access

(macro_invocation
  macro: (identifier) @_macro
  (token_tree . (string_literal) @env_var_name)
  (#any-of? @_macro "env" "option_env")) @env_access
)scm";

constexpr std::string_view kBindingQuery = R"scm(
(let_declaration
  pattern: (identifier) @binding_name
  value: (call_expression
    function: (scoped_identifier
      path: (_) @_path
      name: (identifier) @_function)
    arguments: (arguments . (string_literal) @bound_env_var))
  (#any-of? @_path "std::env" "env")
  (#any-of? @_function "var" "var_os")) @env_binding

(let_declaration
  pattern: (identifier) @binding_name
  value: (call_expression
    function: (field_expression
      value: (call_expression
        function: (scoped_identifier
          path: (_) @_path
          name: (identifier) @_function)
        arguments: (arguments . (string_literal) @bound_env_var))))
  (#any-of? @_path "std::env" "env")
  (#any-of? @_function "var" "var_os")) @env_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(use_declaration
  argument: (scoped_identifier
    path: (_) @import_path
    name: (identifier) @original_name)) @import_stmt

(use_declaration
  argument: (use_as_clause
    path: (scoped_identifier
      path: (_) @import_path
      name: (identifier) @original_name)
    alias: (identifier) @alias_name)) @import_stmt
)scm";

constexpr std::string_view kExportQuery = R"scm(
(source_file
  (const_item
    name: (identifier) @export_name
    value: (_) @export_value) @export_stmt)

(source_file
  (static_item
    name: (identifier) @export_name
    value: (_) @export_value) @export_stmt)
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment_expression left: (identifier) @reassigned_name)
(compound_assignment_expr left: (identifier) @reassigned_name)
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
)scm";

constexpr std::string_view kAssignmentQuery = R"scm(
(let_declaration
  pattern: (identifier) @assignment_target
  value: (identifier) @assignment_source) @assignment
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(call_expression
  function: (scoped_identifier path: (_) @object)) @completion_target
)scm";

}  // namespace

auto MakeRustProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "rust";
  profile.extensions = {".rs"};
  profile.grammar = tree_sitter_rust;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kBinding, kBindingQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kExport, kExportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kAssignment, kAssignmentQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"std::env", "env"};
  profile.known_env_modules = {"std::env", "env"};
  profile.completion_triggers = {"(\""};
  profile.root_node_kinds = {"source_file"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("block", ScopeKind::kBlock);
  profile.identifier_kinds = {"identifier", "field_identifier"};
  return profile;
}

}  // namespace ecolog::language
