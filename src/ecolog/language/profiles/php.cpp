#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

constexpr std::string_view kReferenceQuery = R"scm(
(subscript_expression
  (variable_name) @object
  .
  [(string) (encapsed_string)] @env_var_name) @env_access

(function_call_expression
  function: (name) @object
  arguments: (arguments
    .
    (argument [(string) (encapsed_string)] @env_var_name)
    (argument [(string) (encapsed_string)] @env_default_value)?)) @env_access
)scm";

constexpr std::string_view kBindingQuery = R"scm(
(assignment_expression
  left: (variable_name) @binding_name
  right: (subscript_expression
    (variable_name) @_object
    .
    [(string) (encapsed_string)] @bound_env_var)
  (#any-of? @_object "$_ENV" "$_SERVER")) @env_binding

(assignment_expression
  left: (variable_name) @binding_name
  right: (function_call_expression
    function: (name) @_function
    arguments: (arguments
      .
      (argument [(string) (encapsed_string)] @bound_env_var)))
  (#any-of? @_function "getenv" "env")) @env_binding

(assignment_expression
  left: (variable_name) @binding_name
  right: (variable_name) @_object
  (#any-of? @_object "$_ENV" "$_SERVER")) @env_object_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(namespace_use_clause
  (qualified_name) @import_path) @import_stmt @namespace_import
)scm";

constexpr std::string_view kExportQuery = R"scm(
(program
  (const_declaration
    (const_element (name) @export_name (_) @export_value)) @export_stmt)
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment_expression left: (variable_name) @reassigned_name)
(augmented_assignment_expression left: (variable_name) @reassigned_name)
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(variable_name) @identifier
(name) @identifier
)scm";

constexpr std::string_view kAssignmentQuery = R"scm(
(assignment_expression
  left: (variable_name) @assignment_target
  right: (variable_name) @assignment_source) @assignment
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(subscript_expression (variable_name) @object) @completion_target
(function_call_expression function: (name) @object) @completion_target
)scm";

}  // namespace

auto MakePhpProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "php";
  profile.extensions = {".php", ".phtml"};
  profile.grammar = tree_sitter_php;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kBinding, kBindingQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kExport, kExportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kAssignment, kAssignmentQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"$_ENV", "$_SERVER", "getenv", "env"};
  profile.default_env_object = "$_ENV";
  profile.completion_triggers = {"[\"", "['", "(\"", "('"};
  profile.property_accesses = {
      {.node_kind = "subscript_expression", .subscript = true},
  };
  profile.root_node_kinds = {"program"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("anonymous_function", ScopeKind::kFunction);
  profile.scope_nodes.emplace("compound_statement", ScopeKind::kBlock);
  profile.scope_nodes.emplace("foreach_statement", ScopeKind::kLoop);
  profile.identifier_kinds = {"variable_name", "name"};
  return profile;
}

}  // namespace ecolog::language
