#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

constexpr std::string_view kReferenceQuery = R"scm(
(call_expression
  function: (selector_expression
    operand: (identifier) @object
    field: (field_identifier) @_function)
  arguments: (argument_list
    .
    [(interpreted_string_literal) (raw_string_literal)] @env_var_name)
  (#any-of? @_function "Getenv" "LookupEnv")) @env_access
)scm";

constexpr std::string_view kBindingQuery = R"scm(
(short_var_declaration
  left: (expression_list . (identifier) @binding_name)
  right: (expression_list
    .
    (call_expression
      function: (selector_expression
        operand: (identifier) @_package
        field: (field_identifier) @_function)
      arguments: (argument_list
        .
        (interpreted_string_literal) @bound_env_var)))
  (#eq? @_package "os")
  (#any-of? @_function "Getenv" "LookupEnv")) @env_binding

(var_spec
  name: (identifier) @binding_name
  value: (expression_list
    .
    (call_expression
      function: (selector_expression
        operand: (identifier) @_package
        field: (field_identifier) @_function)
      arguments: (argument_list
        .
        (interpreted_string_literal) @bound_env_var)))
  (#eq? @_package "os")
  (#any-of? @_function "Getenv" "LookupEnv")) @env_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(import_spec
  name: (package_identifier) @alias_name
  path: (interpreted_string_literal) @import_path) @import_stmt @namespace_import

(import_spec
  !name
  path: (interpreted_string_literal) @import_path) @import_stmt @namespace_import
)scm";

constexpr std::string_view kExportQuery = R"scm(
(source_file
  (var_declaration
    (var_spec
      name: (identifier) @export_name
      value: (expression_list . (_) @export_value))) @export_stmt
  (#match? @export_name "^[A-Z]"))

(source_file
  (const_declaration
    (const_spec
      name: (identifier) @export_name
      value: (expression_list . (_) @export_value))) @export_stmt
  (#match? @export_name "^[A-Z]"))
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment_statement
  left: (expression_list (identifier) @reassigned_name))
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
)scm";

constexpr std::string_view kAssignmentQuery = R"scm(
(short_var_declaration
  left: (expression_list . (identifier) @assignment_target .)
  right: (expression_list . (identifier) @assignment_source .)) @assignment
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(call_expression
  function: (selector_expression
    operand: (_) @object
    field: (field_identifier) @_function)
  (#any-of? @_function "Getenv" "LookupEnv")) @completion_target
)scm";

}  // namespace

auto MakeGoProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "go";
  profile.extensions = {".go"};
  profile.grammar = tree_sitter_go;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kBinding, kBindingQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kExport, kExportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kAssignment, kAssignmentQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"os"};
  profile.known_env_modules = {"os"};
  profile.completion_triggers = {"(\"", "(`"};
  profile.root_node_kinds = {"source_file"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("block", ScopeKind::kBlock);
  profile.identifier_kinds = {"identifier", "field_identifier"};
  return profile;
}

}  // namespace ecolog::language
