#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

constexpr std::string_view kReferenceQuery = R"scm(
(invocation_expression
  function: (member_access_expression
    expression: (_) @object
    name: (identifier) @_method)
  arguments: (argument_list
    .
    (argument (string_literal) @env_var_name))
  (#eq? @_method "GetEnvironmentVariable")) @env_access
)scm";

constexpr std::string_view kBindingQuery = R"scm(
(variable_declarator
  (identifier) @binding_name
  (_
    (invocation_expression
      function: (member_access_expression
        expression: (_) @_object
        name: (identifier) @_method)
      arguments: (argument_list
        .
        (argument (string_literal) @bound_env_var))))
  (#any-of? @_object "Environment" "System.Environment")
  (#eq? @_method "GetEnvironmentVariable")) @env_binding

(variable_declarator
  (identifier) @binding_name
  (invocation_expression
    function: (member_access_expression
      expression: (_) @_object
      name: (identifier) @_method)
    arguments: (argument_list
      .
      (argument (string_literal) @bound_env_var)))
  (#any-of? @_object "Environment" "System.Environment")
  (#eq? @_method "GetEnvironmentVariable")) @env_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(using_directive
  (identifier) @alias_name
  (qualified_name) @import_path) @import_stmt @namespace_import
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment_expression left: (identifier) @reassigned_name)
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(invocation_expression
  function: (member_access_expression expression: (_) @object)) @completion_target
)scm";

}  // namespace

auto MakeCSharpProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "csharp";
  profile.extensions = {".cs"};
  profile.grammar = tree_sitter_c_sharp;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kBinding, kBindingQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"Environment", "System.Environment"};
  profile.completion_triggers = {"(\""};
  profile.root_node_kinds = {"compilation_unit"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("constructor_declaration", ScopeKind::kFunction);
  profile.scope_nodes.emplace("local_function_statement", ScopeKind::kFunction);
  profile.scope_nodes.emplace("lambda_expression", ScopeKind::kFunction);
  profile.scope_nodes.emplace("foreach_statement", ScopeKind::kLoop);
  profile.scope_nodes.emplace("block", ScopeKind::kBlock);
  profile.identifier_kinds = {"identifier"};
  return profile;
}

}  // namespace ecolog::language
