#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

constexpr std::string_view kReferenceQuery = R"scm(
(function_call
  name: [(dot_index_expression) (identifier)] @object
  arguments: (arguments
    .
    (string content: (string_content) @env_var_name))) @env_access
)scm";

constexpr std::string_view kBindingQuery = R"scm(
(variable_declaration
  (assignment_statement
    (variable_list . name: (identifier) @binding_name)
    (expression_list
      .
      value: (function_call
        name: (dot_index_expression) @_function
        arguments: (arguments
          .
          (string content: (string_content) @bound_env_var)))))
  (#eq? @_function "os.getenv")) @env_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(variable_declaration
  (assignment_statement
    (variable_list . name: (identifier) @alias_name)
    (expression_list
      .
      value: (function_call
        name: (identifier) @_require
        arguments: (arguments
          .
          (string content: (string_content) @import_path)))))
  (#eq? @_require "require")) @import_stmt @namespace_import
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment_statement
  (variable_list name: (identifier) @reassigned_name))
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(function_call name: (_) @object) @completion_target
)scm";

}  // namespace

auto MakeLuaProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "lua";
  profile.extensions = {".lua"};
  profile.grammar = tree_sitter_lua;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kBinding, kBindingQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"os.getenv"};
  profile.completion_triggers = {"(\"", "('"};
  profile.root_node_kinds = {"chunk"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("function_definition_statement", ScopeKind::kFunction);
  profile.scope_nodes.emplace("local_function_declaration_statement", ScopeKind::kFunction);
  profile.scope_nodes.emplace("do_statement", ScopeKind::kBlock);
  profile.identifier_kinds = {"identifier"};
  return profile;
}

}  // namespace ecolog::language
