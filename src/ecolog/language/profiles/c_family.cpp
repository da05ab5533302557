#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

// C and C++ share node names for everything queried here except the
// qualified `std::getenv` callee, which only the C++ grammar knows.
constexpr std::string_view kCReferenceQuery = R"scm(
(call_expression
  function: (identifier) @object
  arguments: (argument_list . (string_literal) @env_var_name)) @env_access
)scm";

constexpr std::string_view kCppReferenceQuery = R"scm(
(call_expression
  function: [(identifier) (qualified_identifier)] @object
  arguments: (argument_list . (string_literal) @env_var_name)) @env_access
)scm";

constexpr std::string_view kCBindingQuery = R"scm(
(init_declarator
  declarator: [
    (identifier) @binding_name
    (pointer_declarator declarator: (identifier) @binding_name)
  ]
  value: (call_expression
    function: (identifier) @_function
    arguments: (argument_list . (string_literal) @bound_env_var))
  (#any-of? @_function "getenv" "secure_getenv")) @env_binding
)scm";

constexpr std::string_view kCppBindingQuery = R"scm(
(init_declarator
  declarator: [
    (identifier) @binding_name
    (pointer_declarator declarator: (identifier) @binding_name)
  ]
  value: (call_expression
    function: [(identifier) (qualified_identifier)] @_function
    arguments: (argument_list . (string_literal) @bound_env_var))
  (#any-of? @_function "getenv" "secure_getenv" "std::getenv")) @env_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(preproc_include
  path: [(string_literal) (system_lib_string)] @import_path) @import_stmt @namespace_import
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment_expression left: (identifier) @reassigned_name)
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
)scm";

constexpr std::string_view kAssignmentQuery = R"scm(
(init_declarator
  declarator: [
    (identifier) @assignment_target
    (pointer_declarator declarator: (identifier) @assignment_target)
  ]
  value: (identifier) @assignment_source) @assignment
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(call_expression function: (_) @object) @completion_target
)scm";

auto MakeCFamilyBase(std::string id, GrammarFn grammar) -> LanguageProfile {
  LanguageProfile profile;
  profile.id = std::move(id);
  profile.grammar = grammar;
  profile.SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kAssignment, kAssignmentQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"getenv", "secure_getenv"};
  profile.completion_triggers = {"(\""};
  profile.root_node_kinds = {"translation_unit"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("compound_statement", ScopeKind::kBlock);
  profile.identifier_kinds = {"identifier"};
  return profile;
}

}  // namespace

auto MakeCProfile() -> LanguageProfile {
  auto profile = MakeCFamilyBase("c", tree_sitter_c);
  profile.extensions = {".c", ".h"};
  profile.SetQuery(QueryKind::kReference, kCReferenceQuery)
      .SetQuery(QueryKind::kBinding, kCBindingQuery);
  return profile;
}

auto MakeCppProfile() -> LanguageProfile {
  auto profile = MakeCFamilyBase("cpp", tree_sitter_cpp);
  profile.extensions = {".cpp", ".cc", ".cxx", ".hpp", ".hh", ".hxx"};
  profile.SetQuery(QueryKind::kReference, kCppReferenceQuery)
      .SetQuery(QueryKind::kBinding, kCppBindingQuery);
  profile.standard_env_objects.emplace_back("std::getenv");
  profile.scope_nodes.emplace("lambda_expression", ScopeKind::kFunction);
  profile.scope_nodes.emplace("for_range_loop", ScopeKind::kLoop);
  profile.scope_nodes.emplace("namespace_definition", ScopeKind::kBlock);
  profile.identifier_kinds.emplace_back("field_identifier");
  return profile;
}

}  // namespace ecolog::language
