#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

constexpr std::string_view kReferenceQuery = R"scm(
(element_reference
  object: (constant) @object
  .
  (string (string_content) @env_var_name)) @env_access

(call
  receiver: (constant) @object
  method: (identifier) @_method
  arguments: (argument_list
    .
    (string (string_content) @env_var_name)
    (string (string_content) @env_default_value)?)
  (#any-of? @_method "fetch" "key?" "has_key?")) @env_access
)scm";

constexpr std::string_view kBindingQuery = R"scm(
(assignment
  left: (identifier) @binding_name
  right: (element_reference
    object: (constant) @_object
    .
    (string (string_content) @bound_env_var))
  (#eq? @_object "ENV")) @env_binding

(assignment
  left: (identifier) @binding_name
  right: (call
    receiver: (constant) @_object
    method: (identifier) @_method
    arguments: (argument_list . (string (string_content) @bound_env_var)))
  (#eq? @_object "ENV")
  (#eq? @_method "fetch")) @env_binding

(assignment
  left: (identifier) @binding_name
  right: (constant) @_object
  (#eq? @_object "ENV")) @env_object_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(call
  method: (identifier) @_method
  arguments: (argument_list . (string (string_content) @import_path))
  (#any-of? @_method "require" "require_relative")) @import_stmt @namespace_import
)scm";

constexpr std::string_view kExportQuery = R"scm(
(program
  (assignment
    left: (constant) @export_name
    right: (_) @export_value) @export_stmt)
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment left: (identifier) @reassigned_name)
(operator_assignment left: (identifier) @reassigned_name)
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
(constant) @identifier
)scm";

constexpr std::string_view kAssignmentQuery = R"scm(
(assignment
  left: (identifier) @assignment_target
  right: (identifier) @assignment_source) @assignment
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(element_reference object: (_) @object) @completion_target
(call receiver: (_) @object) @completion_target
)scm";

}  // namespace

auto MakeRubyProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "ruby";
  profile.extensions = {".rb", ".rake", ".gemspec"};
  profile.grammar = tree_sitter_ruby;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kBinding, kBindingQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kExport, kExportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kAssignment, kAssignmentQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"ENV"};
  profile.default_env_object = "ENV";
  profile.completion_triggers = {"[\"", "['", "(\"", "('"};
  profile.property_accesses = {
      {.node_kind = "element_reference", .subscript = true},
  };
  profile.root_node_kinds = {"program"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.scope_nodes.emplace("singleton_method", ScopeKind::kFunction);
  profile.scope_nodes.emplace("module", ScopeKind::kClass);
  profile.scope_nodes.emplace("do_block", ScopeKind::kBlock);
  profile.scope_nodes.emplace("block", ScopeKind::kBlock);
  profile.scope_nodes.emplace("if", ScopeKind::kConditional);
  profile.scope_nodes.emplace("unless", ScopeKind::kConditional);
  profile.scope_nodes.emplace("while", ScopeKind::kLoop);
  profile.scope_nodes.emplace("for", ScopeKind::kLoop);
  profile.identifier_kinds = {"identifier", "constant"};
  return profile;
}

}  // namespace ecolog::language
