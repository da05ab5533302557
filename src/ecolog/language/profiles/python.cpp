#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

constexpr std::string_view kReferenceQuery = R"scm(
(subscript
  value: (attribute) @object
  subscript: (string (string_content) @env_var_name)) @env_access

(subscript
  value: (identifier) @object
  subscript: (string (string_content) @env_var_name)) @env_access

(call
  function: (attribute
    object: (attribute) @object
    attribute: (identifier) @_method)
  arguments: (argument_list
    .
    (string (string_content) @env_var_name)
    (string (string_content) @env_default_value)?)
  (#eq? @_method "get")) @env_access

(call
  function: (attribute
    object: (identifier) @object
    attribute: (identifier) @_method)
  arguments: (argument_list
    .
    (string (string_content) @env_var_name)
    (string (string_content) @env_default_value)?)
  (#eq? @_method "getenv")) @env_access

(call
  function: (identifier) @object
  arguments: (argument_list
    .
    (string (string_content) @env_var_name))) @env_access
)scm";

constexpr std::string_view kBindingQuery = R"scm(
(assignment
  left: (identifier) @binding_name
  right: (subscript
    value: (attribute) @_object
    subscript: (string (string_content) @bound_env_var))
  (#eq? @_object "os.environ")) @env_binding

(assignment
  left: (identifier) @binding_name
  right: (call
    function: (attribute
      object: (attribute) @_object
      attribute: (identifier) @_method)
    arguments: (argument_list . (string (string_content) @bound_env_var)))
  (#eq? @_object "os.environ")
  (#eq? @_method "get")) @env_binding

(assignment
  left: (identifier) @binding_name
  right: (call
    function: (attribute
      object: (identifier) @_object
      attribute: (identifier) @_method)
    arguments: (argument_list . (string (string_content) @bound_env_var)))
  (#eq? @_object "os")
  (#eq? @_method "getenv")) @env_binding

(assignment
  left: (identifier) @binding_name
  right: (attribute) @_object
  (#eq? @_object "os.environ")) @env_object_binding
)scm";

constexpr std::string_view kImportQuery = R"scm(
(import_from_statement
  module_name: (dotted_name) @import_path
  name: (dotted_name) @original_name) @import_stmt

(import_from_statement
  module_name: (dotted_name) @import_path
  name: (aliased_import
    name: (dotted_name) @original_name
    alias: (identifier) @alias_name)) @import_stmt

(import_statement
  name: (aliased_import
    name: (dotted_name) @import_path
    alias: (identifier) @alias_name)) @import_stmt @namespace_import

(import_statement
  name: (dotted_name) @import_path) @import_stmt @namespace_import
)scm";

constexpr std::string_view kExportQuery = R"scm(
(module
  (expression_statement
    (assignment
      left: (identifier) @export_name
      right: (_) @export_value)) @export_stmt)
)scm";

constexpr std::string_view kReassignmentQuery = R"scm(
(assignment left: (identifier) @reassigned_name)
(augmented_assignment left: (identifier) @reassigned_name)
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
)scm";

constexpr std::string_view kAssignmentQuery = R"scm(
(assignment
  left: (identifier) @assignment_target
  right: (identifier) @assignment_source) @assignment
)scm";

constexpr std::string_view kCompletionQuery = R"scm(
(subscript value: (_) @object) @completion_target
(call function: (attribute object: (_) @object)) @completion_target
)scm";

}  // namespace

auto MakePythonProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "python";
  profile.extensions = {".py", ".pyi"};
  profile.grammar = tree_sitter_python;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kBinding, kBindingQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kExport, kExportQuery)
      .SetQuery(QueryKind::kReassignment, kReassignmentQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery)
      .SetQuery(QueryKind::kAssignment, kAssignmentQuery)
      .SetQuery(QueryKind::kCompletion, kCompletionQuery);

  profile.standard_env_objects = {"os.environ", "os"};
  profile.default_env_object = "os.environ";
  profile.known_env_modules = {"os"};
  profile.completion_triggers = {"[\"", "['", "(\"", "('"};
  profile.property_accesses = {
      {.node_kind = "subscript",
       .object_field = "value",
       .property_field = "subscript",
       .subscript = true},
  };
  profile.root_node_kinds = {"module"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.identifier_kinds = {"identifier"};
  return profile;
}

}  // namespace ecolog::language
