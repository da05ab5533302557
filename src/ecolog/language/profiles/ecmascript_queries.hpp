#pragma once

#include <string_view>

// Queries shared by the JavaScript, TypeScript and TSX grammars, which agree
// on every node kind used here.
namespace ecolog::language::ecmascript {

inline constexpr std::string_view kReferenceQuery = R"scm(
(member_expression
  object: (member_expression) @object
  property: (property_identifier) @env_var_name) @env_access

(member_expression
  object: (identifier) @object
  property: (property_identifier) @env_var_name) @env_access

(subscript_expression
  object: (member_expression) @object
  index: (string (string_fragment) @env_var_name)) @env_access

(subscript_expression
  object: (identifier) @object
  index: (string (string_fragment) @env_var_name)) @env_access

(binary_expression
  left: (member_expression
    object: (member_expression) @object
    property: (property_identifier) @env_var_name) @env_access
  operator: ["||" "??"]
  right: (string (string_fragment) @env_default_value))
)scm";

inline constexpr std::string_view kBindingQuery = R"scm(
(variable_declarator
  name: (identifier) @binding_name
  value: (member_expression
    object: (member_expression) @_object
    property: (property_identifier) @bound_env_var)
  (#any-of? @_object "process.env" "import.meta.env")) @env_binding

(variable_declarator
  name: (identifier) @binding_name
  value: (subscript_expression
    object: (member_expression) @_object
    index: (string (string_fragment) @bound_env_var))
  (#any-of? @_object "process.env" "import.meta.env")) @env_binding

(variable_declarator
  name: (identifier) @binding_name
  value: (binary_expression
    left: (member_expression
      object: (member_expression) @_object
      property: (property_identifier) @bound_env_var))
  (#any-of? @_object "process.env" "import.meta.env")) @env_binding

(variable_declarator
  name: (identifier) @binding_name
  value: (member_expression) @_object
  (#any-of? @_object "process.env" "import.meta.env")) @env_object_binding

(variable_declarator
  name: (object_pattern
    (pair_pattern
      key: (property_identifier) @bound_env_var
      value: (identifier) @binding_name))
  value: (member_expression) @_object
  (#any-of? @_object "process.env" "import.meta.env")) @env_object_binding

(variable_declarator
  name: (object_pattern
    (pair_pattern
      key: (property_identifier) @bound_env_var
      value: (assignment_pattern
        left: (identifier) @binding_name)))
  value: (member_expression) @_object
  (#any-of? @_object "process.env" "import.meta.env")) @env_object_binding

(variable_declarator
  name: (object_pattern
    (shorthand_property_identifier_pattern) @binding_name @bound_env_var)
  value: (member_expression) @_object
  (#any-of? @_object "process.env" "import.meta.env")) @env_object_binding

(variable_declarator
  name: (object_pattern
    (object_assignment_pattern
      left: (shorthand_property_identifier_pattern) @binding_name @bound_env_var))
  value: (member_expression) @_object
  (#any-of? @_object "process.env" "import.meta.env")) @env_object_binding
)scm";

inline constexpr std::string_view kImportQuery = R"scm(
(import_statement
  (import_clause
    (named_imports
      (import_specifier
        name: (identifier) @original_name
        alias: (identifier) @alias_name)))
  source: (string (string_fragment) @import_path)) @import_stmt

(import_statement
  (import_clause
    (named_imports
      (import_specifier
        name: (identifier) @original_name
        !alias)))
  source: (string (string_fragment) @import_path)) @import_stmt

(import_statement
  (import_clause
    (identifier) @alias_name)
  source: (string (string_fragment) @import_path)) @import_stmt @default_import

(import_statement
  (import_clause
    (namespace_import (identifier) @alias_name))
  source: (string (string_fragment) @import_path)) @import_stmt @namespace_import
)scm";

inline constexpr std::string_view kExportQuery = R"scm(
(export_statement
  declaration: (lexical_declaration
    (variable_declarator
      name: (identifier) @export_name
      value: (_) @export_value))) @export_stmt

(export_statement
  declaration: (variable_declaration
    (variable_declarator
      name: (identifier) @export_name
      value: (_) @export_value))) @export_stmt

(export_statement
  (export_clause
    (export_specifier
      name: (identifier) @local_name
      alias: (identifier) @export_name))
  !source) @export_stmt

(export_statement
  (export_clause
    (export_specifier
      name: (identifier) @export_name
      !alias))
  !source) @export_stmt

(export_statement
  (export_clause
    (export_specifier
      name: (identifier) @local_name
      alias: (identifier) @export_name))
  source: (string (string_fragment) @reexport_source)) @export_stmt

(export_statement
  (export_clause
    (export_specifier
      name: (identifier) @export_name
      !alias))
  source: (string (string_fragment) @reexport_source)) @export_stmt

(export_statement
  "*"
  source: (string (string_fragment) @wildcard_source)) @export_stmt

(export_statement
  value: (_) @export_value) @default_export

(assignment_expression
  left: (member_expression
    object: (identifier) @_module
    property: (property_identifier) @_exports)
  right: (_) @export_value
  (#eq? @_module "module")
  (#eq? @_exports "exports")) @cjs_default_export

(assignment_expression
  left: (member_expression
    object: (identifier) @_exports
    property: (property_identifier) @export_name)
  right: (_) @export_value
  (#eq? @_exports "exports")) @cjs_named_export
)scm";

inline constexpr std::string_view kReassignmentQuery = R"scm(
(assignment_expression left: (identifier) @reassigned_name)
(augmented_assignment_expression left: (identifier) @reassigned_name)
)scm";

inline constexpr std::string_view kIdentifierQuery = R"scm(
(identifier) @identifier
(shorthand_property_identifier) @identifier
)scm";

inline constexpr std::string_view kAssignmentQuery = R"scm(
(variable_declarator
  name: (identifier) @assignment_target
  value: (identifier) @assignment_source) @assignment
)scm";

inline constexpr std::string_view kDestructureQuery = R"scm(
(variable_declarator
  name: (object_pattern
    (pair_pattern
      key: (property_identifier) @destructure_key
      value: (identifier) @destructure_target))
  value: (identifier) @destructure_source) @destructure

(variable_declarator
  name: (object_pattern
    (shorthand_property_identifier_pattern) @destructure_target @destructure_key)
  value: (identifier) @destructure_source) @destructure

(variable_declarator
  name: (object_pattern
    (object_assignment_pattern
      left: (shorthand_property_identifier_pattern) @destructure_target @destructure_key))
  value: (identifier) @destructure_source) @destructure
)scm";

inline constexpr std::string_view kCompletionQuery = R"scm(
(member_expression object: (_) @object) @completion_target
(subscript_expression object: (_) @object) @completion_target
)scm";

}  // namespace ecolog::language::ecmascript
