#include "ecolog/language/builtin_profiles.hpp"
#include "src/ecolog/language/profiles/grammars.hpp"

namespace ecolog::language {

namespace {

// Every shell variable expansion may read the environment, so references
// carry no @object and are accepted unconditionally.
constexpr std::string_view kReferenceQuery = R"scm(
(simple_expansion (variable_name) @env_var_name) @env_access

(expansion
  (variable_name) @env_var_name
  .
  (_)? @env_default_value) @env_access
)scm";

constexpr std::string_view kExportQuery = R"scm(
(program
  (declaration_command
    (variable_assignment
      name: (variable_name) @export_name
      value: (_) @export_value)) @export_stmt)
)scm";

constexpr std::string_view kIdentifierQuery = R"scm(
(variable_name) @identifier
)scm";

constexpr std::string_view kImportQuery = R"scm(
(command
  name: (command_name) @_command
  argument: (word) @import_path
  (#any-of? @_command "source" ".")) @import_stmt @namespace_import
)scm";

}  // namespace

auto MakeBashProfile() -> LanguageProfile {
  LanguageProfile profile;
  profile.id = "shellscript";
  profile.language_ids = {"bash", "sh"};
  profile.extensions = {".sh", ".bash", ".zsh"};
  profile.grammar = tree_sitter_bash;
  profile.SetQuery(QueryKind::kReference, kReferenceQuery)
      .SetQuery(QueryKind::kImport, kImportQuery)
      .SetQuery(QueryKind::kExport, kExportQuery)
      .SetQuery(QueryKind::kIdentifier, kIdentifierQuery);

  profile.completion_triggers = {"$", "${"};
  profile.root_node_kinds = {"program"};
  profile.scope_nodes = DefaultScopeNodes();
  profile.identifier_kinds = {"variable_name"};
  return profile;
}

}  // namespace ecolog::language
