#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ecolog/core/analysis_types.hpp"
#include "ecolog/core/module_resolver.hpp"
#include "ecolog/language/language_registry.hpp"
#include "ecolog/services/workspace_index.hpp"

namespace ecolog::services {

// An imported name traced to the file that reads the environment
struct CrossModuleResolution {
  enum class Kind { kVariable, kObject };

  Kind kind = Kind::kVariable;
  // Variable name, or canonical object name for kObject
  std::string name;
  std::string defining_uri;
  Range declaration_range;
  // Re-export and wildcard links followed
  std::size_t hops = 0;
};

// Follows imports through the workspace export index. Only indexed files
// take part; an import of anything else resolves to nothing.
class CrossModuleResolver {
 public:
  CrossModuleResolver(
      std::shared_ptr<const WorkspaceIndex> index,
      std::shared_ptr<const ModuleResolver> module_resolver,
      std::shared_ptr<const language::LanguageRegistry> registry,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // `imported.original_name` is an export name or "default"
  [[nodiscard]] auto ResolveImport(
      const std::string& importing_uri, const ImportedName& imported) const
      -> std::optional<CrossModuleResolution>;

  // `name` read through a namespace import of `imported.module_path`
  [[nodiscard]] auto ResolveNamespaceMember(
      const std::string& importing_uri, const ImportedName& imported,
      std::string_view name) const -> std::optional<CrossModuleResolution>;

  // (export name, variable name) for each named export of the module that
  // resolves to a variable
  [[nodiscard]] auto NamespaceMembers(
      const std::string& importing_uri, std::string_view specifier) const
      -> std::vector<std::pair<std::string, std::string>>;

  [[nodiscard]] auto ResolveExport(
      const std::string& module_uri, std::string_view name) const
      -> std::optional<CrossModuleResolution>;

  [[nodiscard]] auto ResolveSpecifier(
      const std::string& importing_uri, std::string_view specifier) const
      -> std::optional<std::string>;

 private:
  using VisitedSet = std::set<std::pair<std::string, std::string>>;

  auto ResolveRecursive(
      const std::string& module_uri, std::string_view name, std::size_t hops,
      VisitedSet& visited) const -> std::optional<CrossModuleResolution>;

  auto ResolveEntry(
      const ModuleExport& module_export, const std::string& module_uri,
      std::size_t hops, VisitedSet& visited) const
      -> std::optional<CrossModuleResolution>;

  std::shared_ptr<const WorkspaceIndex> index_;
  std::shared_ptr<const ModuleResolver> module_resolver_;
  std::shared_ptr<const language::LanguageRegistry> registry_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ecolog::services
