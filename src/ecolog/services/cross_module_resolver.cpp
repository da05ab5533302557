#include "ecolog/services/cross_module_resolver.hpp"

#include <type_traits>
#include <variant>

namespace ecolog::services {

CrossModuleResolver::CrossModuleResolver(
    std::shared_ptr<const WorkspaceIndex> index,
    std::shared_ptr<const ModuleResolver> module_resolver,
    std::shared_ptr<const language::LanguageRegistry> registry,
    std::shared_ptr<spdlog::logger> logger)
    : index_(std::move(index)),
      module_resolver_(std::move(module_resolver)),
      registry_(std::move(registry)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto CrossModuleResolver::ResolveSpecifier(
    const std::string& importing_uri, std::string_view specifier) const
    -> std::optional<std::string> {
  auto importing_path = CanonicalPath::FromUri(importing_uri);
  auto language = registry_->ForPath(importing_path.Path());
  if (!language) {
    return std::nullopt;
  }
  auto resolved = module_resolver_->Resolve(
      specifier, importing_path, language->Profile().extensions);
  if (!resolved) {
    return std::nullopt;
  }
  return resolved->ToUri();
}

auto CrossModuleResolver::ResolveImport(
    const std::string& importing_uri, const ImportedName& imported) const
    -> std::optional<CrossModuleResolution> {
  if (imported.original_name == kNamespaceImportName) {
    return std::nullopt;
  }
  auto module_uri = ResolveSpecifier(importing_uri, imported.module_path);
  if (!module_uri) {
    return std::nullopt;
  }
  VisitedSet visited;
  return ResolveRecursive(*module_uri, imported.original_name, 0, visited);
}

auto CrossModuleResolver::ResolveNamespaceMember(
    const std::string& importing_uri, const ImportedName& imported,
    std::string_view name) const -> std::optional<CrossModuleResolution> {
  auto module_uri = ResolveSpecifier(importing_uri, imported.module_path);
  if (!module_uri) {
    return std::nullopt;
  }
  VisitedSet visited;
  return ResolveRecursive(*module_uri, name, 0, visited);
}

auto CrossModuleResolver::ResolveExport(
    const std::string& module_uri, std::string_view name) const
    -> std::optional<CrossModuleResolution> {
  VisitedSet visited;
  return ResolveRecursive(module_uri, name, 0, visited);
}

auto CrossModuleResolver::NamespaceMembers(
    const std::string& importing_uri, std::string_view specifier) const
    -> std::vector<std::pair<std::string, std::string>> {
  std::vector<std::pair<std::string, std::string>> members;
  auto module_uri = ResolveSpecifier(importing_uri, specifier);
  if (!module_uri) {
    return members;
  }
  auto file = index_->Find(*module_uri);
  if (!file) {
    return members;
  }
  for (const auto& [name, module_export] : file->exports.named_exports) {
    VisitedSet visited;
    auto resolved = ResolveEntry(module_export, *module_uri, 0, visited);
    if (resolved && resolved->kind == CrossModuleResolution::Kind::kVariable) {
      members.emplace_back(name, resolved->name);
    }
  }
  return members;
}

auto CrossModuleResolver::ResolveRecursive(
    const std::string& module_uri, std::string_view name, std::size_t hops,
    VisitedSet& visited) const -> std::optional<CrossModuleResolution> {
  if (hops > kMaxChainDepth) {
    logger_->debug(
        "Export chain for '{}' exceeds {} hops at {}", name, kMaxChainDepth,
        module_uri);
    return std::nullopt;
  }
  if (!visited.emplace(module_uri, std::string(name)).second) {
    logger_->debug("Export cycle through {} ('{}')", module_uri, name);
    return std::nullopt;
  }

  auto file = index_->Find(module_uri);
  if (!file) {
    return std::nullopt;
  }

  if (const auto* module_export = file->exports.Find(name)) {
    return ResolveEntry(*module_export, module_uri, hops, visited);
  }

  // The default export never comes through `export *`
  if (name == kDefaultExportName) {
    return std::nullopt;
  }
  for (const auto& source : file->exports.wildcard_reexports) {
    auto source_uri = ResolveSpecifier(module_uri, source);
    if (!source_uri) {
      continue;
    }
    if (auto resolved = ResolveRecursive(*source_uri, name, hops + 1, visited)) {
      return resolved;
    }
  }
  return std::nullopt;
}

auto CrossModuleResolver::ResolveEntry(
    const ModuleExport& module_export, const std::string& module_uri,
    std::size_t hops, VisitedSet& visited) const
    -> std::optional<CrossModuleResolution> {
  return std::visit(
      [&](const auto& resolution) -> std::optional<CrossModuleResolution> {
        using T = std::decay_t<decltype(resolution)>;
        if constexpr (std::is_same_v<T, ExportEnvVar>) {
          return CrossModuleResolution{
              .kind = CrossModuleResolution::Kind::kVariable,
              .name = resolution.name,
              .defining_uri = module_uri,
              .declaration_range = module_export.declaration_range,
              .hops = hops};
        } else if constexpr (std::is_same_v<T, ExportEnvObject>) {
          return CrossModuleResolution{
              .kind = CrossModuleResolution::Kind::kObject,
              .name = resolution.canonical_name,
              .defining_uri = module_uri,
              .declaration_range = module_export.declaration_range,
              .hops = hops};
        } else if constexpr (std::is_same_v<T, ExportReExport>) {
          auto source_uri = ResolveSpecifier(module_uri, resolution.source_module);
          if (!source_uri) {
            return std::nullopt;
          }
          return ResolveRecursive(
              *source_uri, resolution.original_name, hops + 1, visited);
        } else {
          // Opaque values and local chains the index could not classify
          return std::nullopt;
        }
      },
      module_export.resolution);
}

}  // namespace ecolog::services
