#include "ecolog/core/analysis_types.hpp"

namespace ecolog {

auto ExportIndexEntry::Find(std::string_view name) const
    -> const ModuleExport* {
  if (name == kDefaultExportName) {
    return default_export ? &*default_export : nullptr;
  }
  auto it = named_exports.find(std::string(name));
  return it == named_exports.end() ? nullptr : &it->second;
}

auto ToString(SourceKind kind) -> std::string_view {
  switch (kind) {
    case SourceKind::kDirectReference:
      return "DirectReference";
    case SourceKind::kLocalBinding:
      return "LocalBinding";
    case SourceKind::kLocalUsage:
      return "LocalUsage";
    case SourceKind::kCrossModuleImport:
      return "CrossModuleImport";
    case SourceKind::kEnvObjectAlias:
      return "EnvObjectAlias";
  }
  return "Unknown";
}

auto ToString(ScopeKind kind) -> std::string_view {
  switch (kind) {
    case ScopeKind::kModule:
      return "module";
    case ScopeKind::kFunction:
      return "function";
    case ScopeKind::kClass:
      return "class";
    case ScopeKind::kLoop:
      return "loop";
    case ScopeKind::kConditional:
      return "conditional";
    case ScopeKind::kBlock:
      return "block";
  }
  return "block";
}

void to_json(nlohmann::json& j, const SourceKind& kind) {
  j = std::string(ToString(kind));
}

void to_json(nlohmann::json& j, const Reference& reference) {
  j = nlohmann::json{
      {"token", reference.token},
      {"range", reference.range},
      {"nameRange", reference.name_range},
      {"source", reference.source},
      {"envObject", reference.denotes_env_object}};
  if (reference.name) {
    j["name"] = *reference.name;
  }
  if (reference.via) {
    j["via"] = *reference.via;
  }
}

void to_json(nlohmann::json& j, const Resolution& resolution) {
  j = nlohmann::json{
      {"canonicalName", resolution.canonical_name},
      {"sourceKind", resolution.source},
      {"range", resolution.range}};
  if (resolution.via) {
    j["via"] = *resolution.via;
  }
}

}  // namespace ecolog
