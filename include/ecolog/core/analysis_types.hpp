#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ecolog/core/range.hpp"

namespace ecolog {

// Hops allowed through alias, reassignment and re-export links
inline constexpr std::size_t kMaxChainDepth = 10;

inline constexpr auto kDefaultDebounceDelay = std::chrono::milliseconds(300);

enum class ScopeKind {
  kModule,
  kFunction,
  kClass,
  kLoop,
  kConditional,
  kBlock,
};

// How a Reference reached its canonical name
enum class SourceKind {
  kDirectReference,
  kLocalBinding,
  kLocalUsage,
  kCrossModuleImport,
  kEnvObjectAlias,
};

// One occurrence reading an environment value
struct Reference {
  // Canonical variable name, absent when the token does not resolve to one
  std::optional<std::string> name;
  // Source text of the occurrence's token
  std::string token;
  // Whole occurrence, e.g. `process.env.PORT` or `env.PORT`
  Range range;
  // The token that names the variable (or the binding)
  Range name_range;
  SourceKind source = SourceKind::kDirectReference;
  // Binding or module the value flowed through
  std::optional<std::string> via;
  // The token denotes the whole environment object rather than one variable
  bool denotes_env_object = false;

  friend auto operator==(const Reference&, const Reference&) -> bool = default;
};

// Answer of a position query
struct Resolution {
  std::string canonical_name;
  SourceKind source = SourceKind::kDirectReference;
  std::optional<std::string> via;
  Range range;

  friend auto operator==(const Resolution&, const Resolution&)
      -> bool = default;
};

struct ImportedName {
  std::string module_path;
  // Exported name in the source module; "default" for default imports and
  // "*" for namespace imports
  std::string original_name;
};

struct ImportContext {
  std::unordered_map<std::string, ImportedName> aliases;
  std::unordered_set<std::string> imported_modules;

  [[nodiscard]] auto Lookup(const std::string& local_name) const
      -> const ImportedName* {
    auto it = aliases.find(local_name);
    return it == aliases.end() ? nullptr : &it->second;
  }
};

inline constexpr std::string_view kDefaultExportName = "default";
inline constexpr std::string_view kNamespaceImportName = "*";

struct ExportEnvVar {
  std::string name;
  friend auto operator==(const ExportEnvVar&, const ExportEnvVar&)
      -> bool = default;
};

struct ExportEnvObject {
  std::string canonical_name;
  friend auto operator==(const ExportEnvObject&, const ExportEnvObject&)
      -> bool = default;
};

// `export { x } from './other'`
struct ExportReExport {
  std::string source_module;
  std::string original_name;
  friend auto operator==(const ExportReExport&, const ExportReExport&)
      -> bool = default;
};

// Local alias chain that could not be classified at index time
struct ExportLocalChain {
  uint32_t symbol_id = 0;
  friend auto operator==(const ExportLocalChain&, const ExportLocalChain&)
      -> bool = default;
};

struct ExportOpaque {
  friend auto operator==(const ExportOpaque&, const ExportOpaque&)
      -> bool = default;
};

using ExportResolution = std::variant<
    ExportOpaque, ExportEnvVar, ExportEnvObject, ExportReExport,
    ExportLocalChain>;

struct ModuleExport {
  std::string exported_name;
  std::optional<std::string> local_name;
  Range declaration_range;
  bool is_default = false;
  ExportResolution resolution;
};

// Everything one file exports, as seen by cross-module resolution
struct ExportIndexEntry {
  std::map<std::string, ModuleExport> named_exports;
  std::optional<ModuleExport> default_export;
  // Sources of `export * from '...'`
  std::vector<std::string> wildcard_reexports;

  [[nodiscard]] auto Find(std::string_view name) const -> const ModuleExport*;

  [[nodiscard]] auto ExportCount() const -> std::size_t {
    return named_exports.size() + (default_export ? 1 : 0);
  }
};

[[nodiscard]] auto ToString(SourceKind kind) -> std::string_view;
[[nodiscard]] auto ToString(ScopeKind kind) -> std::string_view;

void to_json(nlohmann::json& j, const SourceKind& kind);
void to_json(nlohmann::json& j, const Reference& reference);
void to_json(nlohmann::json& j, const Resolution& resolution);

}  // namespace ecolog

template <>
struct fmt::formatter<ecolog::SourceKind> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(ecolog::SourceKind kind, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        ecolog::ToString(kind), ctx);
  }
};
