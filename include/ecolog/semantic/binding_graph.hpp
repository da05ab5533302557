#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ecolog/core/analysis_types.hpp"
#include "ecolog/core/range.hpp"

namespace ecolog::semantic {

using ScopeId = uint32_t;
using BindingId = uint32_t;

inline constexpr ScopeId kRootScope = 0;

struct Scope {
  ScopeId id = kRootScope;
  std::optional<ScopeId> parent;
  ScopeKind kind = ScopeKind::kModule;
  Range range;
  // Later declarations replace earlier ones
  std::unordered_map<std::string, BindingId> bindings;
};

enum class BindingKind {
  // `const port = process.env.PORT`
  kDirectEnvAccess,
  // `const env = process.env`
  kObjectAlias,
  // `const { PORT } = env`
  kDestructured,
  // `const b = a`
  kReassignment,
  // Refers to a name that was never declared
  kUnresolved,
};

struct Binding {
  BindingId id = 0;
  std::string name;
  Range declaration_range;
  Range name_range;
  ScopeId scope = kRootScope;
  BindingKind kind = BindingKind::kUnresolved;
  // Variable name, canonical object name or destructured key, by kind
  std::string env_name;
  // Binding a kReassignment or kDestructured binding reads from
  std::optional<BindingId> target;
  // Property key of a destructuring pattern
  std::optional<Range> key_range;
  // Cleared when a later plain assignment overwrites the name
  bool valid = true;
};

// A read of a binding, optionally through a property: `env` or `env.PORT`
struct Usage {
  BindingId binding = 0;
  Range range;
  ScopeId scope = kRootScope;
  std::optional<std::string> property;
  std::optional<Range> property_range;
};

struct ResolvedEnv {
  enum class Kind { kVariable, kObject };

  Kind kind = Kind::kVariable;
  // Variable name, or canonical object name for kObject
  std::string name;
  std::size_t hops = 0;

  friend auto operator==(const ResolvedEnv&, const ResolvedEnv&)
      -> bool = default;
};

// Scope tree plus every env-related binding of one document. Bindings live in
// an arena indexed by id; links between them are ids, so chain walking is a
// bounded loop.
class BindingGraph {
 public:
  BindingGraph();

  auto SetRootRange(const Range& range) -> void;

  auto AddScope(ScopeKind kind, const Range& range, ScopeId parent) -> ScopeId;

  auto AddBinding(Binding binding) -> BindingId;

  auto AddUsage(Usage usage) -> void;

  auto Invalidate(BindingId id) -> void;

  // Points a reassignment or destructuring binding at its source
  auto Link(BindingId id, BindingId target) -> void;

  [[nodiscard]] auto GetBinding(BindingId id) const -> const Binding*;
  [[nodiscard]] auto GetScope(ScopeId id) const -> const Scope*;

  [[nodiscard]] auto Bindings() const -> const std::vector<Binding>& {
    return bindings_;
  }
  [[nodiscard]] auto Scopes() const -> const std::vector<Scope>& {
    return scopes_;
  }
  [[nodiscard]] auto Usages() const -> const std::vector<Usage>& {
    return usages_;
  }

  // Innermost scope containing `pos`; the root scope when none does
  [[nodiscard]] auto ScopeAt(const Position& pos) const -> ScopeId;

  // Walks from `scope` to the root; invalidated bindings are invisible
  [[nodiscard]] auto Lookup(const std::string& name, ScopeId scope) const
      -> std::optional<BindingId>;

  [[nodiscard]] auto LookupAt(const std::string& name, const Position& pos) const
      -> std::optional<BindingId>;

  // True when `ancestor` is `scope` or encloses it
  [[nodiscard]] auto IsScopeVisible(ScopeId scope, ScopeId ancestor) const
      -> bool;

  // Follows reassignment and destructuring links to the variable or object a
  // binding denotes. Fails when more than `max_hops` links are needed.
  [[nodiscard]] auto ResolveToEnv(
      BindingId id, std::size_t max_hops = kMaxChainDepth) const
      -> std::optional<ResolvedEnv>;

  [[nodiscard]] auto ResolvesToEnvObject(BindingId id) const -> bool;

  // Binding whose name or destructuring key covers `pos`
  [[nodiscard]] auto BindingAt(const Position& pos) const
      -> std::optional<BindingId>;

  // Canonical variable names each valid binding resolves to
  [[nodiscard]] auto EnvVarBindings() const
      -> std::unordered_map<std::string, std::vector<BindingId>>;

 private:
  std::vector<Scope> scopes_;
  std::vector<Binding> bindings_;
  std::vector<Usage> usages_;
};

}  // namespace ecolog::semantic
