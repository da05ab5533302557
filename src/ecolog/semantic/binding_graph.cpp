#include "ecolog/semantic/binding_graph.hpp"

namespace ecolog::semantic {

BindingGraph::BindingGraph() {
  scopes_.push_back(Scope{.id = kRootScope, .kind = ScopeKind::kModule});
}

auto BindingGraph::SetRootRange(const Range& range) -> void {
  scopes_[kRootScope].range = range;
}

auto BindingGraph::AddScope(ScopeKind kind, const Range& range, ScopeId parent)
    -> ScopeId {
  auto id = static_cast<ScopeId>(scopes_.size());
  scopes_.push_back(
      Scope{.id = id, .parent = parent, .kind = kind, .range = range});
  return id;
}

auto BindingGraph::AddBinding(Binding binding) -> BindingId {
  auto id = static_cast<BindingId>(bindings_.size());
  binding.id = id;
  if (binding.scope >= scopes_.size()) {
    binding.scope = kRootScope;
  }
  scopes_[binding.scope].bindings.insert_or_assign(binding.name, id);
  bindings_.push_back(std::move(binding));
  return id;
}

auto BindingGraph::AddUsage(Usage usage) -> void {
  usages_.push_back(std::move(usage));
}

auto BindingGraph::Invalidate(BindingId id) -> void {
  if (id < bindings_.size()) {
    bindings_[id].valid = false;
  }
}

auto BindingGraph::Link(BindingId id, BindingId target) -> void {
  if (id < bindings_.size() && target < bindings_.size()) {
    bindings_[id].target = target;
  }
}

auto BindingGraph::GetBinding(BindingId id) const -> const Binding* {
  return id < bindings_.size() ? &bindings_[id] : nullptr;
}

auto BindingGraph::GetScope(ScopeId id) const -> const Scope* {
  return id < scopes_.size() ? &scopes_[id] : nullptr;
}

auto BindingGraph::ScopeAt(const Position& pos) const -> ScopeId {
  ScopeId best = kRootScope;
  for (const auto& scope : scopes_) {
    if (scope.id == kRootScope || !ContainsPosition(scope.range, pos)) {
      continue;
    }
    if (best == kRootScope ||
        IsSmallerRange(scope.range, scopes_[best].range)) {
      best = scope.id;
    }
  }
  return best;
}

auto BindingGraph::Lookup(const std::string& name, ScopeId scope) const
    -> std::optional<BindingId> {
  std::optional<ScopeId> current = scope;
  while (current && *current < scopes_.size()) {
    const auto& s = scopes_[*current];
    auto it = s.bindings.find(name);
    if (it != s.bindings.end() && bindings_[it->second].valid) {
      return it->second;
    }
    current = s.parent;
  }
  return std::nullopt;
}

auto BindingGraph::LookupAt(const std::string& name, const Position& pos) const
    -> std::optional<BindingId> {
  return Lookup(name, ScopeAt(pos));
}

auto BindingGraph::IsScopeVisible(ScopeId scope, ScopeId ancestor) const
    -> bool {
  std::optional<ScopeId> current = scope;
  while (current && *current < scopes_.size()) {
    if (*current == ancestor) {
      return true;
    }
    current = scopes_[*current].parent;
  }
  return false;
}

auto BindingGraph::ResolveToEnv(BindingId id, std::size_t max_hops) const
    -> std::optional<ResolvedEnv> {
  // Keys applied by destructuring links still waiting for an object to
  // index; the innermost key is on top.
  std::vector<const std::string*> pending_keys;
  BindingId current = id;

  for (std::size_t hops = 0; hops <= max_hops; ++hops) {
    const auto* binding = GetBinding(current);
    if (binding == nullptr || !binding->valid) {
      return std::nullopt;
    }

    switch (binding->kind) {
      case BindingKind::kDirectEnvAccess:
        if (!pending_keys.empty()) {
          return std::nullopt;
        }
        return ResolvedEnv{
            .kind = ResolvedEnv::Kind::kVariable,
            .name = binding->env_name,
            .hops = hops};

      case BindingKind::kObjectAlias:
        if (pending_keys.empty()) {
          return ResolvedEnv{
              .kind = ResolvedEnv::Kind::kObject,
              .name = binding->env_name,
              .hops = hops};
        }
        if (pending_keys.size() == 1) {
          return ResolvedEnv{
              .kind = ResolvedEnv::Kind::kVariable,
              .name = *pending_keys.back(),
              .hops = hops};
        }
        // A key of a variable's value is not an environment variable
        return std::nullopt;

      case BindingKind::kDestructured:
        if (!binding->target) {
          return std::nullopt;
        }
        pending_keys.push_back(&binding->env_name);
        current = *binding->target;
        break;

      case BindingKind::kReassignment:
        if (!binding->target) {
          return std::nullopt;
        }
        current = *binding->target;
        break;

      case BindingKind::kUnresolved:
        return std::nullopt;
    }
  }
  return std::nullopt;
}

auto BindingGraph::ResolvesToEnvObject(BindingId id) const -> bool {
  auto resolved = ResolveToEnv(id);
  return resolved && resolved->kind == ResolvedEnv::Kind::kObject;
}

auto BindingGraph::BindingAt(const Position& pos) const
    -> std::optional<BindingId> {
  std::optional<BindingId> best;
  Range best_range;
  auto consider = [&](BindingId id, const Range& range) {
    if (!ContainsPosition(range, pos)) {
      return;
    }
    if (!best || IsSmallerRange(range, best_range)) {
      best = id;
      best_range = range;
    }
  };
  for (const auto& binding : bindings_) {
    consider(binding.id, binding.name_range);
    if (binding.key_range) {
      consider(binding.id, *binding.key_range);
    }
  }
  return best;
}

auto BindingGraph::EnvVarBindings() const
    -> std::unordered_map<std::string, std::vector<BindingId>> {
  std::unordered_map<std::string, std::vector<BindingId>> index;
  for (const auto& binding : bindings_) {
    if (!binding.valid) {
      continue;
    }
    auto resolved = ResolveToEnv(binding.id);
    if (resolved && resolved->kind == ResolvedEnv::Kind::kVariable) {
      index[resolved->name].push_back(binding.id);
    }
  }
  return index;
}

}  // namespace ecolog::semantic
