#include "ecolog/semantic/binding_resolver.hpp"

#include <algorithm>
#include <set>
#include <unordered_set>

#include "ecolog/language/query_engine.hpp"

namespace ecolog::semantic {

namespace {

struct ReferenceKey {
  Range range;
  Range name_range;
  friend auto operator==(const ReferenceKey&, const ReferenceKey&)
      -> bool = default;
};

struct ReferenceKeyHash {
  auto operator()(const ReferenceKey& key) const noexcept -> std::size_t {
    return RangeHash{}(key.range) * 31 + RangeHash{}(key.name_range);
  }
};

}  // namespace

auto BindingResolver::CollectReferences(const DocumentAnalysis& analysis)
    -> std::vector<Reference> {
  std::vector<Reference> references;
  std::unordered_set<ReferenceKey, ReferenceKeyHash> seen;
  auto add = [&](Reference reference) {
    if (seen.insert({reference.range, reference.name_range}).second) {
      references.push_back(std::move(reference));
    }
  };

  for (const auto& fact : analysis.direct_references) {
    add(Reference{
        .name = fact.name,
        .token = fact.name,
        .range = fact.range,
        .name_range = fact.name_range,
        .source = SourceKind::kDirectReference,
        .via = fact.object});
  }

  const auto& graph = analysis.graph;
  for (const auto& binding : graph.Bindings()) {
    if (!binding.valid) {
      continue;
    }
    auto resolved = graph.ResolveToEnv(binding.id);
    if (!resolved) {
      continue;
    }
    bool is_object = resolved->kind == ResolvedEnv::Kind::kObject;
    std::optional<std::string> name;
    if (!is_object) {
      name = resolved->name;
    }

    add(Reference{
        .name = name,
        .token = binding.name,
        .range = binding.name_range,
        .name_range = binding.name_range,
        .source = SourceKind::kLocalBinding,
        .via = binding.name,
        .denotes_env_object = is_object});

    if (binding.key_range && name) {
      add(Reference{
          .name = name,
          .token = *name,
          .range = *binding.key_range,
          .name_range = *binding.key_range,
          .source = SourceKind::kLocalBinding,
          .via = binding.name});
    }
  }

  for (const auto& usage : graph.Usages()) {
    const auto* binding = graph.GetBinding(usage.binding);
    if (binding == nullptr) {
      continue;
    }
    auto resolved = graph.ResolveToEnv(usage.binding);
    if (!resolved) {
      continue;
    }
    bool is_object = resolved->kind == ResolvedEnv::Kind::kObject;

    if (usage.property) {
      if (!is_object) {
        continue;
      }
      add(Reference{
          .name = *usage.property,
          .token = *usage.property,
          .range = usage.range,
          .name_range = usage.property_range.value_or(usage.range),
          .source = SourceKind::kEnvObjectAlias,
          .via = binding->name});
      continue;
    }

    std::optional<std::string> name;
    if (!is_object) {
      name = resolved->name;
    }
    add(Reference{
        .name = std::move(name),
        .token = binding->name,
        .range = usage.range,
        .name_range = usage.range,
        .source = SourceKind::kLocalUsage,
        .via = binding->name,
        .denotes_env_object = is_object});
  }
  return references;
}

auto BindingResolver::ReferenceAt(
    const std::vector<Reference>& references, const Position& pos)
    -> std::optional<Reference> {
  const Reference* best = nullptr;
  for (const auto& reference : references) {
    if (!ContainsPosition(reference.name_range, pos)) {
      continue;
    }
    if (best == nullptr ||
        IsSmallerRange(reference.name_range, best->name_range)) {
      best = &reference;
    }
  }
  if (best != nullptr) {
    return *best;
  }

  for (const auto& reference : references) {
    if (!ContainsPosition(reference.range, pos)) {
      continue;
    }
    if (best == nullptr || IsSmallerRange(reference.range, best->range)) {
      best = &reference;
    }
  }
  if (best != nullptr) {
    return *best;
  }
  return std::nullopt;
}

auto BindingResolver::FindEnvVarUsages(
    const std::vector<Reference>& references, std::string_view name)
    -> std::vector<Reference> {
  std::vector<Reference> usages;
  RangeDeduplicator seen;
  for (const auto& reference : references) {
    if (reference.name && *reference.name == name &&
        seen.Insert(reference.name_range)) {
      usages.push_back(reference);
    }
  }
  return usages;
}

auto BindingResolver::AllEnvVars(const std::vector<Reference>& references)
    -> std::vector<std::string> {
  std::set<std::string> names;
  for (const auto& reference : references) {
    if (reference.name) {
      names.insert(*reference.name);
    }
  }
  return {names.begin(), names.end()};
}

auto BindingResolver::CompletionContextAt(
    const language::LanguageSupport& language, const syntax::SyntaxTree& tree,
    const DocumentAnalysis& analysis, const Position& pos)
    -> std::optional<std::string> {
  language::QueryEngine engine(language, tree);
  auto object = engine.CompletionObjectAt(pos);
  if (!object) {
    return std::nullopt;
  }

  if (language.IsStandardEnvObject(*object)) {
    return object;
  }
  if (const auto* imported = analysis.import_context.Lookup(*object)) {
    if (language.IsKnownEnvModule(imported->module_path)) {
      return object;
    }
  }
  if (auto id = analysis.graph.LookupAt(*object, pos)) {
    if (analysis.graph.ResolvesToEnvObject(*id)) {
      return object;
    }
  }
  return std::nullopt;
}

}  // namespace ecolog::semantic
