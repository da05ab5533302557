#include "ecolog/semantic/analysis_pipeline.hpp"

#include <string>
#include <utility>

#include "ecolog/utils/scoped_timer.hpp"

namespace ecolog::semantic {

namespace {

// `env.PORT` or `env["PORT"]` where `env` is a plain identifier. Whether
// `env` is an env object alias is only known once bindings exist.
struct PropertyAccessCandidate {
  std::string object_name;
  Position object_position;
  std::string property;
  Range usage_range;
  Range property_range;
};

auto MakeCandidate(
    const language::LanguageSupport& language, const syntax::SyntaxTree& tree,
    const syntax::Node& node, const language::PropertyAccessForm& form)
    -> std::optional<PropertyAccessCandidate> {
  auto object = form.object_field.empty()
                    ? node.NamedChild(0)
                    : node.ChildByField(form.object_field);
  if (object.IsNull() || !language.IsIdentifierKind(object.Kind())) {
    return std::nullopt;
  }
  auto property = form.property_field.empty()
                      ? object.NextNamedSibling()
                      : node.ChildByField(form.property_field);
  if (property.IsNull()) {
    return std::nullopt;
  }

  auto raw = tree.Text(property);
  auto text = language::LanguageSupport::StripQuotes(raw);
  auto property_range = tree.RangeOf(property);
  if (form.subscript) {
    // Only literal keys name a variable
    if (text.size() == raw.size()) {
      return std::nullopt;
    }
    property_range.start.character += 1;
    property_range.end.character -= 1;
  }
  if (text.empty()) {
    return std::nullopt;
  }

  return PropertyAccessCandidate{
      .object_name = std::string(tree.Text(object)),
      .object_position = tree.RangeOf(object).start,
      .property = std::string(text),
      .usage_range = tree.RangeOf(node),
      .property_range = property_range};
}

auto WalkScopes(
    const language::LanguageSupport& language, const syntax::SyntaxTree& tree,
    BindingGraph& graph) -> std::vector<PropertyAccessCandidate> {
  std::vector<PropertyAccessCandidate> candidates;
  std::vector<std::pair<syntax::Node, ScopeId>> stack{
      {tree.Root(), kRootScope}};

  while (!stack.empty()) {
    auto [node, scope] = stack.back();
    stack.pop_back();

    auto kind = node.Kind();
    if (!language.IsRootNode(kind)) {
      if (auto scope_kind = language.ScopeKindOf(kind)) {
        scope = graph.AddScope(*scope_kind, tree.RangeOf(node), scope);
      }
    }
    if (const auto* form = language.FindPropertyAccessForm(kind)) {
      if (auto candidate = MakeCandidate(language, tree, node, *form)) {
        candidates.push_back(std::move(*candidate));
      }
    }

    for (uint32_t i = node.NamedChildCount(); i > 0; --i) {
      stack.emplace_back(node.NamedChild(i - 1), scope);
    }
  }
  return candidates;
}

auto IsAfter(const Range& usage, const Range& declaration) -> bool {
  return usage.start >= declaration.end;
}

auto HasBindingNamedAt(const BindingGraph& graph, const Range& range) -> bool {
  for (const auto& binding : graph.Bindings()) {
    if (binding.name_range == range) {
      return true;
    }
  }
  return false;
}

}  // namespace

auto AnalysisPipeline::Analyze(
    const language::LanguageSupport& language, const syntax::SyntaxTree& tree,
    std::shared_ptr<spdlog::logger> logger) -> DocumentAnalysis {
  if (!logger) {
    logger = spdlog::default_logger();
  }
  utils::ScopedTimer timer(
      fmt::format("{} analysis", language.Id()), logger,
      std::chrono::milliseconds(500));

  DocumentAnalysis result;
  auto& graph = result.graph;
  language::QueryEngine engine(language, tree);
  graph.SetRootRange(tree.RangeOf(tree.Root()));

  // Phase 1
  auto candidates = WalkScopes(language, tree, graph);

  // Phase 2
  result.imports = engine.Imports();
  result.import_context = language::QueryEngine::MakeImportContext(result.imports);

  // Phase 3
  result.direct_references = engine.References(result.import_context);

  // Phase 4
  for (auto& fact : engine.Bindings()) {
    Binding binding;
    binding.name = std::move(fact.name);
    binding.declaration_range = fact.range;
    binding.name_range = fact.name_range;
    binding.scope = graph.ScopeAt(fact.name_range.start);
    if (fact.kind == language::BindingFact::Kind::kEnvVar) {
      binding.kind = BindingKind::kDirectEnvAccess;
      binding.env_name = std::move(fact.env_var);
      if (fact.destructured) {
        binding.key_range = fact.env_var_range;
      }
    } else {
      binding.kind = BindingKind::kObjectAlias;
      const auto& fallback = language.Profile().default_env_object;
      binding.env_name =
          fact.object ? *fact.object : fallback.value_or(std::string());
    }
    graph.AddBinding(std::move(binding));
  }

  // Sources declared later in the file are linked once every binding exists
  std::vector<std::pair<BindingId, std::string>> unlinked;

  for (auto& fact : engine.Assignments()) {
    if (HasBindingNamedAt(graph, fact.target_range)) {
      continue;
    }
    auto scope = graph.ScopeAt(fact.target_range.start);
    auto source = graph.Lookup(fact.source, scope);
    Binding binding{
        .name = std::move(fact.target),
        .declaration_range = fact.range,
        .name_range = fact.target_range,
        .scope = scope,
        .kind = BindingKind::kReassignment,
        .target = source};
    auto id = graph.AddBinding(std::move(binding));
    if (!source) {
      unlinked.emplace_back(id, std::move(fact.source));
    }
  }

  for (auto& fact : engine.Destructures()) {
    if (HasBindingNamedAt(graph, fact.target_range)) {
      continue;
    }
    auto scope = graph.ScopeAt(fact.target_range.start);
    auto source = graph.Lookup(fact.source, scope);
    Binding binding{
        .name = std::move(fact.target),
        .declaration_range = fact.range,
        .name_range = fact.target_range,
        .scope = scope,
        .kind = BindingKind::kDestructured,
        .env_name = std::move(fact.key),
        .target = source,
        .key_range = fact.key_range};
    auto id = graph.AddBinding(std::move(binding));
    if (!source) {
      unlinked.emplace_back(id, std::move(fact.source));
    }
  }

  for (const auto& [id, source_name] : unlinked) {
    const auto* binding = graph.GetBinding(id);
    auto source = graph.Lookup(source_name, binding->scope);
    if (source && *source != id) {
      graph.Link(id, *source);
    }
  }

  // Phase 5
  for (const auto& identifier : engine.Identifiers()) {
    auto scope = graph.ScopeAt(identifier.range.start);
    auto id = graph.Lookup(identifier.name, scope);
    if (!id) {
      continue;
    }
    const auto* binding = graph.GetBinding(*id);
    if (identifier.range == binding->name_range ||
        !IsAfter(identifier.range, binding->declaration_range)) {
      continue;
    }
    graph.AddUsage(Usage{.binding = *id, .range = identifier.range, .scope = scope});
  }

  for (auto& candidate : candidates) {
    auto scope = graph.ScopeAt(candidate.object_position);
    auto id = graph.Lookup(candidate.object_name, scope);
    if (!id || !graph.ResolvesToEnvObject(*id)) {
      continue;
    }
    graph.AddUsage(Usage{
        .binding = *id,
        .range = candidate.usage_range,
        .scope = scope,
        .property = std::move(candidate.property),
        .property_range = candidate.property_range});
  }

  // Phase 6
  for (const auto& reassignment : engine.Reassignments()) {
    // Assignment-style declarations match the reassignment query too
    if (HasBindingNamedAt(graph, reassignment.range)) {
      continue;
    }
    auto reassignment_scope = graph.ScopeAt(reassignment.range.start);
    for (const auto& binding : graph.Bindings()) {
      if (binding.valid && binding.name == reassignment.name &&
          graph.IsScopeVisible(binding.scope, reassignment_scope)) {
        logger->debug(
            "Binding {} at {} invalidated by reassignment at {}", binding.name,
            binding.name_range, reassignment.range);
        graph.Invalidate(binding.id);
      }
    }
  }

  // Phase 7
  result.exports = engine.Exports();
  result.syntax_errors = engine.SyntaxErrors();

  logger->debug(
      "{} analysis: {} reference(s), {} binding(s), {} usage(s), {} scope(s)",
      language.Id(), result.direct_references.size(), graph.Bindings().size(),
      graph.Usages().size(), graph.Scopes().size());
  return result;
}

auto AnalysisPipeline::BuildExportEntry(
    const language::LanguageSupport& language, const DocumentAnalysis& analysis)
    -> ExportIndexEntry {
  ExportIndexEntry entry;
  const auto& graph = analysis.graph;

  auto classify = [&](const language::ExportFact& fact) -> ExportResolution {
    if (fact.reexport_source) {
      return ExportReExport{
          .source_module = *fact.reexport_source,
          .original_name = fact.local_name.value_or(fact.exported_name)};
    }

    if (fact.local_name) {
      if (auto id = graph.Lookup(*fact.local_name, kRootScope)) {
        auto resolved = graph.ResolveToEnv(*id);
        if (!resolved) {
          return ExportLocalChain{.symbol_id = *id};
        }
        if (resolved->kind == ResolvedEnv::Kind::kVariable) {
          return ExportEnvVar{.name = resolved->name};
        }
        return ExportEnvObject{.canonical_name = resolved->name};
      }
      // `import { x } from './a'; export { x }`
      if (const auto* imported =
              analysis.import_context.Lookup(*fact.local_name)) {
        return ExportReExport{
            .source_module = imported->module_path,
            .original_name = imported->original_name};
      }
    }

    if (fact.value_range) {
      for (const auto& reference : analysis.direct_references) {
        if (reference.range == *fact.value_range) {
          return ExportEnvVar{.name = reference.name};
        }
      }
    }
    if (fact.value_text && language.IsStandardEnvObject(*fact.value_text)) {
      return ExportEnvObject{.canonical_name = *fact.value_text};
    }
    return ExportOpaque{};
  };

  for (const auto& fact : analysis.exports) {
    if (fact.wildcard_source) {
      entry.wildcard_reexports.push_back(*fact.wildcard_source);
      continue;
    }
    ModuleExport module_export{
        .exported_name = fact.exported_name,
        .local_name = fact.local_name,
        .declaration_range = fact.range,
        .is_default = fact.is_default,
        .resolution = classify(fact)};
    if (fact.is_default) {
      entry.default_export = std::move(module_export);
    } else {
      entry.named_exports.insert_or_assign(
          fact.exported_name, std::move(module_export));
    }
  }
  return entry;
}

}  // namespace ecolog::semantic
