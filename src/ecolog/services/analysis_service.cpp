#include "ecolog/services/analysis_service.hpp"

#include "ecolog/semantic/analysis_pipeline.hpp"

namespace ecolog::services {

namespace {

// Ancestors inspected when the cursor sits inside a property token, e.g. the
// string_fragment of `cfg["PORT"]`
constexpr int kPropertyAncestorDepth = 3;

auto ToResolution(
    const CrossModuleResolution& target, std::string via, const Range& range)
    -> Resolution {
  return Resolution{
      .canonical_name = target.name,
      .source = SourceKind::kCrossModuleImport,
      .via = std::move(via),
      .range = range};
}

}  // namespace

AnalysisService::AnalysisService(
    asio::any_io_executor executor, CanonicalPath workspace_root,
    std::shared_ptr<const language::LanguageRegistry> registry,
    std::shared_ptr<EnvValueProvider> values,
    std::shared_ptr<spdlog::logger> logger, EcologConfigFile config)
    : executor_(executor),
      workspace_root_(std::move(workspace_root)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      config_(std::move(config)),
      registry_(
          registry ? std::move(registry)
                   : language::LanguageRegistry::CreateDefault(logger_)),
      index_(std::make_shared<WorkspaceIndex>(logger_)),
      module_resolver_(
          std::make_shared<ModuleResolver>(workspace_root_, logger_)),
      documents_(std::make_unique<DocumentManager>(
          executor, registry_, logger_, config_.GetDebounceDelay())),
      indexer_(std::make_unique<WorkspaceIndexer>(
          registry_, index_, module_resolver_, logger_)),
      cross_module_(std::make_unique<CrossModuleResolver>(
          index_, module_resolver_, registry_, logger_)),
      tasks_(std::make_unique<utils::BackgroundTaskManager>(executor, logger_)) {
  if (values) {
    auto guarded = std::make_shared<GuardedValueProvider>(
        std::move(values), logger_, config_.GetLookupTimeout(),
        config_.GetRefreshTimeout());
    diagnostics_ = std::make_unique<features::DiagnosticsProvider>(
        std::move(guarded), logger_);
  }
}

auto AnalysisService::Open(
    std::string uri, std::string language_id, int version, std::string text)
    -> asio::awaitable<void> {
  co_await documents_->Open(
      std::move(uri), std::move(language_id), version, std::move(text));
}

auto AnalysisService::Change(std::string uri, int version, std::string text)
    -> asio::awaitable<void> {
  co_await documents_->Change(std::move(uri), version, std::move(text));
}

auto AnalysisService::Close(std::string uri) -> asio::awaitable<void> {
  co_await documents_->Close(std::move(uri));
}

auto AnalysisService::Flush(std::string uri) -> asio::awaitable<void> {
  co_await documents_->Flush(std::move(uri));
}

auto AnalysisService::Get(const std::string& uri) const
    -> std::shared_ptr<const DocumentSnapshot> {
  return documents_->Get(uri);
}

auto AnalysisService::ReferenceAt(
    const std::string& uri, const Position& pos) const
    -> std::optional<Reference> {
  return documents_->ReferenceAt(uri, pos);
}

auto AnalysisService::CompletionContextAt(
    const std::string& uri, const Position& pos) const
    -> std::optional<std::string> {
  return documents_->CompletionContextAt(uri, pos);
}

auto AnalysisService::SyntaxErrors(const std::string& uri) const
    -> std::vector<language::SyntaxErrorFact> {
  return documents_->SyntaxErrors(uri);
}

auto AnalysisService::FindEnvVarUsages(
    const std::string& uri, std::string_view name) const
    -> std::vector<Reference> {
  return documents_->FindEnvVarUsages(uri, name);
}

auto AnalysisService::AllEnvVars(const std::string& uri) const
    -> std::vector<std::string> {
  return documents_->AllEnvVars(uri);
}

auto AnalysisService::Resolve(const std::string& uri, const Position& pos) const
    -> std::optional<Resolution> {
  auto snapshot = documents_->Get(uri);
  if (!snapshot) {
    return std::nullopt;
  }

  if (auto reference = documents_->ReferenceAt(uri, pos)) {
    if (reference->name) {
      return Resolution{
          .canonical_name = *reference->name,
          .source = reference->source,
          .via = reference->via,
          .range = reference->range};
    }
  }
  return ResolveImportedToken(uri, *snapshot, pos);
}

auto AnalysisService::ResolveImportedToken(
    const std::string& uri, const DocumentSnapshot& snapshot,
    const Position& pos) const -> std::optional<Resolution> {
  if (!snapshot.language || !snapshot.tree) {
    return std::nullopt;
  }
  const auto& language = *snapshot.language;
  const auto& tree = *snapshot.tree;
  const auto& imports = snapshot.analysis.import_context;
  if (imports.aliases.empty()) {
    return std::nullopt;
  }

  auto offset = tree.Lines().ToByteOffset(pos);
  if (!offset) {
    return std::nullopt;
  }
  auto node = tree.Root().NamedDescendantForBytes(
      static_cast<uint32_t>(*offset), static_cast<uint32_t>(*offset));
  if (node.IsNull()) {
    return std::nullopt;
  }

  // `cfg.PORT` through `import * as cfg`, or `env.PORT` where `env` is an
  // imported env object
  auto current = node;
  for (int depth = 0; depth < kPropertyAncestorDepth; ++depth) {
    auto parent = current.Parent();
    if (parent.IsNull()) {
      break;
    }
    const auto* form = language.FindPropertyAccessForm(parent.Kind());
    if (form == nullptr) {
      current = parent;
      continue;
    }

    auto object = form->object_field.empty()
                      ? parent.NamedChild(0)
                      : parent.ChildByField(form->object_field);
    if (object.IsNull()) {
      break;
    }
    auto property = form->property_field.empty()
                        ? object.NextNamedSibling()
                        : parent.ChildByField(form->property_field);
    if (property.IsNull() || !(current == property)) {
      break;
    }

    auto object_name = std::string(tree.Text(object));
    const auto* imported = imports.Lookup(object_name);
    if (imported == nullptr ||
        snapshot.analysis.graph.LookupAt(object_name, pos)) {
      return std::nullopt;
    }
    auto name =
        std::string(language::LanguageSupport::StripQuotes(tree.Text(property)));
    auto range = tree.RangeOf(parent);

    if (imported->original_name == kNamespaceImportName) {
      auto target = cross_module_->ResolveNamespaceMember(uri, *imported, name);
      if (target && target->kind == CrossModuleResolution::Kind::kVariable) {
        return ToResolution(*target, object_name, range);
      }
      return std::nullopt;
    }
    auto target = cross_module_->ResolveImport(uri, *imported);
    if (target && target->kind == CrossModuleResolution::Kind::kObject) {
      return Resolution{
          .canonical_name = std::move(name),
          .source = SourceKind::kCrossModuleImport,
          .via = std::move(object_name),
          .range = range};
    }
    return std::nullopt;
  }

  if (!language.IsIdentifierKind(node.Kind())) {
    return std::nullopt;
  }
  auto identifier = std::string(tree.Text(node));
  const auto* imported = imports.Lookup(identifier);
  if (imported == nullptr ||
      imported->original_name == kNamespaceImportName ||
      snapshot.analysis.graph.LookupAt(identifier, pos)) {
    return std::nullopt;
  }

  auto target = cross_module_->ResolveImport(uri, *imported);
  if (!target || target->kind != CrossModuleResolution::Kind::kVariable) {
    return std::nullopt;
  }
  logger_->debug(
      "{} resolved to {} through {} ({} hop(s))", identifier, target->name,
      target->defining_uri, target->hops);
  return ToResolution(*target, identifier, tree.RangeOf(node));
}

auto AnalysisService::ExportsOf(const std::string& uri) const
    -> std::optional<ExportIndexEntry> {
  if (auto exports = index_->ExportsOf(uri)) {
    return exports;
  }
  auto snapshot = documents_->Get(uri);
  if (!snapshot || !snapshot->language) {
    return std::nullopt;
  }
  return semantic::AnalysisPipeline::BuildExportEntry(
      *snapshot->language, snapshot->analysis);
}

auto AnalysisService::ResolveModuleSpecifier(
    std::string_view specifier, const std::string& importing_uri,
    std::string_view language_id) const -> std::optional<std::string> {
  auto language = registry_->ForDocument(importing_uri, language_id);
  if (!language) {
    return std::nullopt;
  }
  auto resolved = module_resolver_->Resolve(
      specifier, CanonicalPath::FromUri(importing_uri),
      language->Profile().extensions);
  if (!resolved) {
    return std::nullopt;
  }
  return resolved->ToUri();
}

auto AnalysisService::IndexWorkspace(const EcologConfigFile& config)
    -> asio::awaitable<std::expected<void, EcologError>> {
  co_return co_await indexer_->IndexWorkspace(
      workspace_root_, config, tasks_->Token());
}

auto AnalysisService::StartWorkspaceIndexing() -> void {
  tasks_->SpawnCancellable("workspace-index", RunWorkspaceIndexing());
}

auto AnalysisService::RunWorkspaceIndexing() -> asio::awaitable<void> {
  auto result = co_await IndexWorkspace(Config());
  if (!result) {
    logger_->warn("Workspace indexing stopped: {}", result.error().message());
  }
}

auto AnalysisService::OnFileChanged(const std::string& uri)
    -> asio::awaitable<std::expected<void, EcologError>> {
  co_return co_await indexer_->OnFileChanged(CanonicalPath::FromUri(uri));
}

auto AnalysisService::OnFileDeleted(const std::string& uri) -> void {
  indexer_->OnFileDeleted(CanonicalPath::FromUri(uri));
}

auto AnalysisService::Diagnostics(std::string uri)
    -> asio::awaitable<std::vector<features::Diagnostic>> {
  if (!diagnostics_ || !Config().GetFeatures().diagnostics) {
    co_return std::vector<features::Diagnostic>{};
  }
  auto snapshot = documents_->Get(uri);
  if (!snapshot) {
    co_return std::vector<features::Diagnostic>{};
  }
  co_return co_await diagnostics_->GetDocumentDiagnostics(
      std::move(uri), snapshot->analysis);
}

auto AnalysisService::ApplyConfig(EcologConfigFile config)
    -> asio::awaitable<void> {
  auto debounce = config.GetDebounceDelay();
  {
    std::scoped_lock lock(config_mutex_);
    config_ = std::move(config);
  }
  co_await documents_->SetDebounceDelay(debounce);
}

auto AnalysisService::Shutdown() -> asio::awaitable<void> {
  co_await tasks_->Shutdown();
}

}  // namespace ecolog::services
