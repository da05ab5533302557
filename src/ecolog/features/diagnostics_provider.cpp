#include "ecolog/features/diagnostics_provider.hpp"

#include <unordered_map>

#include <fmt/format.h>

namespace ecolog::features {

void to_json(nlohmann::json& j, const Diagnostic& diagnostic) {
  j = nlohmann::json{
      {"range", diagnostic.range},
      {"severity", static_cast<int>(diagnostic.severity)},
      {"code", diagnostic.code},
      {"source", diagnostic.source},
      {"message", diagnostic.message}};
}

DiagnosticsProvider::DiagnosticsProvider(
    std::shared_ptr<GuardedValueProvider> values,
    std::shared_ptr<spdlog::logger> logger)
    : values_(std::move(values)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

auto DiagnosticsProvider::MakeUndefinedDiagnostic(
    const std::string& name, const Range& range) -> Diagnostic {
  return Diagnostic{
      .range = range,
      .severity = DiagnosticSeverity::kWarning,
      .code = std::string(kUndefinedEnvVarCode),
      .source = std::string(kDiagnosticSource),
      .message = fmt::format("Environment variable '{}' is not defined.", name)};
}

auto DiagnosticsProvider::CollectCandidates(
    const semantic::DocumentAnalysis& analysis)
    -> std::vector<std::pair<std::string, Range>> {
  std::vector<std::pair<std::string, Range>> candidates;
  for (const auto& reference : analysis.direct_references) {
    candidates.emplace_back(reference.name, reference.name_range);
  }

  const auto& graph = analysis.graph;
  for (const auto& binding : graph.Bindings()) {
    if (binding.valid && binding.kind == semantic::BindingKind::kDirectEnvAccess) {
      candidates.emplace_back(binding.env_name, binding.name_range);
    }
  }

  for (const auto& usage : graph.Usages()) {
    if (!usage.property || !graph.ResolvesToEnvObject(usage.binding)) {
      continue;
    }
    candidates.emplace_back(
        *usage.property, usage.property_range.value_or(usage.range));
  }
  return candidates;
}

auto DiagnosticsProvider::GetDocumentDiagnostics(
    std::string uri, const semantic::DocumentAnalysis& analysis)
    -> asio::awaitable<std::vector<Diagnostic>> {
  auto candidates = CollectCandidates(analysis);

  // true: defined, or unknown because the lookup failed
  std::unordered_map<std::string, bool> defined;
  for (const auto& [name, range] : candidates) {
    if (defined.contains(name)) {
      continue;
    }
    auto result = co_await values_->Lookup(name, uri);
    if (!result) {
      logger_->debug(
          "Skipping diagnostics for '{}': {}", name, result.error().message());
      defined.emplace(name, true);
      continue;
    }
    defined.emplace(name, result->has_value());
  }

  std::vector<Diagnostic> diagnostics;
  RangeDeduplicator seen;
  for (const auto& [name, range] : candidates) {
    if (!defined[name] && seen.Insert(range)) {
      diagnostics.push_back(MakeUndefinedDiagnostic(name, range));
    }
  }
  logger_->debug(
      "{} undefined variable diagnostic(s) for {}", diagnostics.size(), uri);
  co_return diagnostics;
}

}  // namespace ecolog::features
