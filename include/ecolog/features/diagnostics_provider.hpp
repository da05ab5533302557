#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ecolog/core/range.hpp"
#include "ecolog/core/value_provider.hpp"
#include "ecolog/semantic/analysis_pipeline.hpp"

namespace ecolog::features {

enum class DiagnosticSeverity {
  kError = 1,
  kWarning = 2,
  kInformation = 3,
  kHint = 4,
};

struct Diagnostic {
  Range range;
  DiagnosticSeverity severity = DiagnosticSeverity::kWarning;
  std::string code;
  std::string source;
  std::string message;

  friend auto operator==(const Diagnostic&, const Diagnostic&)
      -> bool = default;
};

void to_json(nlohmann::json& j, const Diagnostic& diagnostic);

inline constexpr std::string_view kUndefinedEnvVarCode = "undefined-env-var";
inline constexpr std::string_view kDiagnosticSource = "ecolog";

// Reports variables read by a document that the value provider does not
// define
class DiagnosticsProvider {
 public:
  explicit DiagnosticsProvider(
      std::shared_ptr<GuardedValueProvider> values,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto GetDocumentDiagnostics(
      std::string uri, const semantic::DocumentAnalysis& analysis)
      -> asio::awaitable<std::vector<Diagnostic>>;

  // (variable, token range) for direct reads, env-var bindings and property
  // reads through env object aliases, in that order
  static auto CollectCandidates(const semantic::DocumentAnalysis& analysis)
      -> std::vector<std::pair<std::string, Range>>;

  static auto MakeUndefinedDiagnostic(const std::string& name, const Range& range)
      -> Diagnostic;

 private:
  std::shared_ptr<GuardedValueProvider> values_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ecolog::features
