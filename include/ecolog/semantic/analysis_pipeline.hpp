#pragma once

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "ecolog/core/analysis_types.hpp"
#include "ecolog/language/language_support.hpp"
#include "ecolog/language/query_engine.hpp"
#include "ecolog/semantic/binding_graph.hpp"
#include "ecolog/syntax/ts_node.hpp"

namespace ecolog::semantic {

// Everything derived from one parse of one document
struct DocumentAnalysis {
  BindingGraph graph;
  std::vector<language::ReferenceFact> direct_references;
  std::vector<language::ImportFact> imports;
  ImportContext import_context;
  std::vector<language::ExportFact> exports;
  std::vector<language::SyntaxErrorFact> syntax_errors;
};

// Turns a parsed tree into a DocumentAnalysis:
//   1. scope tree and property-access candidates, in one walk
//   2. imports
//   3. direct references
//   4. bindings, assignments and destructures, then forward links
//   5. usages, plain and through env object aliases
//   6. reassignments, which invalidate the bindings they overwrite
//   7. exports and syntax errors
class AnalysisPipeline {
 public:
  static auto Analyze(
      const language::LanguageSupport& language,
      const syntax::SyntaxTree& tree,
      std::shared_ptr<spdlog::logger> logger = nullptr) -> DocumentAnalysis;

  // Classifies each export fact against the module-level bindings
  static auto BuildExportEntry(
      const language::LanguageSupport& language,
      const DocumentAnalysis& analysis) -> ExportIndexEntry;
};

}  // namespace ecolog::semantic
