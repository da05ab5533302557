#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ecolog/core/analysis_types.hpp"
#include "ecolog/language/language_support.hpp"
#include "ecolog/semantic/analysis_pipeline.hpp"
#include "ecolog/syntax/ts_node.hpp"

namespace ecolog::semantic {

// Position queries over one document's analysis
class BindingResolver {
 public:
  // Every occurrence the analysis knows about: direct reads, binding names,
  // destructuring keys, plain usages and property reads through aliases.
  // Object aliases appear without a name.
  static auto CollectReferences(const DocumentAnalysis& analysis)
      -> std::vector<Reference>;

  // Smallest reference whose name token contains `pos`, else the smallest
  // whose whole range does
  static auto ReferenceAt(
      const std::vector<Reference>& references, const Position& pos)
      -> std::optional<Reference>;

  // All occurrences resolving to `name`, one per token range
  static auto FindEnvVarUsages(
      const std::vector<Reference>& references, std::string_view name)
      -> std::vector<Reference>;

  // Sorted, unique canonical names
  static auto AllEnvVars(const std::vector<Reference>& references)
      -> std::vector<std::string>;

  // Env object, getter or alias driving completion at `pos`; nothing when the
  // base expression at the cursor has no relation to the environment
  static auto CompletionContextAt(
      const language::LanguageSupport& language,
      const syntax::SyntaxTree& tree, const DocumentAnalysis& analysis,
      const Position& pos) -> std::optional<std::string>;
};

}  // namespace ecolog::semantic
