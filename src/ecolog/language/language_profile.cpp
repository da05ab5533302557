#include "ecolog/language/language_profile.hpp"

namespace ecolog::language {

auto ToString(QueryKind kind) -> std::string_view {
  switch (kind) {
    case QueryKind::kReference:
      return "reference";
    case QueryKind::kBinding:
      return "binding";
    case QueryKind::kImport:
      return "import";
    case QueryKind::kExport:
      return "export";
    case QueryKind::kReassignment:
      return "reassignment";
    case QueryKind::kIdentifier:
      return "identifier";
    case QueryKind::kAssignment:
      return "assignment";
    case QueryKind::kDestructure:
      return "destructure";
    case QueryKind::kCompletion:
      return "completion";
  }
  return "unknown";
}

auto DefaultScopeNodes() -> std::unordered_map<std::string, ScopeKind> {
  std::unordered_map<std::string, ScopeKind> nodes;
  for (const auto* kind :
       {"function_declaration", "function_expression", "function",
        "arrow_function", "method_definition", "function_definition",
        "function_item", "func_literal", "closure_expression",
        "method_declaration", "method", "generator_function",
        "generator_function_declaration", "lambda"}) {
    nodes.emplace(kind, ScopeKind::kFunction);
  }
  for (const auto* kind :
       {"class_declaration", "class_definition", "class_body", "class",
        "impl_item", "trait_item"}) {
    nodes.emplace(kind, ScopeKind::kClass);
  }
  for (const auto* kind :
       {"for_statement", "for_in_statement", "for_of_statement",
        "while_statement", "do_statement", "for_expression",
        "while_expression", "loop_expression"}) {
    nodes.emplace(kind, ScopeKind::kLoop);
  }
  for (const auto* kind :
       {"if_statement", "else_clause", "try_statement", "catch_clause",
        "switch_statement", "switch_case", "if_expression",
        "match_expression"}) {
    nodes.emplace(kind, ScopeKind::kConditional);
  }
  return nodes;
}

auto DefaultRootNodeKinds() -> std::vector<std::string> {
  return {"program", "source_file", "module", "translation_unit",
          "compilation_unit", "chunk"};
}

}  // namespace ecolog::language
