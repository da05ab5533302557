#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <tree_sitter/api.h>

#include "ecolog/error/error.hpp"
#include "ecolog/syntax/ts_node.hpp"

namespace ecolog::syntax {

struct QueryDeleter {
  auto operator()(TSQuery* query) const -> void {
    ts_query_delete(query);
  }
};

// Text predicate attached to a query pattern. The C API hands predicates back
// uninterpreted, so they are evaluated here against captured node text.
struct TextPredicate {
  enum class Op { kEq, kNotEq, kMatch, kNotMatch, kAnyOf };

  Op op = Op::kEq;
  uint32_t capture = 0;
  // Second capture for `(#eq? @a @b)`
  std::optional<uint32_t> other_capture;
  std::vector<std::string> values;
  std::optional<std::regex> pattern;
};

// A tree-sitter query together with its capture table and parsed predicates.
// Immutable after compilation and safe to share across threads; each
// execution uses its own cursor.
class CompiledQuery {
 public:
  static auto Compile(const TSLanguage* language, std::string_view source)
      -> std::expected<CompiledQuery, EcologError>;

  [[nodiscard]] auto Raw() const -> const TSQuery* {
    return query_.get();
  }

  [[nodiscard]] auto CaptureId(std::string_view name) const
      -> std::optional<uint32_t>;

  [[nodiscard]] auto CaptureName(uint32_t id) const -> std::string_view;

  [[nodiscard]] auto PatternCount() const -> uint32_t {
    return ts_query_pattern_count(query_.get());
  }

  // True when every predicate of the match's pattern holds
  [[nodiscard]] auto Satisfies(
      const TSQueryMatch& match, const SyntaxTree& tree) const -> bool;

 private:
  CompiledQuery() = default;

  std::unique_ptr<TSQuery, QueryDeleter> query_;
  std::unordered_map<std::string, uint32_t> capture_ids_;
  std::vector<std::vector<TextPredicate>> predicates_;
};

// A single query match flattened into capture id -> nodes
class QueryMatch {
 public:
  QueryMatch(
      const CompiledQuery& query, const TSQueryMatch& match,
      const SyntaxTree& tree);

  [[nodiscard]] auto PatternIndex() const -> uint32_t {
    return pattern_index_;
  }

  // First node captured under `name`, or a null node
  [[nodiscard]] auto Get(std::string_view name) const -> Node;

  [[nodiscard]] auto Has(std::string_view name) const -> bool {
    return !Get(name).IsNull();
  }

  [[nodiscard]] auto Text(std::string_view name) const -> std::string_view;

  [[nodiscard]] auto RangeOf(std::string_view name) const -> Range;

 private:
  const CompiledQuery* query_;
  const SyntaxTree* tree_;
  uint32_t pattern_index_;
  std::vector<std::pair<uint32_t, Node>> captures_;
};

}  // namespace ecolog::syntax
