#include "ecolog/syntax/ts_node.hpp"

#include <algorithm>

namespace ecolog::syntax {

SyntaxTree::SyntaxTree(std::string source, TreePtr tree)
    : source_(std::move(source)), tree_(std::move(tree)), lines_(source_) {
}

auto SyntaxTree::Text(const Node& node) const -> std::string_view {
  auto start = std::min<std::size_t>(node.StartByte(), source_.size());
  auto end = std::min<std::size_t>(node.EndByte(), source_.size());
  return std::string_view(source_).substr(start, end - start);
}

auto SyntaxTree::RangeOf(const Node& node) const -> Range {
  auto start = ts_node_start_point(node.Raw());
  auto end = ts_node_end_point(node.Raw());
  return Range{
      .start = lines_.ToPosition(start.row, start.column),
      .end = lines_.ToPosition(end.row, end.column)};
}

}  // namespace ecolog::syntax
