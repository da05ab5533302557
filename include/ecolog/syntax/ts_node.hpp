#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <tree_sitter/api.h>

#include "ecolog/core/range.hpp"
#include "ecolog/utils/line_index.hpp"

namespace ecolog::syntax {

// Thin value wrapper around TSNode
class Node {
 public:
  Node() : node_{} {
  }
  explicit Node(TSNode node) : node_(node) {
  }

  [[nodiscard]] auto IsNull() const -> bool {
    return ts_node_is_null(node_);
  }
  [[nodiscard]] auto IsError() const -> bool {
    return ts_node_is_error(node_);
  }
  [[nodiscard]] auto IsMissing() const -> bool {
    return ts_node_is_missing(node_);
  }
  [[nodiscard]] auto IsNamed() const -> bool {
    return ts_node_is_named(node_);
  }
  [[nodiscard]] auto HasError() const -> bool {
    return ts_node_has_error(node_);
  }

  [[nodiscard]] auto Kind() const -> std::string_view {
    const char* type = ts_node_type(node_);
    return type != nullptr ? std::string_view(type) : std::string_view();
  }

  [[nodiscard]] auto StartByte() const -> uint32_t {
    return ts_node_start_byte(node_);
  }
  [[nodiscard]] auto EndByte() const -> uint32_t {
    return ts_node_end_byte(node_);
  }

  [[nodiscard]] auto Parent() const -> Node {
    return Node(ts_node_parent(node_));
  }
  [[nodiscard]] auto ChildCount() const -> uint32_t {
    return ts_node_child_count(node_);
  }
  [[nodiscard]] auto Child(uint32_t index) const -> Node {
    return Node(ts_node_child(node_, index));
  }
  [[nodiscard]] auto NamedChildCount() const -> uint32_t {
    return ts_node_named_child_count(node_);
  }
  [[nodiscard]] auto NamedChild(uint32_t index) const -> Node {
    return Node(ts_node_named_child(node_, index));
  }
  [[nodiscard]] auto NextNamedSibling() const -> Node {
    return Node(ts_node_next_named_sibling(node_));
  }
  [[nodiscard]] auto ChildByField(std::string_view field) const -> Node {
    return Node(ts_node_child_by_field_name(
        node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  // Smallest named descendant spanning [start, end)
  [[nodiscard]] auto NamedDescendantForBytes(uint32_t start, uint32_t end) const
      -> Node {
    return Node(ts_node_named_descendant_for_byte_range(node_, start, end));
  }

  [[nodiscard]] auto Raw() const -> TSNode {
    return node_;
  }

  friend auto operator==(const Node& lhs, const Node& rhs) -> bool {
    return ts_node_eq(lhs.node_, rhs.node_);
  }

 private:
  TSNode node_;
};

struct TreeDeleter {
  auto operator()(TSTree* tree) const -> void {
    ts_tree_delete(tree);
  }
};

using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

// A parsed document: owns the source text, the tree and the line index that
// maps tree-sitter byte columns to UTF-16 positions.
class SyntaxTree {
 public:
  SyntaxTree(std::string source, TreePtr tree);

  SyntaxTree(const SyntaxTree&) = delete;
  auto operator=(const SyntaxTree&) -> SyntaxTree& = delete;
  SyntaxTree(SyntaxTree&&) = delete;
  auto operator=(SyntaxTree&&) -> SyntaxTree& = delete;
  ~SyntaxTree() = default;

  [[nodiscard]] auto Root() const -> Node {
    return Node(ts_tree_root_node(tree_.get()));
  }

  [[nodiscard]] auto Source() const -> std::string_view {
    return source_;
  }

  [[nodiscard]] auto Lines() const -> const utils::LineIndex& {
    return lines_;
  }

  [[nodiscard]] auto Text(const Node& node) const -> std::string_view;

  [[nodiscard]] auto RangeOf(const Node& node) const -> Range;

 private:
  std::string source_;
  TreePtr tree_;
  utils::LineIndex lines_;
};

}  // namespace ecolog::syntax
