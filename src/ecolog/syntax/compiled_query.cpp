#include "ecolog/syntax/compiled_query.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace ecolog::syntax {

namespace {

auto QueryErrorName(TSQueryError error) -> std::string_view {
  switch (error) {
    case TSQueryErrorSyntax:
      return "syntax";
    case TSQueryErrorNodeType:
      return "node type";
    case TSQueryErrorField:
      return "field";
    case TSQueryErrorCapture:
      return "capture";
    case TSQueryErrorStructure:
      return "structure";
    case TSQueryErrorLanguage:
      return "language";
    default:
      return "unknown";
  }
}

auto StringValue(const TSQuery* query, uint32_t id) -> std::string {
  uint32_t length = 0;
  const char* value = ts_query_string_value_for_id(query, id, &length);
  return {value, length};
}

auto ParsePredicate(
    const TSQuery* query, const TSQueryPredicateStep* steps, uint32_t count)
    -> std::expected<TextPredicate, std::string> {
  if (count < 2 || steps[0].type != TSQueryPredicateStepTypeString) {
    return std::unexpected("malformed predicate");
  }
  auto name = StringValue(query, steps[0].value_id);
  if (steps[1].type != TSQueryPredicateStepTypeCapture) {
    return std::unexpected(fmt::format("#{} expects a capture", name));
  }

  TextPredicate predicate;
  predicate.capture = steps[1].value_id;

  if (name == "eq?" || name == "not-eq?") {
    predicate.op = name == "eq?" ? TextPredicate::Op::kEq
                                 : TextPredicate::Op::kNotEq;
    if (count != 3) {
      return std::unexpected(fmt::format("#{} takes two arguments", name));
    }
    if (steps[2].type == TSQueryPredicateStepTypeCapture) {
      predicate.other_capture = steps[2].value_id;
    } else {
      predicate.values.push_back(StringValue(query, steps[2].value_id));
    }
    return predicate;
  }

  if (name == "match?" || name == "not-match?") {
    predicate.op = name == "match?" ? TextPredicate::Op::kMatch
                                    : TextPredicate::Op::kNotMatch;
    if (count != 3 || steps[2].type != TSQueryPredicateStepTypeString) {
      return std::unexpected(fmt::format("#{} takes a capture and a regex", name));
    }
    try {
      predicate.pattern.emplace(StringValue(query, steps[2].value_id));
    } catch (const std::regex_error& e) {
      return std::unexpected(fmt::format("invalid regex: {}", e.what()));
    }
    return predicate;
  }

  if (name == "any-of?") {
    predicate.op = TextPredicate::Op::kAnyOf;
    for (uint32_t i = 2; i < count; ++i) {
      if (steps[i].type != TSQueryPredicateStepTypeString) {
        return std::unexpected("#any-of? takes string values");
      }
      predicate.values.push_back(StringValue(query, steps[i].value_id));
    }
    return predicate;
  }

  return std::unexpected(fmt::format("unsupported predicate #{}", name));
}

}  // namespace

auto CompiledQuery::Compile(const TSLanguage* language, std::string_view source)
    -> std::expected<CompiledQuery, EcologError> {
  uint32_t error_offset = 0;
  TSQueryError error_type = TSQueryErrorNone;
  TSQuery* raw = ts_query_new(
      language, source.data(), static_cast<uint32_t>(source.size()),
      &error_offset, &error_type);
  if (raw == nullptr) {
    auto excerpt = source.substr(
        std::min<std::size_t>(error_offset, source.size()), 40);
    return EcologError::Unexpected(
        EcologErrorCode::QueryCompileFailed,
        fmt::format(
            "{} error at offset {} near '{}'", QueryErrorName(error_type),
            error_offset, excerpt));
  }

  CompiledQuery compiled;
  compiled.query_.reset(raw);

  auto capture_count = ts_query_capture_count(raw);
  for (uint32_t id = 0; id < capture_count; ++id) {
    uint32_t length = 0;
    const char* name = ts_query_capture_name_for_id(raw, id, &length);
    compiled.capture_ids_.emplace(std::string(name, length), id);
  }

  auto pattern_count = ts_query_pattern_count(raw);
  compiled.predicates_.resize(pattern_count);
  for (uint32_t pattern = 0; pattern < pattern_count; ++pattern) {
    uint32_t step_count = 0;
    const TSQueryPredicateStep* steps =
        ts_query_predicates_for_pattern(raw, pattern, &step_count);

    uint32_t begin = 0;
    for (uint32_t i = 0; i < step_count; ++i) {
      if (steps[i].type != TSQueryPredicateStepTypeDone) {
        continue;
      }
      auto predicate = ParsePredicate(raw, steps + begin, i - begin);
      if (!predicate) {
        return EcologError::Unexpected(
            EcologErrorCode::QueryCompileFailed,
            fmt::format("pattern {}: {}", pattern, predicate.error()));
      }
      compiled.predicates_[pattern].push_back(std::move(*predicate));
      begin = i + 1;
    }
  }

  return compiled;
}

auto CompiledQuery::CaptureId(std::string_view name) const
    -> std::optional<uint32_t> {
  auto it = capture_ids_.find(std::string(name));
  if (it == capture_ids_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto CompiledQuery::CaptureName(uint32_t id) const -> std::string_view {
  uint32_t length = 0;
  const char* name = ts_query_capture_name_for_id(query_.get(), id, &length);
  return {name, length};
}

auto CompiledQuery::Satisfies(
    const TSQueryMatch& match, const SyntaxTree& tree) const -> bool {
  if (match.pattern_index >= predicates_.size()) {
    return true;
  }

  auto first_text = [&](uint32_t capture) -> std::optional<std::string_view> {
    for (uint16_t i = 0; i < match.capture_count; ++i) {
      if (match.captures[i].index == capture) {
        return tree.Text(Node(match.captures[i].node));
      }
    }
    return std::nullopt;
  };

  for (const auto& predicate : predicates_[match.pattern_index]) {
    auto text = first_text(predicate.capture);
    if (!text) {
      continue;  // optional capture absent
    }

    bool holds = true;
    switch (predicate.op) {
      case TextPredicate::Op::kEq:
      case TextPredicate::Op::kNotEq: {
        bool equal = false;
        if (predicate.other_capture) {
          auto other = first_text(*predicate.other_capture);
          equal = other && *other == *text;
        } else {
          equal = *text == predicate.values.front();
        }
        holds = (predicate.op == TextPredicate::Op::kEq) == equal;
        break;
      }
      case TextPredicate::Op::kMatch:
      case TextPredicate::Op::kNotMatch: {
        bool found = std::regex_search(
            text->begin(), text->end(), *predicate.pattern);
        holds = (predicate.op == TextPredicate::Op::kMatch) == found;
        break;
      }
      case TextPredicate::Op::kAnyOf:
        holds = std::ranges::find(predicate.values, *text) !=
                predicate.values.end();
        break;
    }
    if (!holds) {
      return false;
    }
  }
  return true;
}

QueryMatch::QueryMatch(
    const CompiledQuery& query, const TSQueryMatch& match,
    const SyntaxTree& tree)
    : query_(&query), tree_(&tree), pattern_index_(match.pattern_index) {
  captures_.reserve(match.capture_count);
  for (uint16_t i = 0; i < match.capture_count; ++i) {
    captures_.emplace_back(
        match.captures[i].index, Node(match.captures[i].node));
  }
}

auto QueryMatch::Get(std::string_view name) const -> Node {
  auto id = query_->CaptureId(name);
  if (!id) {
    return {};
  }
  for (const auto& [capture, node] : captures_) {
    if (capture == *id) {
      return node;
    }
  }
  return {};
}

auto QueryMatch::Text(std::string_view name) const -> std::string_view {
  auto node = Get(name);
  return node.IsNull() ? std::string_view() : tree_->Text(node);
}

auto QueryMatch::RangeOf(std::string_view name) const -> Range {
  auto node = Get(name);
  return node.IsNull() ? Range{} : tree_->RangeOf(node);
}

}  // namespace ecolog::syntax
