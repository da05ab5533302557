#include "ecolog/core/range.hpp"

#include <tuple>

namespace ecolog {

auto ContainsPosition(const Range& range, const Position& pos) -> bool {
  if (pos.line < range.start.line || pos.line > range.end.line) {
    return false;
  }
  if (pos.line == range.start.line && pos.character < range.start.character) {
    return false;
  }
  if (pos.line == range.end.line && pos.character >= range.end.character) {
    return false;
  }
  return true;
}

auto RangeContainsRange(const Range& outer, const Range& inner) -> bool {
  return outer.start <= inner.start && inner.end <= outer.end;
}

auto RangesOverlap(const Range& a, const Range& b) -> bool {
  return a.start < b.end && b.start < a.end;
}

auto RangeSize(const Range& range) -> uint64_t {
  if (range.start.line == range.end.line) {
    return range.end.character - range.start.character;
  }
  auto lines = static_cast<uint64_t>(range.end.line - range.start.line);
  return lines * kRangeSizeLineWeight + range.end.character;
}

auto IsSmallerRange(const Range& a, const Range& b) -> bool {
  return std::tuple(RangeSize(a), a.start) < std::tuple(RangeSize(b), b.start);
}

void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

}  // namespace ecolog
