#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_set>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace ecolog {

// Zero-based line and UTF-16 column
struct Position {
  uint32_t line = 0;
  uint32_t character = 0;

  friend auto operator==(const Position&, const Position&) -> bool = default;
  friend auto operator<=>(const Position&, const Position&) = default;
};

// Half-open interval [start, end)
struct Range {
  Position start;
  Position end;

  friend auto operator==(const Range&, const Range&) -> bool = default;
};

// Lines dominate the size metric so that any multi-line range sorts after
// every single-line range.
inline constexpr uint64_t kRangeSizeLineWeight = 10000;

[[nodiscard]] auto ContainsPosition(const Range& range, const Position& pos)
    -> bool;

// True when `inner` lies completely inside `outer` (boundaries inclusive)
[[nodiscard]] auto RangeContainsRange(const Range& outer, const Range& inner)
    -> bool;

// Touching ranges (a.end == b.start) do not overlap
[[nodiscard]] auto RangesOverlap(const Range& a, const Range& b) -> bool;

[[nodiscard]] auto RangeSize(const Range& range) -> uint64_t;

// Orders by size, then by start position
[[nodiscard]] auto IsSmallerRange(const Range& a, const Range& b) -> bool;

struct RangeHash {
  auto operator()(const Range& range) const noexcept -> std::size_t {
    std::size_t seed = 0;
    for (uint32_t v :
         {range.start.line, range.start.character, range.end.line,
          range.end.character}) {
      seed ^= std::hash<uint32_t>{}(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};

// Insert-once set of ranges; Insert returns false for a repeated range
class RangeDeduplicator {
 public:
  auto Insert(const Range& range) -> bool {
    return seen_.insert(range).second;
  }

  [[nodiscard]] auto Contains(const Range& range) const -> bool {
    return seen_.contains(range);
  }

  [[nodiscard]] auto Size() const -> std::size_t {
    return seen_.size();
  }

 private:
  std::unordered_set<Range, RangeHash> seen_;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);
void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

}  // namespace ecolog

template <>
struct fmt::formatter<ecolog::Position> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const ecolog::Position& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(
        fmt::format("{}:{}", p.line, p.character), ctx);
  }
};

template <>
struct fmt::formatter<ecolog::Range> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const ecolog::Range& r, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(
        fmt::format(
            "[{}:{}-{}:{})", r.start.line, r.start.character, r.end.line,
            r.end.character),
        ctx);
  }
};
