#include "ecolog/core/range.hpp"

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using ecolog::Position;
using ecolog::Range;

namespace {

auto MakeRange(uint32_t sl, uint32_t sc, uint32_t el, uint32_t ec) -> Range {
  return Range{.start = {.line = sl, .character = sc},
               .end = {.line = el, .character = ec}};
}

}  // namespace

TEST_CASE("ContainsPosition on a single line", "[range]") {
  auto range = MakeRange(2, 4, 2, 10);

  CHECK(ecolog::ContainsPosition(range, {2, 4}));
  CHECK(ecolog::ContainsPosition(range, {2, 9}));
  // End is exclusive
  CHECK_FALSE(ecolog::ContainsPosition(range, {2, 10}));
  CHECK_FALSE(ecolog::ContainsPosition(range, {2, 3}));
  CHECK_FALSE(ecolog::ContainsPosition(range, {1, 5}));
  CHECK_FALSE(ecolog::ContainsPosition(range, {3, 5}));
}

TEST_CASE("ContainsPosition across lines", "[range]") {
  auto range = MakeRange(1, 8, 3, 2);

  CHECK(ecolog::ContainsPosition(range, {1, 8}));
  CHECK(ecolog::ContainsPosition(range, {1, 200}));
  // Interior lines accept any column
  CHECK(ecolog::ContainsPosition(range, {2, 0}));
  CHECK(ecolog::ContainsPosition(range, {2, 999}));
  CHECK(ecolog::ContainsPosition(range, {3, 1}));
  CHECK_FALSE(ecolog::ContainsPosition(range, {3, 2}));
  CHECK_FALSE(ecolog::ContainsPosition(range, {1, 7}));
}

TEST_CASE("RangesOverlap is symmetric", "[range]") {
  auto a = MakeRange(0, 0, 0, 10);
  auto b = MakeRange(0, 5, 0, 15);
  auto c = MakeRange(1, 0, 1, 3);

  CHECK(ecolog::RangesOverlap(a, b));
  CHECK(ecolog::RangesOverlap(b, a));
  CHECK_FALSE(ecolog::RangesOverlap(a, c));
  CHECK_FALSE(ecolog::RangesOverlap(c, a));
}

TEST_CASE("Touching ranges do not overlap", "[range]") {
  auto a = MakeRange(0, 0, 0, 5);
  auto b = MakeRange(0, 5, 0, 9);

  CHECK_FALSE(ecolog::RangesOverlap(a, b));
  CHECK_FALSE(ecolog::RangesOverlap(b, a));
}

TEST_CASE("RangeContainsRange is inclusive at both ends", "[range]") {
  auto outer = MakeRange(0, 0, 5, 0);

  CHECK(ecolog::RangeContainsRange(outer, outer));
  CHECK(ecolog::RangeContainsRange(outer, MakeRange(1, 2, 3, 4)));
  CHECK_FALSE(ecolog::RangeContainsRange(outer, MakeRange(4, 0, 5, 1)));
}

TEST_CASE("Multi-line ranges sort after single-line ranges", "[range]") {
  auto wide_line = MakeRange(0, 0, 0, 9000);
  auto two_lines = MakeRange(0, 0, 1, 0);

  CHECK(ecolog::RangeSize(two_lines) == ecolog::kRangeSizeLineWeight);
  CHECK(ecolog::IsSmallerRange(wide_line, two_lines));
  CHECK_FALSE(ecolog::IsSmallerRange(two_lines, wide_line));
}

TEST_CASE("IsSmallerRange breaks size ties by start", "[range]") {
  auto first = MakeRange(0, 1, 0, 4);
  auto second = MakeRange(2, 1, 2, 4);

  CHECK(ecolog::IsSmallerRange(first, second));
  CHECK_FALSE(ecolog::IsSmallerRange(second, first));
  CHECK_FALSE(ecolog::IsSmallerRange(first, first));
}

TEST_CASE("RangeDeduplicator counts a repeated range once", "[range]") {
  ecolog::RangeDeduplicator seen;
  auto range = MakeRange(3, 1, 3, 7);

  CHECK(seen.Insert(range));
  CHECK_FALSE(seen.Insert(range));
  CHECK(seen.Size() == 1);
  CHECK(seen.Insert(MakeRange(3, 1, 3, 8)));
  CHECK(seen.Size() == 2);
}

TEST_CASE("Ranges serialize as LSP JSON", "[range]") {
  nlohmann::json j = MakeRange(1, 2, 3, 4);

  CHECK(j["start"]["line"] == 1);
  CHECK(j["start"]["character"] == 2);
  CHECK(j["end"]["line"] == 3);
  CHECK(j["end"]["character"] == 4);
  CHECK(j.get<Range>() == MakeRange(1, 2, 3, 4));
}

TEST_CASE("Ranges format with fmt", "[range]") {
  CHECK(fmt::format("{}", Position{.line = 4, .character = 2}) == "4:2");
  CHECK(fmt::format("{}", MakeRange(0, 1, 0, 2)) == "[0:1-0:2)");
}
