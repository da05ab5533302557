#include "ecolog/semantic/binding_graph.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using ecolog::kMaxChainDepth;
using ecolog::Position;
using ecolog::Range;
using ecolog::ScopeKind;
using ecolog::semantic::Binding;
using ecolog::semantic::BindingGraph;
using ecolog::semantic::BindingId;
using ecolog::semantic::BindingKind;
using ecolog::semantic::kRootScope;
using ecolog::semantic::ResolvedEnv;
using ecolog::semantic::ScopeId;

namespace {

auto LineRange(uint32_t line, uint32_t start, uint32_t end) -> Range {
  return Range{
      .start = {.line = line, .character = start},
      .end = {.line = line, .character = end}};
}

auto DirectBinding(std::string name, std::string env, uint32_t line,
                   ScopeId scope = kRootScope) -> Binding {
  return Binding{
      .name = std::move(name),
      .declaration_range = LineRange(line, 0, 30),
      .name_range = LineRange(line, 6, 10),
      .scope = scope,
      .kind = BindingKind::kDirectEnvAccess,
      .env_name = std::move(env)};
}

auto ObjectAlias(std::string name, uint32_t line) -> Binding {
  return Binding{
      .name = std::move(name),
      .declaration_range = LineRange(line, 0, 30),
      .name_range = LineRange(line, 6, 9),
      .kind = BindingKind::kObjectAlias,
      .env_name = "process.env"};
}

// Adds `length` reassignment links in front of `base`; returns the last
auto BuildChain(BindingGraph& graph, BindingId base, std::size_t length)
    -> BindingId {
  BindingId current = base;
  for (std::size_t i = 0; i < length; ++i) {
    auto line = static_cast<uint32_t>(i + 1);
    auto next = graph.AddBinding(Binding{
        .name = "alias" + std::to_string(i),
        .declaration_range = LineRange(line, 0, 20),
        .name_range = LineRange(line, 6, 12),
        .kind = BindingKind::kReassignment});
    graph.Link(next, current);
    current = next;
  }
  return current;
}

}  // namespace

TEST_CASE("Direct bindings resolve in zero hops", "[binding_graph]") {
  BindingGraph graph;
  auto id = graph.AddBinding(DirectBinding("port", "PORT", 0));

  auto resolved = graph.ResolveToEnv(id);
  REQUIRE(resolved.has_value());
  CHECK(resolved->kind == ResolvedEnv::Kind::kVariable);
  CHECK(resolved->name == "PORT");
  CHECK(resolved->hops == 0);
  CHECK_FALSE(graph.ResolvesToEnvObject(id));
}

TEST_CASE("Object aliases resolve to the env object", "[binding_graph]") {
  BindingGraph graph;
  auto env = graph.AddBinding(ObjectAlias("env", 0));
  auto copy = BuildChain(graph, env, 2);

  auto resolved = graph.ResolveToEnv(copy);
  REQUIRE(resolved.has_value());
  CHECK(resolved->kind == ResolvedEnv::Kind::kObject);
  CHECK(resolved->name == "process.env");
  CHECK(resolved->hops == 2);
  CHECK(graph.ResolvesToEnvObject(copy));
}

TEST_CASE("Chains resolve up to the hop limit", "[binding_graph]") {
  BindingGraph graph;
  auto base = graph.AddBinding(DirectBinding("secret", "API_KEY", 0));

  SECTION("exactly at the limit") {
    auto tip = BuildChain(graph, base, kMaxChainDepth);
    auto resolved = graph.ResolveToEnv(tip);
    REQUIRE(resolved.has_value());
    CHECK(resolved->name == "API_KEY");
    CHECK(resolved->hops == kMaxChainDepth);
  }

  SECTION("one past the limit") {
    auto tip = BuildChain(graph, base, kMaxChainDepth + 1);
    CHECK_FALSE(graph.ResolveToEnv(tip).has_value());
    // A larger budget reaches the base again
    CHECK(graph.ResolveToEnv(tip, kMaxChainDepth + 1).has_value());
  }
}

TEST_CASE("Destructuring an alias names one variable", "[binding_graph]") {
  BindingGraph graph;
  auto env = graph.AddBinding(ObjectAlias("env", 0));
  auto key = graph.AddBinding(Binding{
      .name = "key",
      .name_range = LineRange(1, 17, 20),
      .kind = BindingKind::kDestructured,
      .env_name = "API_KEY",
      .key_range = LineRange(1, 8, 15)});
  graph.Link(key, env);

  auto resolved = graph.ResolveToEnv(key);
  REQUIRE(resolved.has_value());
  CHECK(resolved->kind == ResolvedEnv::Kind::kVariable);
  CHECK(resolved->name == "API_KEY");
  CHECK(resolved->hops == 1);

  // The key token finds the binding too
  CHECK(graph.BindingAt(Position{.line = 1, .character = 9}) == key);

  // Destructuring a variable's value is not an env read
  auto port = graph.AddBinding(DirectBinding("port", "PORT", 2));
  auto nested = graph.AddBinding(Binding{
      .name = "inner",
      .name_range = LineRange(3, 8, 13),
      .kind = BindingKind::kDestructured,
      .env_name = "length"});
  graph.Link(nested, port);
  CHECK_FALSE(graph.ResolveToEnv(nested).has_value());
}

TEST_CASE("Cycles stop at the hop limit", "[binding_graph]") {
  BindingGraph graph;
  auto a = graph.AddBinding(Binding{
      .name = "a", .name_range = LineRange(0, 4, 5),
      .kind = BindingKind::kReassignment});
  auto b = graph.AddBinding(Binding{
      .name = "b", .name_range = LineRange(1, 4, 5),
      .kind = BindingKind::kReassignment});
  graph.Link(a, b);
  graph.Link(b, a);

  CHECK_FALSE(graph.ResolveToEnv(a).has_value());
  CHECK_FALSE(graph.ResolveToEnv(b).has_value());
}

TEST_CASE("Unlinked and unresolved bindings resolve to nothing", "[binding_graph]") {
  BindingGraph graph;
  auto dangling = graph.AddBinding(Binding{
      .name = "x", .kind = BindingKind::kReassignment});
  auto unresolved = graph.AddBinding(Binding{
      .name = "y", .kind = BindingKind::kUnresolved});

  CHECK_FALSE(graph.ResolveToEnv(dangling).has_value());
  CHECK_FALSE(graph.ResolveToEnv(unresolved).has_value());
  CHECK_FALSE(graph.ResolveToEnv(999).has_value());
}

TEST_CASE("Lookup walks outward through enclosing scopes", "[binding_graph]") {
  BindingGraph graph;
  graph.SetRootRange(Range{.start = {0, 0}, .end = {20, 0}});
  auto function_scope = graph.AddScope(
      ScopeKind::kFunction, Range{.start = {2, 0}, .end = {10, 1}}, kRootScope);
  auto block_scope = graph.AddScope(
      ScopeKind::kBlock, Range{.start = {4, 2}, .end = {6, 3}}, function_scope);
  auto sibling_scope = graph.AddScope(
      ScopeKind::kFunction, Range{.start = {12, 0}, .end = {15, 1}}, kRootScope);

  auto outer = graph.AddBinding(DirectBinding("value", "OUTER", 0));
  auto inner = graph.AddBinding(DirectBinding("value", "INNER", 3, function_scope));
  auto local = graph.AddBinding(DirectBinding("local", "LOCAL", 5, block_scope));

  CHECK(graph.ScopeAt(Position{.line = 5, .character = 4}) == block_scope);
  CHECK(graph.ScopeAt(Position{.line = 3, .character = 0}) == function_scope);
  CHECK(graph.ScopeAt(Position{.line = 11, .character = 0}) == kRootScope);
  CHECK(graph.ScopeAt(Position{.line = 13, .character = 0}) == sibling_scope);

  // Shadowing picks the innermost declaration
  CHECK(graph.Lookup("value", block_scope) == inner);
  CHECK(graph.Lookup("value", sibling_scope) == outer);
  CHECK(graph.Lookup("value", kRootScope) == outer);

  // Block-local names are invisible outside the block
  CHECK(graph.Lookup("local", block_scope) == local);
  CHECK_FALSE(graph.Lookup("local", function_scope).has_value());
  CHECK_FALSE(graph.LookupAt("local", Position{.line = 13, .character = 0}).has_value());

  CHECK(graph.IsScopeVisible(block_scope, kRootScope));
  CHECK(graph.IsScopeVisible(block_scope, function_scope));
  CHECK_FALSE(graph.IsScopeVisible(function_scope, block_scope));
  CHECK_FALSE(graph.IsScopeVisible(sibling_scope, function_scope));
}

TEST_CASE("Invalidated bindings disappear from lookup and resolution", "[binding_graph]") {
  BindingGraph graph;
  auto port = graph.AddBinding(DirectBinding("port", "PORT", 0));
  auto copy = BuildChain(graph, port, 1);

  REQUIRE(graph.Lookup("port", kRootScope) == port);
  graph.Invalidate(port);

  CHECK_FALSE(graph.Lookup("port", kRootScope).has_value());
  CHECK_FALSE(graph.ResolveToEnv(port).has_value());
  // Links through an invalid binding break too
  CHECK_FALSE(graph.ResolveToEnv(copy).has_value());
  CHECK(graph.EnvVarBindings().empty());
}

TEST_CASE("EnvVarBindings groups bindings by variable", "[binding_graph]") {
  BindingGraph graph;
  auto a = graph.AddBinding(DirectBinding("a", "PORT", 0));
  auto b = graph.AddBinding(DirectBinding("b", "PORT", 1));
  auto c = graph.AddBinding(DirectBinding("c", "HOST", 2));
  graph.AddBinding(ObjectAlias("env", 3));

  auto index = graph.EnvVarBindings();
  REQUIRE(index.size() == 2);
  CHECK(index["PORT"] == std::vector<BindingId>{a, b});
  CHECK(index["HOST"] == std::vector<BindingId>{c});
}
