#include "ecolog/core/module_resolver.hpp"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/ecolog/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using ecolog::CanonicalPath;
using ecolog::ModuleResolver;
using ecolog::test::FileTestFixture;

namespace {

const std::vector<std::string> kScriptExtensions = {".ts", ".tsx", ".js"};

}  // namespace

TEST_CASE("ModuleResolver only resolves relative specifiers", "[module_resolver]") {
  CHECK(ModuleResolver::IsRelativeSpecifier("./config"));
  CHECK(ModuleResolver::IsRelativeSpecifier("../shared/env"));
  CHECK_FALSE(ModuleResolver::IsRelativeSpecifier("dotenv"));
  CHECK_FALSE(ModuleResolver::IsRelativeSpecifier("/abs/path"));
  CHECK_FALSE(ModuleResolver::IsRelativeSpecifier(".hidden"));

  FileTestFixture fixture("ecolog_resolver_package");
  auto importer = fixture.CreateFile("app.ts", "");
  fixture.CreateFile("dotenv.ts", "");
  ModuleResolver resolver(fixture.GetTempDir());

  CHECK_FALSE(resolver.Resolve("dotenv", importer, kScriptExtensions));
}

TEST_CASE("ModuleResolver tries exact, suffixed, then index files", "[module_resolver]") {
  FileTestFixture fixture("ecolog_resolver_order");
  auto importer = fixture.CreateFile("src/app.ts", "");
  auto exact = fixture.CreateFile("src/data.json.ts", "");
  auto suffixed = fixture.CreateFile("src/config.ts", "");
  auto index = fixture.CreateFile("src/settings/index.js", "");
  ModuleResolver resolver(fixture.GetTempDir());

  SECTION("Exact file") {
    auto resolved = resolver.Resolve("./data.json.ts", importer, kScriptExtensions);
    REQUIRE(resolved);
    CHECK(*resolved == exact);
  }

  SECTION("Suffix appended, not replaced") {
    auto resolved = resolver.Resolve("./data.json", importer, kScriptExtensions);
    REQUIRE(resolved);
    CHECK(*resolved == exact);
  }

  SECTION("Language suffix") {
    auto resolved = resolver.Resolve("./config", importer, kScriptExtensions);
    REQUIRE(resolved);
    CHECK(*resolved == suffixed);
  }

  SECTION("Directory index") {
    auto resolved = resolver.Resolve("./settings", importer, kScriptExtensions);
    REQUIRE(resolved);
    CHECK(*resolved == index);
  }

  SECTION("Missing module") {
    CHECK_FALSE(resolver.Resolve("./missing", importer, kScriptExtensions));
  }
}

TEST_CASE("ModuleResolver normalizes parent segments", "[module_resolver]") {
  FileTestFixture fixture("ecolog_resolver_parent");
  auto importer = fixture.CreateFile("packages/web/src/app.ts", "");
  auto shared = fixture.CreateFile("packages/shared/env.ts", "");
  ModuleResolver resolver(fixture.GetTempDir());

  auto resolved =
      resolver.Resolve("../../shared/./env", importer, kScriptExtensions);
  REQUIRE(resolved);
  CHECK(*resolved == shared);
}

TEST_CASE("ModuleResolver rejects paths escaping the workspace", "[module_resolver]") {
  FileTestFixture outer("ecolog_resolver_escape");
  outer.CreateFile("secret.ts", "");
  auto workspace = outer.CreateDirectory("workspace");
  auto importer = outer.CreateFile("workspace/app.ts", "");
  ModuleResolver resolver(workspace);

  CHECK_FALSE(resolver.Resolve("../secret", importer, kScriptExtensions));
}

TEST_CASE("ModuleResolver caches until invalidated", "[module_resolver]") {
  FileTestFixture fixture("ecolog_resolver_cache");
  auto importer = fixture.CreateFile("app.ts", "");
  ModuleResolver resolver(fixture.GetTempDir());

  CHECK_FALSE(resolver.Resolve("./late", importer, kScriptExtensions));
  CHECK(resolver.CacheSize() == 1);

  auto late = fixture.CreateFile("late.ts", "");
  // Misses are cached too
  CHECK_FALSE(resolver.Resolve("./late", importer, kScriptExtensions));

  resolver.Invalidate();
  CHECK(resolver.CacheSize() == 0);
  auto resolved = resolver.Resolve("./late", importer, kScriptExtensions);
  REQUIRE(resolved);
  CHECK(*resolved == late);
}
