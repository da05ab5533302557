#include "ecolog/core/config_file.hpp"

#include <chrono>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/ecolog/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using ecolog::EcologConfigFile;
using ecolog::test::FileTestFixture;
using std::chrono::milliseconds;

TEST_CASE("EcologConfigFile defaults", "[config]") {
  auto config = EcologConfigFile::CreateDefault();

  CHECK(config.GetFeatures().hover);
  CHECK(config.GetFeatures().completion);
  CHECK(config.GetFeatures().diagnostics);
  CHECK(config.GetFeatures().definition);
  CHECK(config.GetStrict().hover);
  CHECK(config.GetDebounceDelay() == milliseconds(300));
  CHECK(config.GetLookupTimeout() == milliseconds(5000));
  CHECK(config.GetRefreshTimeout() == milliseconds(10000));
  CHECK(config.GetExcludePatterns().empty());
  CHECK(config.ShouldIncludeFile("src/app.ts"));
}

TEST_CASE("EcologConfigFile loads every section", "[config]") {
  FileTestFixture fixture("ecolog_config_full");
  auto path = fixture.CreateFile(".ecolog", R"(
Features:
  Hover: false
  Diagnostics: false
Strict:
  Completion: false
Analysis:
  DebounceMs: 50
Workspace:
  Exclude:
    - .*/dist/.*
    - generated/.*
Provider:
  LookupTimeoutMs: 250
  RefreshTimeoutMs: 750
)");

  auto config = EcologConfigFile::LoadFromFile(path);
  REQUIRE(config.has_value());

  CHECK_FALSE(config->GetFeatures().hover);
  CHECK(config->GetFeatures().completion);
  CHECK_FALSE(config->GetFeatures().diagnostics);
  CHECK(config->GetStrict().hover);
  CHECK_FALSE(config->GetStrict().completion);
  CHECK(config->GetDebounceDelay() == milliseconds(50));
  CHECK(config->GetLookupTimeout() == milliseconds(250));
  CHECK(config->GetRefreshTimeout() == milliseconds(750));
  REQUIRE(config->GetExcludePatterns().size() == 2);
}

TEST_CASE("EcologConfigFile exclude patterns match whole paths", "[config]") {
  FileTestFixture fixture("ecolog_config_exclude");
  auto path = fixture.CreateFile(".ecolog", R"(
Workspace:
  Exclude: .*/dist/.*
)");

  auto config = EcologConfigFile::LoadFromFile(path);
  REQUIRE(config.has_value());

  CHECK_FALSE(config->ShouldIncludeFile("packages/web/dist/bundle.js"));
  CHECK(config->ShouldIncludeFile("packages/web/src/index.ts"));
  // Partial matches do not exclude
  CHECK(config->ShouldIncludeFile("distribution/config.ts"));
}

TEST_CASE("EcologConfigFile ignores an invalid exclude regex", "[config]") {
  FileTestFixture fixture("ecolog_config_bad_regex");
  auto path = fixture.CreateFile(".ecolog", R"(
Workspace:
  Exclude: ["([unclosed"]
)");

  auto config = EcologConfigFile::LoadFromFile(path);
  REQUIRE(config.has_value());
  CHECK(config->ShouldIncludeFile("src/app.ts"));
}

TEST_CASE("EcologConfigFile missing file yields nullopt", "[config]") {
  FileTestFixture fixture("ecolog_config_missing");
  auto config =
      EcologConfigFile::LoadFromFile(fixture.GetTempDir() / ".ecolog");
  CHECK_FALSE(config.has_value());
}

TEST_CASE("EcologConfigFile malformed file falls back to defaults", "[config]") {
  FileTestFixture fixture("ecolog_config_malformed");
  fixture.CreateFile(".ecolog", "Analysis: [DebounceMs: {\n");

  CHECK_FALSE(
      EcologConfigFile::LoadFromFile(fixture.GetTempDir() / ".ecolog")
          .has_value());

  auto config = EcologConfigFile::LoadForWorkspace(fixture.GetTempDir());
  CHECK(config.GetDebounceDelay() == milliseconds(300));
}

TEST_CASE("EcologConfigFile rejects negative durations", "[config]") {
  FileTestFixture fixture("ecolog_config_negative");
  auto path = fixture.CreateFile(".ecolog", R"(
Analysis:
  DebounceMs: -5
)");

  CHECK_FALSE(EcologConfigFile::LoadFromFile(path).has_value());
}

TEST_CASE("EcologConfigFile LoadForWorkspace reads the root file", "[config]") {
  FileTestFixture fixture("ecolog_config_workspace");
  fixture.CreateFile(".ecolog", "Analysis:\n  DebounceMs: 10\n");

  auto config = EcologConfigFile::LoadForWorkspace(fixture.GetTempDir());
  CHECK(config.GetDebounceDelay() == milliseconds(10));
}
