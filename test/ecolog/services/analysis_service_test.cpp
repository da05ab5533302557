#include "ecolog/services/analysis_service.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>

#include <asio.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/ecolog/common/analysis_fixture.hpp"
#include "test/ecolog/common/async_fixture.hpp"
#include "test/ecolog/common/file_fixture.hpp"
#include "test/ecolog/common/fixture_value_provider.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using ecolog::CanonicalPath;
using ecolog::EcologConfigFile;
using ecolog::ExportEnvObject;
using ecolog::ExportEnvVar;
using ecolog::SourceKind;
using ecolog::features::DiagnosticSeverity;
using ecolog::services::AnalysisService;
using ecolog::test::AnalysisFixture;
using ecolog::test::FileTestFixture;
using ecolog::test::FixtureValueProvider;
using ecolog::test::RunAsyncTest;
using ecolog::test::Sleep;
using std::chrono::milliseconds;

namespace {

constexpr auto kUri = "file:///workspace/app.ts";

auto MakeService(
    asio::any_io_executor executor,
    CanonicalPath root = CanonicalPath(std::filesystem::path("/workspace")))
    -> std::unique_ptr<AnalysisService> {
  return std::make_unique<AnalysisService>(
      executor, std::move(root), nullptr,
      std::make_shared<FixtureValueProvider>(FixtureValueProvider::Standard()));
}

auto ReadDiagnosticsRepeatedly(AnalysisService& service, int times)
    -> asio::awaitable<void> {
  for (int i = 0; i < times; ++i) {
    (void)co_await service.Diagnostics(kUri);
  }
}

}  // namespace

TEST_CASE("Direct reads resolve at the variable name", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = MakeService(executor);
    const std::string code = "const a = process.env.DB_URL;\n";
    co_await service->Open(kUri, "typescript", 1, code);

    auto resolution =
        service->Resolve(kUri, AnalysisFixture::FindPosition(code, "DB_URL"));
    REQUIRE(resolution.has_value());
    CHECK(resolution->canonical_name == "DB_URL");
    CHECK(resolution->source == SourceKind::kDirectReference);

    // Outside any reference
    CHECK_FALSE(service->Resolve(kUri, {.line = 0, .character = 0}).has_value());
    CHECK_FALSE(
        service->Resolve("file:///workspace/closed.ts", {}).has_value());
  });
}

TEST_CASE("Property reads through an alias resolve", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = MakeService(executor);
    const std::string code = "const env = process.env;\nconst x = env.PORT;\n";
    co_await service->Open(kUri, "typescript", 1, code);

    auto resolution =
        service->Resolve(kUri, AnalysisFixture::FindPosition(code, "PORT"));
    REQUIRE(resolution.has_value());
    CHECK(resolution->canonical_name == "PORT");
    CHECK(resolution->source == SourceKind::kEnvObjectAlias);
    CHECK(resolution->via == "env");
  });
}

TEST_CASE("Destructured names resolve at their usages", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = MakeService(executor);
    const std::string code = "const { API_KEY: key } = process.env;\nkey;\n";
    co_await service->Open(kUri, "typescript", 1, code);

    auto resolution =
        service->Resolve(kUri, AnalysisFixture::FindPosition(code, "key", 1));
    REQUIRE(resolution.has_value());
    CHECK(resolution->canonical_name == "API_KEY");
    CHECK(resolution->source == SourceKind::kLocalUsage);
  });
}

TEST_CASE("Imported env objects resolve across modules", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture("ecolog_service_cross_module");
    fixture.CreateFile("a.ts", "export const e = process.env;\n");
    fixture.CreateFile("c.ts", "export const port = process.env.PORT;\n");
    const std::string code =
        "import { e } from './a';\nimport { port } from './c';\ne.DEBUG;\nport;\n";
    auto b = fixture.CreateFile("b.ts", code);

    auto service = MakeService(executor, fixture.GetTempDir());
    auto indexed = co_await service->IndexWorkspace(EcologConfigFile::CreateDefault());
    REQUIRE(indexed.has_value());
    CHECK(service->IndexStatistics().file_count == 3);

    auto uri = b.ToUri();
    co_await service->Open(uri, "typescript", 1, code);

    auto debug =
        service->Resolve(uri, AnalysisFixture::FindPosition(code, "DEBUG"));
    REQUIRE(debug.has_value());
    CHECK(debug->canonical_name == "DEBUG");
    CHECK(debug->source == SourceKind::kCrossModuleImport);
    CHECK(debug->via == "e");

    auto port =
        service->Resolve(uri, AnalysisFixture::FindPosition(code, "port;\n"));
    REQUIRE(port.has_value());
    CHECK(port->canonical_name == "PORT");
    CHECK(port->source == SourceKind::kCrossModuleImport);

    auto a_uri = (fixture.GetTempDir() / "a.ts").ToUri();
    auto exports = service->ExportsOf(a_uri);
    REQUIRE(exports.has_value());
    const auto* e = exports->Find("e");
    REQUIRE(e != nullptr);
    CHECK(std::get<ExportEnvObject>(e->resolution).canonical_name == "process.env");

    CHECK(service->ResolveModuleSpecifier("./a", uri, "typescript") == a_uri);
    CHECK_FALSE(service->ResolveModuleSpecifier("./missing", uri, "typescript"));
    CHECK_FALSE(service->ResolveModuleSpecifier("lodash", uri, "typescript"));
  });
}

TEST_CASE("Undefined variables produce diagnostics", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = MakeService(executor);
    const std::string code = "const a = process.env.NOT_SET;\nconst b = process.env.PORT;\n";
    co_await service->Open(kUri, "typescript", 1, code);

    auto resolution =
        service->Resolve(kUri, AnalysisFixture::FindPosition(code, "NOT_SET"));
    REQUIRE(resolution.has_value());
    CHECK(resolution->canonical_name == "NOT_SET");

    auto diagnostics = co_await service->Diagnostics(kUri);
    REQUIRE_FALSE(diagnostics.empty());
    for (const auto& diagnostic : diagnostics) {
      CHECK(diagnostic.message.find("NOT_SET") != std::string::npos);
      CHECK(diagnostic.severity == DiagnosticSeverity::kWarning);
    }

    CHECK((co_await service->Diagnostics("file:///workspace/closed.ts")).empty());
  });
}

TEST_CASE("Diagnostics follow configuration and provider presence", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture("ecolog_service_config");
    auto config_path =
        fixture.CreateFile(".ecolog", "Features:\n  Diagnostics: false\n");
    auto config = EcologConfigFile::LoadFromFile(config_path);
    REQUIRE(config.has_value());

    const std::string code = "process.env.NOT_SET;\n";

    auto service = MakeService(executor);
    co_await service->Open(kUri, "typescript", 1, code);
    REQUIRE_FALSE((co_await service->Diagnostics(kUri)).empty());

    co_await service->ApplyConfig(*config);
    CHECK_FALSE(service->Config().GetFeatures().diagnostics);
    CHECK((co_await service->Diagnostics(kUri)).empty());

    // No value provider at all
    AnalysisService bare(executor, fixture.GetTempDir());
    co_await bare.Open(kUri, "typescript", 1, code);
    CHECK((co_await bare.Diagnostics(kUri)).empty());
  });
}

TEST_CASE("Config updates from another thread reach the documents", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture("ecolog_service_config_thread");
    auto slow_path = fixture.CreateFile(
        ".ecolog", "Features:\n  Diagnostics: false\nAnalysis:\n  DebounceMs: 5000\n");
    auto slow = EcologConfigFile::LoadFromFile(slow_path);
    REQUIRE(slow.has_value());

    auto service = MakeService(executor);
    co_await service->Open(kUri, "typescript", 1, "process.env.OLD;\n");

    // Apply on a foreign pool while this executor keeps reading the config
    using asio::experimental::awaitable_operators::operator&&;
    asio::thread_pool other(1);
    co_await (
        asio::co_spawn(
            other.get_executor(),
            [&service, config = *slow]() -> asio::awaitable<void> {
              co_await service->ApplyConfig(config);
            },
            asio::use_awaitable) &&
        ReadDiagnosticsRepeatedly(*service, 20));
    other.join();

    CHECK(service->Config().GetDebounceDelay() == milliseconds(5000));
    CHECK_FALSE(service->Config().GetFeatures().diagnostics);

    // The longer quiet period applies to the next change
    co_await service->Change(kUri, 2, "process.env.NEW;\n");
    co_await Sleep(executor, milliseconds(400));
    CHECK(service->Get(kUri)->version == 1);

    co_await service->Flush(kUri);
    CHECK(service->Get(kUri)->version == 2);
  });
}

TEST_CASE("Chains longer than the hop limit do not resolve", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = MakeService(executor);
    std::string code = "const a0 = process.env.DB_URL;\n";
    for (int i = 1; i <= 11; ++i) {
      code += "const a" + std::to_string(i) + " = a" + std::to_string(i - 1) + ";\n";
    }
    code += "a11;\n";
    co_await service->Open(kUri, "typescript", 1, code);

    CHECK_FALSE(
        service->Resolve(kUri, AnalysisFixture::FindPosition(code, "a11;\n"))
            .has_value());
  });
}

TEST_CASE("Open documents export without an index", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto service = MakeService(executor);
    co_await service->Open(
        kUri, "typescript", 1, "export const url = process.env.DB_URL;\n");

    auto exports = service->ExportsOf(kUri);
    REQUIRE(exports.has_value());
    const auto* url = exports->Find("url");
    REQUIRE(url != nullptr);
    CHECK(std::get<ExportEnvVar>(url->resolution).name == "DB_URL");

    CHECK_FALSE(service->ExportsOf("file:///workspace/unknown.ts").has_value());
  });
}

TEST_CASE("Background indexing and file events update the index", "[analysis_service]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    FileTestFixture fixture("ecolog_service_background");
    auto a = fixture.CreateFile("a.ts", "export const x = process.env.FIRST;\n");
    fixture.CreateFile("lib/b.ts", "export const y = process.env.OTHER;\n");

    auto service = MakeService(executor, fixture.GetTempDir());
    service->StartWorkspaceIndexing();

    for (int attempt = 0; attempt < 200; ++attempt) {
      if (service->IndexStatistics().file_count == 2) {
        break;
      }
      co_await Sleep(executor, milliseconds(10));
    }
    auto stats = service->IndexStatistics();
    CHECK(stats.file_count == 2);
    CHECK(stats.total_files == 2);
    CHECK(stats.Percentage() == 100.0);

    fixture.CreateFile("a.ts", "export const x = process.env.SECOND;\n");
    std::filesystem::last_write_time(
        a.Path(), std::filesystem::last_write_time(a.Path()) + std::chrono::seconds(2));
    REQUIRE((co_await service->OnFileChanged(a.ToUri())).has_value());

    auto exports = service->ExportsOf(a.ToUri());
    REQUIRE(exports.has_value());
    CHECK(std::get<ExportEnvVar>(exports->Find("x")->resolution).name == "SECOND");

    fixture.RemoveFile("a.ts");
    service->OnFileDeleted(a.ToUri());
    CHECK(service->IndexStatistics().file_count == 1);

    co_await service->Shutdown();
  });
}
