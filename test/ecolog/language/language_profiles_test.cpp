#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "ecolog/language/query_engine.hpp"
#include "ecolog/semantic/binding_resolver.hpp"
#include "test/ecolog/common/analysis_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using ecolog::semantic::BindingResolver;

namespace {

class ProfileFixture : public ecolog::test::AnalysisFixture {
 protected:
  // Sorted canonical names of every direct read in `code`
  auto DirectNames(std::string_view language_id, std::string code)
      -> std::vector<std::string> {
    auto snapshot = Analyze(language_id, std::move(code));
    std::vector<std::string> names;
    for (const auto& fact : snapshot->analysis.direct_references) {
      names.push_back(fact.name);
    }
    std::ranges::sort(names);
    return names;
  }

  auto Objects(std::string_view language_id, std::string code)
      -> std::vector<std::string> {
    auto snapshot = Analyze(language_id, std::move(code));
    std::vector<std::string> objects;
    for (const auto& fact : snapshot->analysis.direct_references) {
      objects.push_back(fact.object.value_or(""));
    }
    std::ranges::sort(objects);
    return objects;
  }

  // Completion context with the cursor right after `trigger`
  auto CompletionAfter(
      std::string_view language_id, std::string code, std::string_view trigger)
      -> std::optional<std::string> {
    auto pos = FindPosition(
        code, trigger, 0, static_cast<uint32_t>(trigger.size()));
    auto snapshot = Analyze(language_id, std::move(code));
    return BindingResolver::CompletionContextAt(
        *snapshot->language, *snapshot->tree, snapshot->analysis, pos);
  }
};

using Names = std::vector<std::string>;

}  // namespace

TEST_CASE_METHOD(ProfileFixture, "Python environ and getenv", "[language_profiles]") {
  const std::string code = R"(import os
url = os.environ["DB_URL"]
port = os.getenv("PORT", "8080")
key = os.environ.get("API_KEY")
other = settings["IGNORED"]
)";
  CHECK(DirectNames("python", code) == Names{"API_KEY", "DB_URL", "PORT"});

  auto snapshot = Analyze("python", code);
  auto port = std::ranges::find_if(
      snapshot->analysis.direct_references,
      [](const auto& fact) { return fact.name == "PORT"; });
  REQUIRE(port != snapshot->analysis.direct_references.end());
  CHECK(port->default_value == "8080");
  CHECK(port->object == "os");
}

TEST_CASE_METHOD(ProfileFixture, "Go os.Getenv and os.LookupEnv", "[language_profiles]") {
  const std::string code = R"(package main

import "os"

func main() {
	url := os.Getenv("DB_URL")
	_, ok := os.LookupEnv("PORT")
	name := strings.ToUpper("IGNORED")
}
)";
  CHECK(DirectNames("go", code) == Names{"DB_URL", "PORT"});
  CHECK(Objects("go", code) == Names{"os", "os"});
}

TEST_CASE_METHOD(ProfileFixture, "Rust std::env and env macros", "[language_profiles]") {
  const std::string code = R"(fn main() {
    let url = std::env::var("DB_URL");
    let name = env!("CARGO_PKG_NAME");
    let other = helper::var("IGNORED");
}
)";
  CHECK(DirectNames("rust", code) == Names{"CARGO_PKG_NAME", "DB_URL"});
}

TEST_CASE_METHOD(ProfileFixture, "Ruby ENV access", "[language_profiles]") {
  const std::string code = R"(url = ENV["DB_URL"]
port = ENV.fetch("PORT", "3000")
other = CONFIG["IGNORED"]
)";
  CHECK(DirectNames("ruby", code) == Names{"DB_URL", "PORT"});
}

TEST_CASE_METHOD(ProfileFixture, "PHP superglobals and getenv", "[language_profiles]") {
  const std::string code = R"(<?php
$url = $_ENV['DB_URL'];
$host = $_SERVER["HTTP_HOST"];
$port = getenv('PORT');
$other = $config['IGNORED'];
)";
  CHECK(DirectNames("php", code) == Names{"DB_URL", "HTTP_HOST", "PORT"});
}

TEST_CASE_METHOD(ProfileFixture, "Java System.getenv", "[language_profiles]") {
  const std::string code = R"(class App {
  void run() {
    String url = System.getenv("DB_URL");
    String port = System.getenv().get("PORT");
    String other = props.getenv("IGNORED");
  }
}
)";
  CHECK(DirectNames("java", code) == Names{"DB_URL", "PORT"});
}

TEST_CASE_METHOD(ProfileFixture, "C# Environment.GetEnvironmentVariable", "[language_profiles]") {
  const std::string code = R"(class App {
  void Run() {
    var url = Environment.GetEnvironmentVariable("DB_URL");
    var port = System.Environment.GetEnvironmentVariable("PORT");
  }
}
)";
  CHECK(DirectNames("csharp", code) == Names{"DB_URL", "PORT"});
}

TEST_CASE_METHOD(ProfileFixture, "C and C++ getenv", "[language_profiles]") {
  SECTION("c") {
    const std::string code = R"(#include <stdlib.h>
int main(void) {
  const char* url = getenv("DB_URL");
  puts("IGNORED");
  return 0;
}
)";
    CHECK(DirectNames("c", code) == Names{"DB_URL"});
  }

  SECTION("cpp") {
    const std::string code = R"(#include <cstdlib>
int main() {
  const char* url = std::getenv("DB_URL");
  const char* port = getenv("PORT");
  return 0;
}
)";
    CHECK(DirectNames("cpp", code) == Names{"DB_URL", "PORT"});
  }
}

TEST_CASE_METHOD(ProfileFixture, "Shell variable expansion", "[language_profiles]") {
  const std::string code = R"(#!/bin/sh
echo "$DB_URL"
echo ${PORT:-8080}
)";
  CHECK(DirectNames("shellscript", code) == Names{"DB_URL", "PORT"});

  // Shell reads carry no object
  CHECK(Objects("shellscript", code) == Names{"", ""});
}

TEST_CASE_METHOD(ProfileFixture, "Lua os.getenv", "[language_profiles]") {
  const std::string code = R"(local url = os.getenv("DB_URL")
local other = string.upper("IGNORED")
)";
  CHECK(DirectNames("lua", code) == Names{"DB_URL"});
}

TEST_CASE_METHOD(ProfileFixture, "Every language feeds the reference list", "[language_profiles]") {
  auto snapshot = Analyze("python", "import os\nurl = os.environ[\"DB_URL\"]\n");
  auto names = BindingResolver::AllEnvVars(snapshot->references);
  CHECK(names == Names{"DB_URL"});

  auto usages = BindingResolver::FindEnvVarUsages(snapshot->references, "DB_URL");
  REQUIRE_FALSE(usages.empty());
  CHECK(usages.front().name_range.start.line == 1);
}

TEST_CASE_METHOD(ProfileFixture, "Completion inside string arguments", "[language_profiles]") {
  SECTION("python getenv") {
    auto object = CompletionAfter(
        "python", "import os\nport = os.getenv(\"\")\n", "os.getenv(\"");
    CHECK(object == "os");
  }

  SECTION("python environ subscript") {
    auto object = CompletionAfter(
        "python", "import os\nurl = os.environ[\"\"]\n", "os.environ[\"");
    CHECK(object == "os.environ");
  }

  SECTION("java getenv") {
    const std::string code = R"(class App {
  void run() {
    String url = System.getenv("");
  }
}
)";
    CHECK(CompletionAfter("java", code, "getenv(\"") == "System");
  }

  SECTION("go Getenv") {
    const std::string code = R"(package main

import "os"

func main() {
	url := os.Getenv("")
	_ = url
}
)";
    CHECK(CompletionAfter("go", code, "Getenv(\"") == "os");
  }

  SECTION("c getenv") {
    const std::string code = R"(#include <stdlib.h>
int main(void) {
  const char* url = getenv("");
  return 0;
}
)";
    CHECK(CompletionAfter("c", code, "getenv(\"") == "getenv");
  }
}

TEST_CASE_METHOD(ProfileFixture, "No completion for unrelated calls", "[language_profiles]") {
  SECTION("python print") {
    CHECK_FALSE(CompletionAfter("python", "print(\"\")\n", "print(\"").has_value());
  }

  SECTION("java getProperty on System") {
    const std::string code = R"(class App {
  void run() {
    String home = System.getProperty("");
  }
}
)";
    CHECK_FALSE(CompletionAfter("java", code, "getProperty(\"").has_value());
  }

  SECTION("go os calls other than the env getters") {
    const std::string code = R"(package main

import "os"

func main() {
	os.Setenv("")
	os.Exit(1)
}
)";
    CHECK_FALSE(CompletionAfter("go", code, "Setenv(\"").has_value());
    CHECK_FALSE(CompletionAfter("go", code, "Exit(").has_value());
  }
}
