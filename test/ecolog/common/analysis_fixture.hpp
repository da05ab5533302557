#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <catch2/catch_all.hpp>

#include "ecolog/core/range.hpp"
#include "ecolog/language/language_registry.hpp"
#include "ecolog/services/document_manager.hpp"

namespace ecolog::test {

// Analyzes inline sources without opening them in a DocumentManager
class AnalysisFixture {
 public:
  AnalysisFixture() : registry_(language::LanguageRegistry::CreateDefault()) {
  }

  [[nodiscard]] auto Registry() const
      -> std::shared_ptr<const language::LanguageRegistry> {
    return registry_;
  }

  auto Analyze(std::string_view language_id, std::string text) const
      -> std::shared_ptr<const services::DocumentSnapshot> {
    auto language = registry_->ByLanguageId(language_id);
    REQUIRE(language != nullptr);
    auto snapshot = services::DocumentManager::AnalyzeText(
        language, "file:///workspace/test", std::string(language_id), 1,
        std::move(text), nullptr);
    REQUIRE(snapshot->tree != nullptr);
    return snapshot;
  }

  // Position of the first character of the `occurrence`-th `needle` in
  // `text`, shifted right by `offset`. ASCII sources only.
  static auto FindPosition(
      std::string_view text, std::string_view needle, int occurrence = 0,
      uint32_t offset = 0) -> Position {
    std::size_t at = text.find(needle);
    for (int i = 0; i < occurrence && at != std::string_view::npos; ++i) {
      at = text.find(needle, at + 1);
    }
    if (at == std::string_view::npos) {
      throw std::invalid_argument(std::string(needle) + " not found");
    }

    Position pos;
    for (std::size_t i = 0; i < at; ++i) {
      if (text[i] == '\n') {
        ++pos.line;
        pos.character = 0;
      } else {
        ++pos.character;
      }
    }
    pos.character += offset;
    return pos;
  }

 private:
  std::shared_ptr<language::LanguageRegistry> registry_;
};

}  // namespace ecolog::test
