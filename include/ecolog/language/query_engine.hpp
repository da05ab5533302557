#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ecolog/core/analysis_types.hpp"
#include "ecolog/core/range.hpp"
#include "ecolog/language/language_support.hpp"
#include "ecolog/syntax/compiled_query.hpp"
#include "ecolog/syntax/ts_node.hpp"

namespace ecolog::language {

// `process.env.PORT`, `os.getenv("PORT")`, `ENV["PORT"]`
struct ReferenceFact {
  std::string name;
  Range range;
  Range name_range;
  std::optional<std::string> object;
  std::optional<std::string> default_value;
};

// `const port = process.env.PORT` or `const env = process.env`
struct BindingFact {
  enum class Kind { kEnvVar, kEnvObject };

  Kind kind = Kind::kEnvVar;
  std::string name;
  Range name_range;
  Range range;
  // Variable read by a kEnvVar binding
  std::string env_var;
  Range env_var_range;
  // Text of the environment object expression, when captured
  std::optional<std::string> object;
  // `const { PORT } = process.env`: env_var_range is the pattern key
  bool destructured = false;
};

struct ImportFact {
  std::string module_path;
  std::string original_name;
  std::string alias;
  Range alias_range;
  Range range;
};

struct ExportFact {
  std::string exported_name;
  // Local symbol the export refers to, when it names one
  std::optional<std::string> local_name;
  std::optional<std::string> value_text;
  std::optional<Range> value_range;
  Range range;
  Range name_range;
  bool is_default = false;
  std::optional<std::string> reexport_source;
  std::optional<std::string> wildcard_source;
};

struct ReassignmentFact {
  std::string name;
  Range range;
};

struct IdentifierFact {
  std::string name;
  Range range;
};

// `const b = a`
struct AssignmentFact {
  std::string target;
  Range target_range;
  std::string source;
  Range source_range;
  Range range;
};

// `const { KEY: target } = source`
struct DestructureFact {
  std::string target;
  Range target_range;
  std::string key;
  Range key_range;
  std::string source;
  Range source_range;
  Range range;
};

struct SyntaxErrorFact {
  std::string message;
  Range range;
};

// Runs the compiled queries of one language over one tree and turns matches
// into facts. Holds no state besides the two references; every method is a
// fresh cursor run.
class QueryEngine {
 public:
  QueryEngine(const LanguageSupport& language, const syntax::SyntaxTree& tree)
      : language_(language), tree_(tree) {
  }

  // Only references whose object is a standard env object, or a local name
  // imported from a known env module, are reported. Matches sharing an access
  // range are merged, keeping the default value if any match saw one.
  [[nodiscard]] auto References(const ImportContext& imports) const
      -> std::vector<ReferenceFact>;

  [[nodiscard]] auto Bindings() const -> std::vector<BindingFact>;
  [[nodiscard]] auto Imports() const -> std::vector<ImportFact>;
  [[nodiscard]] auto Exports() const -> std::vector<ExportFact>;
  [[nodiscard]] auto Reassignments() const -> std::vector<ReassignmentFact>;
  [[nodiscard]] auto Identifiers() const -> std::vector<IdentifierFact>;
  [[nodiscard]] auto Assignments() const -> std::vector<AssignmentFact>;
  [[nodiscard]] auto Destructures() const -> std::vector<DestructureFact>;

  // Base expression of the access being completed at `pos`
  [[nodiscard]] auto CompletionObjectAt(const Position& pos) const
      -> std::optional<std::string>;

  [[nodiscard]] auto SyntaxErrors() const -> std::vector<SyntaxErrorFact>;

  // Builds the import context from Imports()
  static auto MakeImportContext(const std::vector<ImportFact>& imports)
      -> ImportContext;

 private:
  using MatchHandler = std::function<void(const syntax::QueryMatch&)>;

  auto ForEachMatch(
      QueryKind kind, const MatchHandler& handler,
      std::optional<std::pair<uint32_t, uint32_t>> byte_range =
          std::nullopt) const -> void;

  // Text and range of a capture, without surrounding quotes
  struct LiteralText {
    std::string text;
    Range range;
  };
  [[nodiscard]] auto Literal(
      const syntax::QueryMatch& match, std::string_view capture) const
      -> LiteralText;

  const LanguageSupport& language_;
  const syntax::SyntaxTree& tree_;
};

}  // namespace ecolog::language
