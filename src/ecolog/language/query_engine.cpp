#include "ecolog/language/query_engine.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <unordered_map>

#include <fmt/format.h>

namespace ecolog::language {

namespace {

struct QueryCursorDeleter {
  auto operator()(TSQueryCursor* cursor) const -> void {
    ts_query_cursor_delete(cursor);
  }
};

constexpr std::size_t kErrorExcerptLength = 30;

// Local name a namespace import binds when the statement names no alias:
// the last segment of the module path.
auto LastPathSegment(std::string_view path) -> std::string {
  auto pos = path.find_last_of("/.:\\");
  auto segment = pos == std::string_view::npos ? path : path.substr(pos + 1);
  return std::string(segment);
}

auto TrimmedExcerpt(std::string_view text) -> std::string {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  if (text.size() > kErrorExcerptLength) {
    return std::string(text.substr(0, kErrorExcerptLength)) + "...";
  }
  return std::string(text);
}

auto IsTokenChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
         c == '.' || c == '$' || c == ':';
}

}  // namespace

auto QueryEngine::ForEachMatch(
    QueryKind kind, const MatchHandler& handler,
    std::optional<std::pair<uint32_t, uint32_t>> byte_range) const -> void {
  const auto* query = language_.Query(kind);
  if (query == nullptr) {
    return;
  }

  std::unique_ptr<TSQueryCursor, QueryCursorDeleter> cursor(
      ts_query_cursor_new());
  if (!cursor) {
    return;
  }
  if (byte_range) {
    ts_query_cursor_set_byte_range(
        cursor.get(), byte_range->first, byte_range->second);
  }
  ts_query_cursor_exec(cursor.get(), query->Raw(), tree_.Root().Raw());

  TSQueryMatch match;
  while (ts_query_cursor_next_match(cursor.get(), &match)) {
    if (!query->Satisfies(match, tree_)) {
      continue;
    }
    handler(syntax::QueryMatch(*query, match, tree_));
  }
}

auto QueryEngine::Literal(
    const syntax::QueryMatch& match, std::string_view capture) const
    -> LiteralText {
  auto raw = match.Text(capture);
  auto range = match.RangeOf(capture);
  auto stripped = LanguageSupport::StripQuotes(raw);
  if (stripped.size() != raw.size() &&
      range.start.line == range.end.line) {
    range.start.character += 1;
    range.end.character -= 1;
  }
  return {.text = std::string(stripped), .range = range};
}

auto QueryEngine::References(const ImportContext& imports) const
    -> std::vector<ReferenceFact> {
  std::vector<ReferenceFact> facts;
  std::unordered_map<Range, std::size_t, RangeHash> by_access;

  auto object_denotes_env = [&](std::string_view object) {
    if (language_.IsStandardEnvObject(object)) {
      return true;
    }
    const auto* imported = imports.Lookup(std::string(object));
    return imported != nullptr &&
           language_.IsKnownEnvModule(imported->module_path);
  };

  ForEachMatch(QueryKind::kReference, [&](const syntax::QueryMatch& match) {
    if (!match.Has("env_access") || !match.Has("env_var_name")) {
      return;
    }
    std::optional<std::string> object;
    if (match.Has("object")) {
      object = std::string(match.Text("object"));
      if (!object_denotes_env(*object)) {
        return;
      }
    }

    auto name = Literal(match, "env_var_name");
    if (name.text.empty()) {
      return;
    }

    ReferenceFact fact{
        .name = std::move(name.text),
        .range = match.RangeOf("env_access"),
        .name_range = name.range,
        .object = std::move(object),
        .default_value = std::nullopt};
    if (match.Has("env_default_value")) {
      fact.default_value = Literal(match, "env_default_value").text;
    }

    auto [it, inserted] = by_access.try_emplace(fact.range, facts.size());
    if (inserted) {
      facts.push_back(std::move(fact));
    } else if (fact.default_value && !facts[it->second].default_value) {
      facts[it->second].default_value = std::move(fact.default_value);
    }
  });
  return facts;
}

auto QueryEngine::Bindings() const -> std::vector<BindingFact> {
  std::vector<BindingFact> facts;
  RangeDeduplicator seen;

  ForEachMatch(QueryKind::kBinding, [&](const syntax::QueryMatch& match) {
    if (!match.Has("binding_name")) {
      return;
    }
    bool object_binding = match.Has("env_object_binding");
    if (!object_binding && !match.Has("env_binding")) {
      return;
    }

    BindingFact fact;
    fact.name = std::string(match.Text("binding_name"));
    fact.name_range = match.RangeOf("binding_name");
    fact.range = object_binding ? match.RangeOf("env_object_binding")
                                : match.RangeOf("env_binding");
    if (match.Has("_object")) {
      fact.object = std::string(match.Text("_object"));
    }

    if (match.Has("bound_env_var")) {
      auto var = Literal(match, "bound_env_var");
      if (var.text.empty()) {
        return;
      }
      fact.kind = BindingFact::Kind::kEnvVar;
      fact.env_var = std::move(var.text);
      fact.env_var_range = var.range;
      fact.destructured = object_binding;
    } else if (object_binding) {
      fact.kind = BindingFact::Kind::kEnvObject;
    } else {
      return;
    }

    if (fact.name.empty() || !seen.Insert(fact.name_range)) {
      return;
    }
    facts.push_back(std::move(fact));
  });
  return facts;
}

auto QueryEngine::Imports() const -> std::vector<ImportFact> {
  std::vector<ImportFact> facts;

  ForEachMatch(QueryKind::kImport, [&](const syntax::QueryMatch& match) {
    if (!match.Has("import_path")) {
      return;
    }
    ImportFact fact;
    fact.module_path = Literal(match, "import_path").text;
    fact.range = match.Has("import_stmt") ? match.RangeOf("import_stmt")
                                          : match.RangeOf("import_path");

    if (match.Has("default_import")) {
      fact.original_name = std::string(kDefaultExportName);
    } else if (match.Has("namespace_import")) {
      fact.original_name = std::string(kNamespaceImportName);
    } else if (match.Has("original_name")) {
      fact.original_name = std::string(match.Text("original_name"));
    } else {
      return;
    }

    if (match.Has("alias_name")) {
      fact.alias = std::string(match.Text("alias_name"));
      fact.alias_range = match.RangeOf("alias_name");
    } else if (match.Has("original_name")) {
      fact.alias = std::string(match.Text("original_name"));
      fact.alias_range = match.RangeOf("original_name");
    } else {
      fact.alias = LastPathSegment(fact.module_path);
      fact.alias_range = match.RangeOf("import_path");
    }

    if (fact.module_path.empty() || fact.alias.empty()) {
      return;
    }
    facts.push_back(std::move(fact));
  });
  return facts;
}

auto QueryEngine::MakeImportContext(const std::vector<ImportFact>& imports)
    -> ImportContext {
  ImportContext context;
  for (const auto& fact : imports) {
    context.imported_modules.insert(fact.module_path);
    context.aliases.insert_or_assign(
        fact.alias, ImportedName{
                        .module_path = fact.module_path,
                        .original_name = fact.original_name});
  }
  return context;
}

auto QueryEngine::Exports() const -> std::vector<ExportFact> {
  std::vector<ExportFact> facts;

  ForEachMatch(QueryKind::kExport, [&](const syntax::QueryMatch& match) {
    ExportFact fact;

    if (match.Has("wildcard_source")) {
      fact.wildcard_source = Literal(match, "wildcard_source").text;
      fact.range = match.RangeOf("export_stmt");
      facts.push_back(std::move(fact));
      return;
    }

    bool is_default =
        match.Has("default_export") || match.Has("cjs_default_export");
    if (is_default) {
      fact.is_default = true;
      fact.exported_name = std::string(kDefaultExportName);
      fact.range = match.Has("default_export")
                       ? match.RangeOf("default_export")
                       : match.RangeOf("cjs_default_export");
      fact.name_range = fact.range;
    } else if (match.Has("export_name")) {
      fact.exported_name = std::string(match.Text("export_name"));
      fact.name_range = match.RangeOf("export_name");
      if (match.Has("export_stmt")) {
        fact.range = match.RangeOf("export_stmt");
      } else if (match.Has("cjs_named_export")) {
        fact.range = match.RangeOf("cjs_named_export");
      } else {
        fact.range = fact.name_range;
      }
    } else {
      return;
    }

    if (match.Has("export_value")) {
      auto value = match.Get("export_value");
      fact.value_text = std::string(match.Text("export_value"));
      fact.value_range = match.RangeOf("export_value");
      if (is_default && language_.IsIdentifierKind(value.Kind())) {
        fact.local_name = fact.value_text;
      }
    }

    if (match.Has("local_name")) {
      fact.local_name = std::string(match.Text("local_name"));
    } else if (!is_default && !match.Has("cjs_named_export")) {
      // `export const X = ...` and `export { X }` both name a local X
      fact.local_name = fact.exported_name;
    }

    if (match.Has("reexport_source")) {
      fact.reexport_source = Literal(match, "reexport_source").text;
    }

    if (fact.exported_name.empty()) {
      return;
    }
    facts.push_back(std::move(fact));
  });
  return facts;
}

auto QueryEngine::Reassignments() const -> std::vector<ReassignmentFact> {
  std::vector<ReassignmentFact> facts;
  ForEachMatch(QueryKind::kReassignment, [&](const syntax::QueryMatch& match) {
    if (!match.Has("reassigned_name")) {
      return;
    }
    facts.push_back(
        {.name = std::string(match.Text("reassigned_name")),
         .range = match.RangeOf("reassigned_name")});
  });
  return facts;
}

auto QueryEngine::Identifiers() const -> std::vector<IdentifierFact> {
  std::vector<IdentifierFact> facts;
  ForEachMatch(QueryKind::kIdentifier, [&](const syntax::QueryMatch& match) {
    if (!match.Has("identifier")) {
      return;
    }
    facts.push_back(
        {.name = std::string(match.Text("identifier")),
         .range = match.RangeOf("identifier")});
  });
  return facts;
}

auto QueryEngine::Assignments() const -> std::vector<AssignmentFact> {
  std::vector<AssignmentFact> facts;
  ForEachMatch(QueryKind::kAssignment, [&](const syntax::QueryMatch& match) {
    if (!match.Has("assignment_target") || !match.Has("assignment_source")) {
      return;
    }
    facts.push_back(
        {.target = std::string(match.Text("assignment_target")),
         .target_range = match.RangeOf("assignment_target"),
         .source = std::string(match.Text("assignment_source")),
         .source_range = match.RangeOf("assignment_source"),
         .range = match.Has("assignment") ? match.RangeOf("assignment")
                                          : match.RangeOf("assignment_target")});
  });
  return facts;
}

auto QueryEngine::Destructures() const -> std::vector<DestructureFact> {
  std::vector<DestructureFact> facts;
  RangeDeduplicator seen;
  ForEachMatch(QueryKind::kDestructure, [&](const syntax::QueryMatch& match) {
    if (!match.Has("destructure_target") || !match.Has("destructure_source")) {
      return;
    }
    auto target_range = match.RangeOf("destructure_target");
    if (!seen.Insert(target_range)) {
      return;
    }
    auto key = match.Has("destructure_key")
                   ? Literal(match, "destructure_key")
                   : LiteralText{
                         .text = std::string(match.Text("destructure_target")),
                         .range = target_range};
    facts.push_back(
        {.target = std::string(match.Text("destructure_target")),
         .target_range = target_range,
         .key = std::move(key.text),
         .key_range = key.range,
         .source = std::string(match.Text("destructure_source")),
         .source_range = match.RangeOf("destructure_source"),
         .range = match.Has("destructure") ? match.RangeOf("destructure")
                                           : target_range});
  });
  return facts;
}

auto QueryEngine::CompletionObjectAt(const Position& pos) const
    -> std::optional<std::string> {
  auto offset = tree_.Lines().ToByteOffset(pos);
  if (!offset) {
    return std::nullopt;
  }
  auto source = tree_.Source();
  auto cursor_byte = static_cast<uint32_t>(*offset);

  // The cursor sits right after the trigger; look one character back and
  // never across a line break.
  auto anchor = cursor_byte;
  if (anchor > 0 && anchor <= source.size() && source[anchor - 1] != '\n') {
    --anchor;
  }

  // 1. Completion query, allowing the cursor one past the target's end
  std::optional<std::string> best;
  std::optional<Range> best_range;
  ForEachMatch(
      QueryKind::kCompletion,
      [&](const syntax::QueryMatch& match) {
        if (!match.Has("completion_target") || !match.Has("object")) {
          return;
        }
        auto range = match.RangeOf("completion_target");
        auto tolerant = range;
        tolerant.end.character += 1;
        if (!ContainsPosition(tolerant, pos)) {
          return;
        }
        if (!best_range || IsSmallerRange(range, *best_range)) {
          best_range = range;
          best = std::string(match.Text("object"));
        }
      },
      std::make_pair(anchor, cursor_byte + 1));
  if (best) {
    return best;
  }

  // 2. Enclosing property access, found by walking up from the cursor
  auto node = tree_.Root().NamedDescendantForBytes(anchor, anchor);
  for (; !node.IsNull(); node = node.Parent()) {
    const auto* form = language_.FindPropertyAccessForm(node.Kind());
    if (form == nullptr) {
      continue;
    }
    auto object = form->object_field.empty()
                      ? node.NamedChild(0)
                      : node.ChildByField(form->object_field);
    if (!object.IsNull()) {
      return std::string(tree_.Text(object));
    }
  }

  // 3. Incomplete input the grammar could not shape: take the token that
  // precedes the trigger on the current line.
  auto line_start = source.rfind('\n', cursor_byte == 0 ? 0 : cursor_byte - 1);
  line_start = line_start == std::string_view::npos ? 0 : line_start + 1;
  if (cursor_byte < line_start || cursor_byte > source.size()) {
    return std::nullopt;
  }
  auto prefix = source.substr(line_start, cursor_byte - line_start);
  if (!language_.IsValidCompletionTrigger(prefix)) {
    return std::nullopt;
  }
  auto end = prefix.size();
  while (end > 0 && !IsTokenChar(prefix[end - 1])) {
    --end;
  }
  // The trigger itself may end in '.', which is not part of the object
  while (end > 0 && prefix[end - 1] == '.') {
    --end;
  }
  auto start = end;
  while (start > 0 && IsTokenChar(prefix[start - 1])) {
    --start;
  }
  if (start == end) {
    return std::nullopt;
  }
  return std::string(prefix.substr(start, end - start));
}

auto QueryEngine::SyntaxErrors() const -> std::vector<SyntaxErrorFact> {
  std::vector<SyntaxErrorFact> errors;
  auto root = tree_.Root();
  if (root.IsNull() || !root.HasError()) {
    return errors;
  }

  std::vector<syntax::Node> stack{root};
  while (!stack.empty()) {
    auto node = stack.back();
    stack.pop_back();

    if (node.IsError()) {
      errors.push_back(
          {.message = fmt::format("Unexpected: {}", TrimmedExcerpt(tree_.Text(node))),
           .range = tree_.RangeOf(node)});
      continue;
    }
    if (node.IsMissing()) {
      errors.push_back(
          {.message = fmt::format("Missing: {}", node.Kind()),
           .range = tree_.RangeOf(node)});
      continue;
    }
    if (!node.HasError()) {
      continue;
    }
    for (uint32_t i = node.ChildCount(); i > 0; --i) {
      stack.push_back(node.Child(i - 1));
    }
  }
  return errors;
}

}  // namespace ecolog::language
