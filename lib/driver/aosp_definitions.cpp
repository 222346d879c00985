// java_lens/driver/aosp_definitions.cpp - Go-to-definition into AOSP side files
#include "java_lens/driver/aosp_definitions.hpp"

#include <algorithm>

#include "java_lens/basic/source_manager.hpp"
#include "java_lens/driver/workspace_scan.hpp"

namespace java_lens
{

namespace fs = std::filesystem;

namespace
{

bool is_word_char(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool contains(std::string_view haystack, std::string_view needle) noexcept
{
  return haystack.find(needle) != std::string_view::npos;
}

/// `word` occurring with a non-word character (or line edge) on both sides.
bool contains_word(std::string_view text, std::string_view word) noexcept
{
  size_t pos = text.find(word);
  while (pos != std::string_view::npos) {
    const bool left_ok = pos == 0 || !is_word_char(text[pos - 1]);
    const size_t after = pos + word.size();
    const bool right_ok = after >= text.size() || !is_word_char(text[after]);
    if (left_ok && right_ok) {
      return true;
    }
    pos = text.find(word, pos + 1);
  }
  return false;
}

bool under_jni_dir(const fs::path & path, const fs::path & root)
{
  const fs::path rel = path.lexically_relative(root);
  for (const auto & part : rel.parent_path()) {
    if (part == "jni") {
      return true;
    }
  }
  return false;
}

/// Visit lines of a file; `match` returns the column of a hit.
template <typename Match>
std::optional<DefinitionLocation> first_matching_line(const fs::path & path, Match match)
{
  const auto text = read_file_to_string(path);
  if (!text) {
    return std::nullopt;
  }

  std::string_view rest = *text;
  uint32_t line = 0;
  while (true) {
    const size_t nl = rest.find('\n');
    const std::string_view line_text = rest.substr(0, nl);
    if (const auto column = match(line_text)) {
      return DefinitionLocation{path, line, *column};
    }
    if (nl == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(nl + 1);
    ++line;
  }
  return std::nullopt;
}

std::optional<DefinitionLocation> find_service_context(
  const fs::path & root, std::string_view name, const ScanOptions & options,
  const CancellationFlag * cancel)
{
  const auto files =
    find_files(root, options, [](const fs::path & p) { return p.filename() == "service_contexts"; });
  for (const auto & path : files) {
    if (is_cancelled(cancel)) {
      return std::nullopt;
    }
    auto hit = first_matching_line(path, [name](std::string_view line) -> std::optional<uint32_t> {
      const size_t pos = line.find(name);
      if (pos == std::string_view::npos) return std::nullopt;
      return static_cast<uint32_t>(pos);
    });
    if (hit) {
      return hit;
    }
  }
  return std::nullopt;
}

std::optional<DefinitionLocation> find_init_service(
  const fs::path & root, std::string_view name, const ScanOptions & options,
  const CancellationFlag * cancel)
{
  const auto files =
    find_files(root, options, [](const fs::path & p) { return p.extension() == ".rc"; });
  for (const auto & path : files) {
    if (is_cancelled(cancel)) {
      return std::nullopt;
    }
    auto hit = first_matching_line(path, [name](std::string_view line) -> std::optional<uint32_t> {
      constexpr std::string_view service_prefix = "service ";
      if (line.substr(0, service_prefix.size()) != service_prefix) return std::nullopt;
      const size_t pos = line.find(name);
      if (pos == std::string_view::npos) return std::nullopt;
      return static_cast<uint32_t>(pos);
    });
    if (hit) {
      return hit;
    }
  }
  return std::nullopt;
}

std::optional<DefinitionLocation> find_jni_method(
  const fs::path & root, std::string_view name, const ScanOptions & options,
  const CancellationFlag * cancel)
{
  const auto files = find_files(root, options, [&root](const fs::path & p) {
    return p.extension() == ".cpp" && under_jni_dir(p, root);
  });
  for (const auto & path : files) {
    if (is_cancelled(cancel)) {
      return std::nullopt;
    }
    const auto text = read_file_to_string(path);
    if (!text) {
      continue;
    }
    const size_t pos = text->find(name);
    if (pos == std::string::npos) {
      continue;
    }
    const SourceManager sm(path, *text);
    const LineColumn lc = sm.get_line_column(static_cast<uint32_t>(pos));
    return DefinitionLocation{path, lc.line - 1, lc.column - 1};
  }
  return std::nullopt;
}

}  // namespace

std::string_view to_string(DefinitionKind kind) noexcept
{
  switch (kind) {
    case DefinitionKind::ServiceContext:
      return "service-context";
    case DefinitionKind::InitService:
      return "init-service";
    case DefinitionKind::JniMethod:
      return "jni-method";
  }
  return "unknown";
}

std::optional<StringLiteralSpan> string_literal_at(std::string_view line_text, uint32_t column)
{
  if (line_text.empty()) {
    return std::nullopt;
  }
  const size_t from = std::min<size_t>(column, line_text.size() - 1);
  const size_t open = line_text.rfind('"', from);
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  const size_t close = line_text.find('"', open + 1);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }
  if (column < open || column > close) {
    return std::nullopt;
  }
  StringLiteralSpan span;
  span.text = std::string(line_text.substr(open + 1, close - open - 1));
  span.start = static_cast<uint32_t>(open + 1);
  span.end = static_cast<uint32_t>(close);
  return span;
}

std::optional<std::string> word_at(std::string_view line_text, uint32_t column)
{
  size_t pos = column;
  if (pos >= line_text.size() || !is_word_char(line_text[pos])) {
    // Cursor just past the end of a word
    if (pos == 0 || pos > line_text.size() || !is_word_char(line_text[pos - 1])) {
      return std::nullopt;
    }
    --pos;
  }
  size_t start = pos;
  while (start > 0 && is_word_char(line_text[start - 1])) {
    --start;
  }
  size_t end = pos + 1;
  while (end < line_text.size() && is_word_char(line_text[end])) {
    ++end;
  }
  return std::string(line_text.substr(start, end - start));
}

std::optional<DefinitionRequest> classify_definition(std::string_view line_text, uint32_t column)
{
  if (const auto literal = string_literal_at(line_text, column); literal && !literal->text.empty()) {
    if (contains(line_text, "publishBinderService") || contains(line_text, "addService")) {
      return DefinitionRequest{DefinitionKind::ServiceContext, literal->text};
    }
    if (contains(line_text, "start") || contains(line_text, "init")) {
      return DefinitionRequest{DefinitionKind::InitService, literal->text};
    }
  }

  if (contains_word(line_text, "native")) {
    if (auto word = word_at(line_text, column)) {
      return DefinitionRequest{DefinitionKind::JniMethod, std::move(*word)};
    }
  }

  return std::nullopt;
}

std::optional<DefinitionLocation> find_definition(
  const fs::path & root, const DefinitionRequest & request, const ScanOptions & options,
  const CancellationFlag * cancel)
{
  if (request.symbol.empty()) {
    return std::nullopt;
  }
  switch (request.kind) {
    case DefinitionKind::ServiceContext:
      return find_service_context(root, request.symbol, options, cancel);
    case DefinitionKind::InitService:
      return find_init_service(root, request.symbol, options, cancel);
    case DefinitionKind::JniMethod:
      return find_jni_method(root, request.symbol, options, cancel);
  }
  return std::nullopt;
}

}  // namespace java_lens
