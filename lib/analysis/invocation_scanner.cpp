// java_lens/analysis/invocation_scanner.cpp - Call-site scanning over raw text
#include "java_lens/analysis/invocation_scanner.hpp"

#include <string>
#include <unordered_set>

#include "java_lens/syntax/java_grammar.hpp"
#include "java_lens/syntax/tree_utils.hpp"

namespace java_lens
{

namespace
{

bool is_word_char(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool is_ident_start(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

bool is_ident_part(char c) noexcept { return is_word_char(c) || c == '$'; }

bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Word boundary before `pos`, in the ASCII sense of a regex \b.
bool at_word_boundary(std::string_view text, size_t pos) noexcept
{
  const bool before = pos > 0 && is_word_char(text[pos - 1]);
  const bool after = pos < text.size() && is_word_char(text[pos]);
  return before != after;
}

void decrement_clamped(uint32_t & depth) noexcept
{
  if (depth > 0) {
    --depth;
  }
}

}  // namespace

uint32_t count_arguments(std::string_view args_text) noexcept
{
  const std::string_view text = trim(args_text);
  if (text.empty()) {
    return 0;
  }

  uint32_t depth_paren = 0;
  uint32_t depth_angle = 0;
  uint32_t depth_bracket = 0;
  uint32_t depth_brace = 0;  // array initializers
  uint32_t count = 1;
  for (const char ch : text) {
    switch (ch) {
      case '(':
        ++depth_paren;
        break;
      case ')':
        decrement_clamped(depth_paren);
        break;
      case '<':
        ++depth_angle;
        break;
      case '>':
        decrement_clamped(depth_angle);
        break;
      case '[':
        ++depth_bracket;
        break;
      case ']':
        decrement_clamped(depth_bracket);
        break;
      case '{':
        ++depth_brace;
        break;
      case '}':
        decrement_clamped(depth_brace);
        break;
      case ',':
        if (depth_paren == 0 && depth_angle == 0 && depth_bracket == 0 && depth_brace == 0) {
          ++count;
        }
        break;
      default:
        break;
    }
  }
  return count;
}

std::optional<size_t> find_matching_paren(std::string_view text, size_t open_index) noexcept
{
  int depth = 0;
  char in_string = '\0';
  for (size_t i = open_index; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_string != '\0') {
      if (ch == '\\' && i + 1 < text.size()) {
        ++i;
        continue;
      }
      if (ch == in_string) {
        in_string = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      in_string = ch;
      continue;
    }
    if (ch == '(') {
      ++depth;
    } else if (ch == ')') {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::nullopt;
}

std::vector<MethodInvocation> scan_invocations(
  std::string_view text, uint32_t base_offset, gsl::span<const uint32_t> line_starts)
{
  std::vector<MethodInvocation> out;

  size_t pos = 0;
  while (pos < text.size()) {
    if (!is_ident_start(text[pos]) || !at_word_boundary(text, pos)) {
      ++pos;
      continue;
    }

    const size_t name_begin = pos;
    size_t name_end = pos + 1;
    while (name_end < text.size() && is_ident_part(text[name_end])) {
      ++name_end;
    }
    size_t open = name_end;
    while (open < text.size() && is_space(text[open])) {
      ++open;
    }
    if (open >= text.size() || text[open] != '(') {
      ++pos;
      continue;
    }

    // Resume after '(' so calls nested in the arguments are found too.
    pos = open + 1;

    const std::string_view name = text.substr(name_begin, name_end - name_begin);
    if (syntax::is_call_keyword(name)) {
      continue;
    }
    const auto close = find_matching_paren(text, open);
    if (!close) {
      continue;
    }

    MethodInvocation invocation;
    invocation.name = std::string(name);
    invocation.args_count = count_arguments(text.substr(open + 1, *close - open - 1));
    invocation.start_offset = base_offset + static_cast<uint32_t>(name_begin);
    invocation.line = offset_to_line(invocation.start_offset, line_starts);
    out.push_back(std::move(invocation));
  }
  return out;
}

std::vector<MethodInvocation> scan_method_bodies(
  const std::vector<MethodDecl> & decls, std::string_view source,
  gsl::span<const uint32_t> line_starts)
{
  std::vector<MethodInvocation> out;
  std::unordered_set<uint32_t> seen_offsets;

  for (const auto & decl : decls) {
    if (!decl.has_body()) {
      continue;
    }
    const uint32_t start = *decl.body_start_offset;
    const uint32_t end = *decl.body_end_offset;
    if (start >= source.size() || end <= start) {
      continue;
    }

    for (auto & invocation :
         scan_invocations(source.substr(start, end - start), start, line_starts)) {
      if (seen_offsets.insert(invocation.start_offset).second) {
        out.push_back(std::move(invocation));
      }
    }
  }
  return out;
}

}  // namespace java_lens
