// java_lens/analysis/concurrency.cpp - Lock hazard detection over raw text
#include "java_lens/analysis/concurrency.hpp"

#include <array>
#include <string>

namespace java_lens
{

namespace
{

constexpr std::string_view k_synchronized = "synchronized";

constexpr std::array<std::string_view, 4> k_binder_calls = {
  "transact",
  "linkToDeath",
  "asBinder",
  "queryLocalInterface",
};

constexpr std::array<std::string_view, 4> k_handler_calls = {
  "post",
  "postDelayed",
  "sendMessage",
  "sendMessageAtTime",
};

bool is_word_char(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool boundary_before(std::string_view text, size_t pos) noexcept
{
  return pos == 0 || !is_word_char(text[pos - 1]);
}

bool boundary_after(std::string_view text, size_t pos) noexcept
{
  return pos >= text.size() || !is_word_char(text[pos]);
}

// Offset of the next whole-word occurrence of `word` at or after `from`.
size_t find_word(std::string_view text, std::string_view word, size_t from) noexcept
{
  size_t pos = text.find(word, from);
  while (pos != std::string_view::npos) {
    if (boundary_before(text, pos) && boundary_after(text, pos + word.size())) {
      return pos;
    }
    pos = text.find(word, pos + 1);
  }
  return std::string_view::npos;
}

// `name` followed by optional whitespace and '('.
template <size_t N>
bool contains_call(
  std::string_view text, const std::array<std::string_view, N> & names, bool word_start) noexcept
{
  for (const auto name : names) {
    size_t pos = text.find(name);
    while (pos != std::string_view::npos) {
      size_t i = pos + name.size();
      while (i < text.size() && is_space(text[i])) {
        ++i;
      }
      const bool call_shaped = i < text.size() && text[i] == '(';
      if (call_shaped && (!word_start || boundary_before(text, pos))) {
        return true;
      }
      pos = text.find(name, pos + 1);
    }
  }
  return false;
}

ConcurrencyWarning make_warning(
  const SynchronizedBlock & block, ConcurrencyHazard hazard, std::string_view message)
{
  ConcurrencyWarning warning;
  warning.hazard = hazard;
  warning.range = SourceRange(block.keyword_offset, block.body_end + 1);
  warning.line = block.line;
  warning.message = std::string(message);
  return warning;
}

const char * code_for(ConcurrencyHazard hazard) noexcept
{
  switch (hazard) {
    case ConcurrencyHazard::BinderCallInLock:
      return k_code_binder_in_lock;
    case ConcurrencyHazard::HandlerCallInLock:
      return k_code_handler_in_lock;
    case ConcurrencyHazard::NestedLock:
      return k_code_nested_lock;
  }
  return k_code_binder_in_lock;
}

}  // namespace

std::vector<SynchronizedBlock> find_synchronized_blocks(const SourceManager & source)
{
  const std::string_view text = source.get_source();
  std::vector<SynchronizedBlock> blocks;

  size_t keyword = find_word(text, k_synchronized, 0);
  while (keyword != std::string_view::npos) {
    const size_t brace = text.find('{', keyword);
    if (brace != std::string_view::npos) {
      int depth = 1;
      for (size_t i = brace + 1; i < text.size(); ++i) {
        if (text[i] == '{') {
          ++depth;
        } else if (text[i] == '}') {
          --depth;
          if (depth == 0) {
            SynchronizedBlock block;
            block.keyword_offset = static_cast<uint32_t>(keyword);
            block.body_start = static_cast<uint32_t>(brace + 1);
            block.body_end = static_cast<uint32_t>(i);
            block.line = source.get_line(block.keyword_offset);
            blocks.push_back(block);
            break;
          }
        }
      }
    }
    keyword = find_word(text, k_synchronized, keyword + k_synchronized.size());
  }
  return blocks;
}

std::vector<ConcurrencyWarning> analyze_concurrency(const SourceManager & source)
{
  const std::string_view text = source.get_source();
  std::vector<ConcurrencyWarning> warnings;

  for (const auto & block : find_synchronized_blocks(source)) {
    const std::string_view body = text.substr(block.body_start, block.body_end - block.body_start);

    if (contains_call(body, k_binder_calls, /*word_start=*/false)) {
      warnings.push_back(
        make_warning(block, ConcurrencyHazard::BinderCallInLock, k_binder_in_lock_message));
    }
    if (contains_call(body, k_handler_calls, /*word_start=*/true)) {
      warnings.push_back(
        make_warning(block, ConcurrencyHazard::HandlerCallInLock, k_handler_in_lock_message));
    }
    if (find_word(body, k_synchronized, 0) != std::string_view::npos) {
      warnings.push_back(make_warning(block, ConcurrencyHazard::NestedLock, k_nested_lock_message));
    }
  }
  return warnings;
}

void report_concurrency_warnings(
  const std::vector<ConcurrencyWarning> & warnings, DiagnosticBag & diags)
{
  for (const auto & warning : warnings) {
    auto builder = diags.report_warning(warning.range, warning.message, "lock taken here");
    builder.with_code(code_for(warning.hazard));
    switch (warning.hazard) {
      case ConcurrencyHazard::BinderCallInLock:
        builder.with_help("move the binder call outside the synchronized block");
        break;
      case ConcurrencyHazard::HandlerCallInLock:
        builder.with_help("post or send the message after releasing the lock");
        break;
      case ConcurrencyHazard::NestedLock:
        break;
    }
  }
}

}  // namespace java_lens
