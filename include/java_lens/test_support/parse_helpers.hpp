// java_lens/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// These helpers provide a real single-file parse for tests, a builder for
// hand-made syntax trees, and a GrammarParser stub that counts calls.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "java_lens/basic/source_manager.hpp"
#include "java_lens/syntax/cst.hpp"
#include "java_lens/syntax/parser.hpp"

namespace java_lens::test_support
{

/**
 * Builds a SyntaxTree by hand.
 *
 * Tokens are located in `source` by their image, searching forward from the
 * previous token, so a tree can be written in source order without counting
 * offsets.
 */
class CstBuilder
{
public:
  explicit CstBuilder(std::string source) : source_(std::move(source)) {}

  SyntaxNode * node(std::string name) { return tree_.create(std::move(name)); }

  /// Next occurrence of `image` after the previous token.
  SyntaxToken token(std::string_view image)
  {
    const size_t pos = source_.find(image, cursor_);
    const auto start = static_cast<uint32_t>(pos == std::string::npos ? cursor_ : pos);
    cursor_ = start + image.size();
    SyntaxToken t;
    t.image = std::string(image);
    t.start_offset = start;
    if (image.size() > 1) {
      t.end_offset = start + static_cast<uint32_t>(image.size()) - 1;
    }
    return t;
  }

  /// Add a token under `slot` of `parent`, named after its image when `slot` is empty.
  SyntaxToken add_token(SyntaxNode * parent, std::string_view image, std::string_view slot = {})
  {
    SyntaxToken t = token(image);
    parent->add_child(slot.empty() ? image : slot, t);
    return t;
  }

  SyntaxNode * add_node(SyntaxNode * parent, std::string name)
  {
    SyntaxNode * child = node(name);
    parent->add_child(name, child);
    return child;
  }

  [[nodiscard]] const std::string & source() const noexcept { return source_; }
  [[nodiscard]] LineIndex line_starts() const { return build_line_index(source_); }

  SyntaxTree finish(const SyntaxNode * root)
  {
    tree_.set_root(root);
    return std::move(tree_);
  }

private:
  std::string source_;
  size_t cursor_ = 0;
  SyntaxTree tree_;
};

/**
 * GrammarParser stub that counts parse calls.
 *
 * Delegates to a real JavaParser unless told to fail.
 */
class CountingParser final : public GrammarParser
{
public:
  CountingParser() : inner_(std::make_unique<JavaParser>()) {}

  [[nodiscard]] ParseResult<SyntaxTree> parse(std::string_view source) override
  {
    ++calls_;
    if (fail_) {
      return std::vector<ParseError>{ParseError{"forced failure", SourceRange(0, 0)}};
    }
    return inner_->parse(source);
  }

  void set_fail(bool fail) noexcept { fail_ = fail; }
  [[nodiscard]] int calls() const noexcept { return calls_; }

private:
  std::unique_ptr<JavaParser> inner_;
  int calls_ = 0;
  bool fail_ = false;
};

struct TestParseUnit
{
  SourceManager source;
  ParseResult<SyntaxTree> result;

  [[nodiscard]] const SyntaxNode * root() const
  {
    return result.has_value() ? result.value().root() : nullptr;
  }
};

[[nodiscard]] inline TestParseUnit parse_java(std::string src)
{
  JavaParser parser;
  auto result = parser.parse(src);
  return TestParseUnit{SourceManager(std::move(src)), std::move(result)};
}

}  // namespace java_lens::test_support
