// java_lens/syntax/parser.hpp - Grammar parser interface for Java sources
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "java_lens/basic/source_manager.hpp"
#include "java_lens/syntax/cst.hpp"

namespace java_lens
{

// ============================================================================
// Error Types
// ============================================================================

/**
 * Parse error information.
 */
struct ParseError
{
  std::string message;
  SourceRange range;
};

// ============================================================================
// Result Type (C++17 compatible)
// ============================================================================

/**
 * Parse result type using std::variant.
 * Holds either a success value T or an error vector.
 */
template <typename T>
class ParseResult
{
public:
  using ValueType = T;
  using ErrorType = std::vector<ParseError>;

  // Construct with success value
  ParseResult(T value) : data_(std::move(value)) {}

  // Construct with errors
  ParseResult(std::vector<ParseError> errors) : data_(std::move(errors)) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] bool has_error() const { return std::holds_alternative<ErrorType>(data_); }

  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<T>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<T>(data_); }
  T && value() && { return std::get<T>(std::move(data_)); }

  // Get errors (undefined behavior if has_value())
  [[nodiscard]] const ErrorType & error() const & { return std::get<ErrorType>(data_); }

private:
  std::variant<T, ErrorType> data_;
};

// ============================================================================
// GrammarParser
// ============================================================================

/**
 * Turns source text into a generic syntax tree.
 *
 * Implementations fail with ParseError values on malformed input; they
 * never throw for bad source text.
 */
class GrammarParser
{
public:
  virtual ~GrammarParser() = default;

  [[nodiscard]] virtual ParseResult<SyntaxTree> parse(std::string_view source) = 0;
};

/**
 * Java parser backed by tree-sitter-java.
 *
 * The tree-sitter tree is lowered into SyntaxNode/SyntaxToken form with
 * node names taken from the Java Language Specification (see
 * java_grammar.hpp).
 *
 * Example usage:
 * @code
 *     java_lens::JavaParser parser;
 *     auto result = parser.parse(source_code);
 *     if (result) {
 *         const SyntaxNode * root = result.value().root();
 *     } else {
 *         // Handle result.error()
 *     }
 * @endcode
 */
class JavaParser final : public GrammarParser
{
public:
  JavaParser();
  ~JavaParser() override;

  JavaParser(const JavaParser &) = delete;
  JavaParser & operator=(const JavaParser &) = delete;

  JavaParser(JavaParser &&) noexcept;
  JavaParser & operator=(JavaParser &&) noexcept;

  [[nodiscard]] ParseResult<SyntaxTree> parse(std::string_view source) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace java_lens
