// java_lens/syntax/java_grammar.hpp - Node names and keyword sets of the Java CST
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace java_lens::syntax
{

// NOTE: Node names follow the Java Language Specification productions. The
// tree-sitter lowering in java_parser.cpp must produce exactly these names.

inline constexpr std::string_view k_compilation_unit = "compilationUnit";
inline constexpr std::string_view k_package_declaration = "packageDeclaration";
inline constexpr std::string_view k_normal_class_declaration = "normalClassDeclaration";
inline constexpr std::string_view k_normal_interface_declaration = "normalInterfaceDeclaration";
inline constexpr std::string_view k_class_declarator = "classDeclarator";
inline constexpr std::string_view k_class_body = "classBody";
inline constexpr std::string_view k_field_declaration = "fieldDeclaration";
inline constexpr std::string_view k_variable_declarator = "variableDeclarator";
inline constexpr std::string_view k_variable_declarator_id = "variableDeclaratorId";
inline constexpr std::string_view k_method_declaration = "methodDeclaration";
inline constexpr std::string_view k_method_modifier = "methodModifier";
inline constexpr std::string_view k_method_declarator = "methodDeclarator";
inline constexpr std::string_view k_method_body = "methodBody";
inline constexpr std::string_view k_result = "result";
inline constexpr std::string_view k_formal_parameter = "formalParameter";
inline constexpr std::string_view k_variable_arity_parameter = "variableArityParameter";
inline constexpr std::string_view k_receiver_parameter = "receiverParameter";
inline constexpr std::string_view k_constructor_declaration = "constructorDeclaration";
inline constexpr std::string_view k_block = "block";
inline constexpr std::string_view k_lambda_expression = "lambdaExpression";

/// Declared-type node names tried in order when resolving a field's type.
inline constexpr std::array<std::string_view, 3> k_field_type_nodes = {
  "unannType",
  "typeType",
  "type",
};

inline constexpr std::array<std::string_view, 3> k_access_modifiers = {
  "public",
  "private",
  "protected",
};

inline constexpr std::string_view k_static_keyword = "static";

/// Words that may precede '(' without forming a method call.
inline constexpr std::array<std::string_view, 16> k_call_keywords = {
  "if",  "for",   "while", "switch", "catch", "synchronized", "new",   "return",
  "throw", "try", "else",  "do",     "case",  "super",        "this",  "assert",
};

[[nodiscard]] inline bool is_call_keyword(std::string_view word) noexcept
{
  return std::find(k_call_keywords.begin(), k_call_keywords.end(), word) != k_call_keywords.end();
}

}  // namespace java_lens::syntax
