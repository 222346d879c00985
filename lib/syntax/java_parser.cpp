// java_lens/syntax/java_parser.cpp - tree-sitter-java -> generic syntax tree lowering
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "java_lens/syntax/java_grammar.hpp"
#include "java_lens/syntax/parser.hpp"
#include "java_lens/syntax/ts_ll.hpp"

namespace java_lens
{

namespace
{

struct TsChild
{
  ts_ll::Node node;
  std::string_view field;
};

// Direct children with their field names; comments (extras) are dropped.
std::vector<TsChild> children_of(ts_ll::Node node)
{
  std::vector<TsChild> out;
  ts_ll::Cursor cursor(node);
  if (!cursor.goto_first_child()) {
    return out;
  }
  do {
    const ts_ll::Node child = cursor.current_node();
    if (!child.is_extra()) {
      out.push_back(TsChild{child, cursor.current_field_name()});
    }
  } while (cursor.goto_next_sibling());
  return out;
}

std::string snake_to_lower_camel(std::string_view kind)
{
  std::string out;
  out.reserve(kind.size());
  bool upper_next = false;
  for (const char c : kind) {
    if (c == '_') {
      upper_next = !out.empty();
      continue;
    }
    if (upper_next && c >= 'a' && c <= 'z') {
      out.push_back(static_cast<char>(c - 'a' + 'A'));
    } else {
      out.push_back(c);
    }
    upper_next = false;
  }
  return out;
}

std::string node_name_for(std::string_view kind)
{
  if (kind == "program") return std::string(syntax::k_compilation_unit);
  if (kind == "class_declaration") return std::string(syntax::k_normal_class_declaration);
  if (kind == "interface_declaration") return std::string(syntax::k_normal_interface_declaration);
  if (kind == "spread_parameter") return std::string(syntax::k_variable_arity_parameter);
  return snake_to_lower_camel(kind);
}

// First ERROR or MISSING node in pre-order.
std::optional<ts_ll::Node> find_first_error(ts_ll::Node node)
{
  if (node.is_error() || node.is_missing()) {
    return node;
  }
  if (!node.has_error()) {
    return std::nullopt;
  }
  for (uint32_t i = 0; i < node.child_count(); ++i) {
    if (auto found = find_first_error(node.child(i))) {
      return found;
    }
  }
  return std::nullopt;
}

class Lowering
{
public:
  Lowering(std::string_view source, SyntaxTree & tree) : source_(source), tree_(tree) {}

  const SyntaxNode * lower(ts_ll::Node node, std::string_view parent_kind)
  {
    const std::string_view kind = node.kind();
    if (kind == "class_declaration") {
      return lower_class(node);
    }
    if (kind == "method_declaration") {
      // Interface members are not class methods.
      if (parent_kind == "interface_body") {
        return lower_generic(node, "interfaceMethodDeclaration");
      }
      return lower_method(node);
    }
    if (kind == "field_declaration") {
      return lower_field(node);
    }
    if (kind == "variable_declarator") {
      return lower_variable_declarator(node);
    }
    return lower_generic(node, node_name_for(kind));
  }

private:
  SyntaxToken make_token(ts_ll::Node node) const
  {
    SyntaxToken token;
    const uint32_t start = node.start_byte();
    const uint32_t end = node.end_byte();
    token.image = std::string(source_.substr(start, end - start));
    token.start_offset = start;
    if (end > start + 1) {
      token.end_offset = end - 1;
    }
    return token;
  }

  std::string slot_name(const TsChild & child) const
  {
    if (!child.field.empty()) {
      return std::string(child.field);
    }
    if (child.node.is_named()) {
      return node_name_for(child.node.kind());
    }
    const uint32_t start = child.node.start_byte();
    return std::string(source_.substr(start, child.node.end_byte() - start));
  }

  void append(SyntaxNode & parent, std::string_view slot, const TsChild & child, std::string_view parent_kind)
  {
    if (child.node.child_count() == 0) {
      parent.add_child(slot, make_token(child.node));
    } else {
      parent.add_child(slot, lower(child.node, parent_kind));
    }
  }

  void append(SyntaxNode & parent, const TsChild & child, std::string_view parent_kind)
  {
    append(parent, slot_name(child), child, parent_kind);
  }

  SyntaxNode * lower_generic(ts_ll::Node node, std::string name)
  {
    SyntaxNode * out = tree_.create(std::move(name));
    const std::string_view kind = node.kind();
    for (const auto & child : children_of(node)) {
      append(*out, child, kind);
    }
    return out;
  }

  // modifiers | classDeclarator(class, name, type params, extends, implements) | classBody
  SyntaxNode * lower_class(ts_ll::Node node)
  {
    SyntaxNode * out = tree_.create(std::string(syntax::k_normal_class_declaration));
    SyntaxNode * declarator = tree_.create(std::string(syntax::k_class_declarator));
    const std::string_view kind = node.kind();

    std::vector<TsChild> modifiers;
    std::vector<TsChild> body;
    std::vector<TsChild> header;
    for (const auto & child : children_of(node)) {
      if (child.node.kind() == "modifiers") {
        modifiers.push_back(child);
      } else if (child.field == "body") {
        body.push_back(child);
      } else {
        header.push_back(child);
      }
    }

    for (const auto & child : modifiers) {
      append(*out, "classModifier", child, kind);
    }
    for (const auto & child : header) {
      append(*declarator, child, kind);
    }
    out->add_child(syntax::k_class_declarator, declarator);
    for (const auto & child : body) {
      append(*out, syntax::k_class_body, child, kind);
    }
    return out;
  }

  // methodModifier | typeParameters | result | methodDeclarator | throws | methodBody
  SyntaxNode * lower_method(ts_ll::Node node)
  {
    SyntaxNode * out = tree_.create(std::string(syntax::k_method_declaration));
    SyntaxNode * declarator = nullptr;
    const std::string_view kind = node.kind();

    for (const auto & child : children_of(node)) {
      if (child.node.kind() == "modifiers") {
        append(*out, syntax::k_method_modifier, child, kind);
      } else if (child.field == "type") {
        SyntaxNode * result = tree_.create(std::string(syntax::k_result));
        append(*result, "unannType", child, kind);
        out->add_child(syntax::k_result, result);
      } else if (child.field == "name" || child.field == "parameters" || child.field == "dimensions") {
        if (declarator == nullptr) {
          declarator = tree_.create(std::string(syntax::k_method_declarator));
          out->add_child(syntax::k_method_declarator, declarator);
        }
        append(*declarator, child, kind);
      } else if (child.field == "body") {
        SyntaxNode * body = tree_.create(std::string(syntax::k_method_body));
        append(*body, syntax::k_block, child, kind);
        out->add_child(syntax::k_method_body, body);
      } else {
        append(*out, child, kind);
      }
    }
    return out;
  }

  // fieldModifier | unannType | variableDeclarator...
  SyntaxNode * lower_field(ts_ll::Node node)
  {
    SyntaxNode * out = tree_.create(std::string(syntax::k_field_declaration));
    const std::string_view kind = node.kind();

    for (const auto & child : children_of(node)) {
      if (child.node.kind() == "modifiers") {
        append(*out, "fieldModifier", child, kind);
      } else if (child.field == "type") {
        SyntaxNode * type = tree_.create("unannType");
        append(*type, "type", child, kind);
        out->add_child("unannType", type);
      } else if (child.field == "declarator") {
        append(*out, syntax::k_variable_declarator, child, kind);
      } else {
        append(*out, child, kind);
      }
    }
    return out;
  }

  // variableDeclaratorId(name, dimensions) | = | value
  SyntaxNode * lower_variable_declarator(ts_ll::Node node)
  {
    SyntaxNode * out = tree_.create(std::string(syntax::k_variable_declarator));
    SyntaxNode * id = nullptr;
    const std::string_view kind = node.kind();

    for (const auto & child : children_of(node)) {
      if (child.field == "name" || child.field == "dimensions") {
        if (id == nullptr) {
          id = tree_.create(std::string(syntax::k_variable_declarator_id));
          out->add_child(syntax::k_variable_declarator_id, id);
        }
        append(*id, child, kind);
      } else {
        append(*out, child, kind);
      }
    }
    return out;
  }

  std::string_view source_;
  SyntaxTree & tree_;
};

}  // namespace

// ============================================================================
// JavaParser
// ============================================================================

struct JavaParser::Impl
{
  ts_ll::Parser parser;
};

JavaParser::JavaParser() : impl_(std::make_unique<Impl>()) {}

JavaParser::~JavaParser() = default;

JavaParser::JavaParser(JavaParser &&) noexcept = default;
JavaParser & JavaParser::operator=(JavaParser &&) noexcept = default;

ParseResult<SyntaxTree> JavaParser::parse(std::string_view source)
{
  ts_ll::Tree ts_tree(impl_->parser.parse_string(source));
  const ts_ll::Node root = ts_tree.root_node();
  if (root.is_null()) {
    return std::vector<ParseError>{ParseError{"parser produced no tree", SourceRange(0, 0)}};
  }

  if (root.has_error()) {
    const auto bad = find_first_error(root);
    const SourceRange range = bad ? bad->range() : root.range();
    std::string message = "syntax error";
    if (bad && bad->is_missing()) {
      message = "missing '" + std::string(bad->kind()) + "'";
    }
    return std::vector<ParseError>{ParseError{std::move(message), range}};
  }

  SyntaxTree tree;
  Lowering lowering(source, tree);
  tree.set_root(lowering.lower(root, {}));
  return std::move(tree);
}

}  // namespace java_lens
