// java_lens/analysis/summarizer.cpp - Structural summary of a Java syntax tree
#include "java_lens/analysis/summarizer.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>

#include "java_lens/syntax/java_grammar.hpp"

namespace java_lens
{

namespace
{

// Tokens of every slot except the excluded ones. Used to read modifiers
// without looking into bodies and initializers.
TokenList tokens_outside(const SyntaxNode & node, std::initializer_list<std::string_view> excluded)
{
  TokenList out;
  for (const auto & slot : node.slots()) {
    if (std::find(excluded.begin(), excluded.end(), slot.name) != excluded.end()) {
      continue;
    }
    for (const auto & element : slot.elements) {
      if (const auto * token = std::get_if<SyntaxToken>(&element)) {
        out.push_back(token);
      } else if (const SyntaxNode * child = std::get<const SyntaxNode *>(element)) {
        collect_tokens(*child, out);
      }
    }
  }
  return out;
}

// Declarator ids belonging to this field declaration only: the search does
// not descend into anonymous class bodies, blocks or lambdas of initializers.
void find_declarator_ids(const SyntaxNode & node, NodeList & out)
{
  if (node.name() == syntax::k_variable_declarator_id) {
    out.push_back(&node);
    return;
  }
  if (
    node.name() == syntax::k_class_body || node.name() == syntax::k_block ||
    node.name() == syntax::k_lambda_expression) {
    return;
  }
  for (const auto & slot : node.slots()) {
    for (const auto & element : slot.elements) {
      const auto * child = std::get_if<const SyntaxNode *>(&element);
      if (child != nullptr && *child != nullptr) {
        find_declarator_ids(**child, out);
      }
    }
  }
}

std::string_view strip_prefix_keyword(std::string_view text, std::string_view keyword)
{
  if (text.substr(0, keyword.size()) != keyword) {
    return text;
  }
  const std::string_view rest = text.substr(keyword.size());
  if (rest.empty() || (rest.front() != ' ' && rest.front() != '\t' && rest.front() != '\n' &&
                       rest.front() != '\r')) {
    return text;
  }
  return trim(rest);
}

std::vector<FieldSummary> extract_fields(
  const SyntaxNode & field_node, std::string_view source, gsl::span<const uint32_t> line_starts)
{
  const TokenList modifier_tokens =
    tokens_outside(field_node, {syntax::k_variable_declarator});
  const Visibility visibility = visibility_of(modifier_tokens);
  const bool is_static = has_static(modifier_tokens);

  const SyntaxNode * type_node = nullptr;
  for (const auto name : syntax::k_field_type_nodes) {
    type_node = find_first_node(field_node, name);
    if (type_node != nullptr) {
      break;
    }
  }
  const std::string type_text =
    type_node != nullptr ? tokens_to_text(collect_tokens(*type_node), source) : std::string();

  NodeList ids;
  find_declarator_ids(field_node, ids);

  std::vector<FieldSummary> fields;
  for (const SyntaxNode * id : ids) {
    const TokenList id_tokens = collect_tokens(*id);
    const auto it = std::find_if(id_tokens.begin(), id_tokens.end(), [](const SyntaxToken * t) {
      return !t->image.empty();
    });
    if (it == id_tokens.end()) {
      continue;
    }

    FieldSummary field;
    field.name = (*it)->image;
    field.type = type_text;
    field.visibility = visibility;
    field.is_static = is_static;
    field.start_line = offset_to_line((*it)->start_offset, line_starts);
    fields.push_back(std::move(field));
  }
  return fields;
}

uint32_t count_parameters(const SyntaxNode & declarator)
{
  const size_t count = find_all_nodes(declarator, syntax::k_formal_parameter).size() +
                       find_all_nodes(declarator, syntax::k_variable_arity_parameter).size() +
                       find_all_nodes(declarator, syntax::k_receiver_parameter).size();
  return static_cast<uint32_t>(count);
}

std::optional<MethodDecl> extract_method(
  const SyntaxNode & method_node, std::string_view source, gsl::span<const uint32_t> line_starts)
{
  const SyntaxNode * declarator = find_first_node(method_node, syntax::k_method_declarator);
  if (declarator == nullptr) {
    return std::nullopt;
  }

  TokenList declarator_tokens = collect_tokens(*declarator);
  sort_by_offset(declarator_tokens);
  const auto name_it =
    std::find_if(declarator_tokens.begin(), declarator_tokens.end(), [](const SyntaxToken * t) {
      return !t->image.empty() && t->image != "(";
    });
  if (name_it == declarator_tokens.end()) {
    return std::nullopt;
  }
  const SyntaxToken & name_token = **name_it;

  const auto range = node_range(method_node);
  if (!range) {
    return std::nullopt;
  }

  const TokenList modifier_tokens = tokens_outside(method_node, {syntax::k_method_body});

  MethodDecl decl;
  decl.name = name_token.image;
  decl.params_count = count_parameters(*declarator);
  decl.visibility = visibility_of(modifier_tokens);
  decl.is_static = has_static(modifier_tokens);
  decl.start_line = offset_to_line(name_token.start_offset, line_starts);
  decl.start_offset = range->get_begin().get_offset();
  decl.end_offset = range->get_end().get_offset();

  std::string result_text;
  if (const SyntaxNode * result = find_first_node(method_node, syntax::k_result)) {
    result_text = tokens_to_text(collect_tokens(*result), source);
  }
  const std::string call_shape = decl.name + "(" + std::to_string(decl.params_count) + ")";
  decl.signature = result_text.empty() ? call_shape : result_text + " " + call_shape;

  if (const SyntaxNode * body = find_first_node(method_node, syntax::k_method_body)) {
    if (const auto body_range = node_range(*body)) {
      decl.body_start_offset = body_range->get_begin().get_offset();
      decl.body_end_offset = body_range->get_end().get_offset();
    }
  }
  return decl;
}

}  // namespace

Visibility visibility_of(const TokenList & tokens)
{
  TokenList sorted = tokens;
  sort_by_offset(sorted);
  for (const SyntaxToken * token : sorted) {
    if (token->image == "public") return Visibility::Public;
    if (token->image == "private") return Visibility::Private;
    if (token->image == "protected") return Visibility::Protected;
  }
  return Visibility::Package;
}

bool has_static(const TokenList & tokens) noexcept
{
  return std::any_of(tokens.begin(), tokens.end(), [](const SyntaxToken * t) {
    return t->image == syntax::k_static_keyword;
  });
}

std::string extract_package_name(const SyntaxNode & root, std::string_view source)
{
  const SyntaxNode * pkg = find_first_node(root, syntax::k_package_declaration);
  if (pkg == nullptr) {
    return {};
  }

  const std::string text = tokens_to_text(collect_tokens(*pkg), source);
  std::string_view name = strip_prefix_keyword(text, "package");
  if (!name.empty() && name.back() == ';') {
    name.remove_suffix(1);
  }
  return std::string(trim(name));
}

std::vector<std::string> extract_class_names(const SyntaxNode & root)
{
  std::vector<std::string> names;
  for (const SyntaxNode * class_node : find_all_nodes(root, syntax::k_normal_class_declaration)) {
    const SyntaxNode * declarator = find_first_node(*class_node, syntax::k_class_declarator);
    if (declarator == nullptr) {
      continue;
    }
    const TokenList tokens = collect_tokens(*declarator);
    const auto it = std::find_if(tokens.begin(), tokens.end(), [](const SyntaxToken * t) {
      return !t->image.empty() && t->image != "class";
    });
    if (it != tokens.end()) {
      names.push_back((*it)->image);
    }
  }
  return names;
}

StructuralSummary summarize(
  const SyntaxNode & root, std::string_view source, gsl::span<const uint32_t> line_starts,
  std::string_view fallback_class_name)
{
  StructuralSummary out;

  for (const SyntaxNode * field_node : find_all_nodes(root, syntax::k_field_declaration)) {
    auto fields = extract_fields(*field_node, source, line_starts);
    out.summary.fields.insert(
      out.summary.fields.end(), std::make_move_iterator(fields.begin()),
      std::make_move_iterator(fields.end()));
  }

  for (const SyntaxNode * method_node : find_all_nodes(root, syntax::k_method_declaration)) {
    if (auto decl = extract_method(*method_node, source, line_starts)) {
      out.summary.methods.push_back(to_method_summary(*decl));
      out.method_decls.push_back(std::move(*decl));
    }
  }

  std::vector<std::string> class_names = extract_class_names(root);
  if (class_names.empty()) {
    out.summary.class_name = std::string(fallback_class_name);
  } else {
    out.summary.class_name = class_names.front();
    for (auto it = class_names.begin() + 1; it != class_names.end(); ++it) {
      if (*it != out.summary.class_name) {
        out.summary.inner_classes.push_back(std::move(*it));
      }
    }
  }

  out.summary.package_name = extract_package_name(root, source);

  if (const SyntaxNode * primary = find_first_node(root, syntax::k_normal_class_declaration)) {
    out.class_header = tokens_to_text(tokens_outside(*primary, {syntax::k_class_body}), source);
  }
  return out;
}

}  // namespace java_lens
