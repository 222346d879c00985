// java_lens/analysis/call_graph.cpp - Single-file caller/callee resolution
#include "java_lens/analysis/call_graph.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <utility>

namespace java_lens
{

namespace
{

uint32_t body_start(const MethodDecl & decl) noexcept
{
  return decl.body_start_offset.value_or(decl.start_offset);
}

uint32_t body_end(const MethodDecl & decl) noexcept
{
  return decl.body_end_offset.value_or(decl.end_offset);
}

MethodRef make_ref(std::string_view class_name, const MethodDecl & decl, std::string_view file_path)
{
  MethodRef ref;
  ref.class_name = std::string(class_name);
  ref.method_name = decl.name;
  ref.file_path = std::string(file_path);
  ref.line = decl.start_line;
  return ref;
}

std::vector<MethodRef> find_callees(
  const MethodDecl & method, const std::vector<MethodDecl> & decls,
  const std::vector<MethodInvocation> & invocations, std::string_view class_name,
  std::string_view file_path)
{
  std::vector<MethodRef> callees;
  const uint32_t start = body_start(method);
  const uint32_t end = body_end(method);

  for (const auto & invocation : invocations) {
    if (invocation.start_offset < start || invocation.start_offset > end) {
      continue;
    }
    const auto candidate = std::find_if(decls.begin(), decls.end(), [&](const MethodDecl & d) {
      return d.name == invocation.name && d.params_count == invocation.args_count;
    });
    if (candidate != decls.end()) {
      callees.push_back(make_ref(class_name, *candidate, file_path));
    }
  }
  return callees;
}

std::vector<MethodRef> find_callers(
  const MethodDecl & method, const std::vector<MethodDecl> & decls,
  const std::vector<MethodInvocation> & invocations, std::string_view class_name,
  std::string_view file_path)
{
  std::vector<MethodRef> callers;
  std::set<std::pair<std::string, uint32_t>> seen;

  for (const auto & invocation : invocations) {
    if (invocation.name != method.name || invocation.args_count != method.params_count) {
      continue;
    }
    const MethodDecl * caller = find_enclosing_method(decls, invocation.start_offset);
    if (caller == nullptr) {
      continue;
    }
    if (!seen.emplace(caller->name, caller->start_line).second) {
      continue;
    }
    callers.push_back(make_ref(class_name, *caller, file_path));
  }
  return callers;
}

}  // namespace

const MethodDecl * find_method_at_offset(
  const std::vector<MethodDecl> & decls, uint32_t offset) noexcept
{
  for (const auto & decl : decls) {
    if (offset >= decl.start_offset && offset <= decl.end_offset) {
      return &decl;
    }
  }
  return nullptr;
}

const MethodDecl * find_enclosing_method(
  const std::vector<MethodDecl> & decls, uint32_t offset) noexcept
{
  for (const auto & decl : decls) {
    if (offset >= body_start(decl) && offset <= body_end(decl)) {
      return &decl;
    }
  }
  return nullptr;
}

std::string method_label(std::string_view class_name, const MethodDecl & decl)
{
  return fmt::format("{}.{}({})", class_name, decl.name, decl.params_count);
}

std::optional<MethodCallGraph> build_method_call_graph(
  const std::vector<MethodDecl> & decls, const std::vector<MethodInvocation> & invocations,
  std::string_view class_name, std::string_view file_path, uint32_t cursor_offset)
{
  const MethodDecl * current = find_method_at_offset(decls, cursor_offset);
  if (current == nullptr) {
    return std::nullopt;
  }

  MethodCallGraph graph;
  graph.method = method_label(class_name, *current);
  graph.callers = find_callers(*current, decls, invocations, class_name, file_path);
  graph.callees = find_callees(*current, decls, invocations, class_name, file_path);
  return graph;
}

std::string format_method_ref(const MethodRef & ref)
{
  const std::string file = std::filesystem::path(ref.file_path).filename().string();
  return fmt::format("{}.{} · {}:{}", ref.class_name, ref.method_name, file, ref.line);
}

}  // namespace java_lens
