// java_lens/analysis/model.hpp - Value types produced by the analysis engine
//
// Every type here is a plain value: created fresh per analysis request and
// never mutated after it is handed to a consumer.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "java_lens/basic/source_manager.hpp"

namespace java_lens
{

// ============================================================================
// Structural facts
// ============================================================================

enum class Visibility : uint8_t {
  Public,
  Private,
  Protected,
  Package,  // no access modifier present
};

[[nodiscard]] std::string_view to_string(Visibility visibility) noexcept;

struct FieldSummary
{
  std::string name;
  std::string type;  // raw declared type text
  Visibility visibility = Visibility::Package;
  bool is_static = false;
  uint32_t start_line = 0;  // 1-based
};

struct MethodSummary
{
  std::string name;
  uint32_t params_count = 0;
  Visibility visibility = Visibility::Package;
  bool is_static = false;
  uint32_t start_line = 0;  // 1-based
};

/**
 * A method declaration with its source extent.
 *
 * `start_offset`/`end_offset` cover the whole declaration (end exclusive).
 * The body offsets are both present or both absent; they are absent for
 * abstract and native methods.
 */
struct MethodDecl
{
  std::string name;
  uint32_t params_count = 0;
  Visibility visibility = Visibility::Package;
  bool is_static = false;
  uint32_t start_line = 0;  // line of the method name
  std::string signature;    // "<result> name(paramsCount)"
  uint32_t start_offset = 0;
  uint32_t end_offset = 0;
  std::optional<uint32_t> body_start_offset;
  std::optional<uint32_t> body_end_offset;

  [[nodiscard]] bool has_body() const noexcept
  {
    return body_start_offset.has_value() && body_end_offset.has_value();
  }
};

[[nodiscard]] MethodSummary to_method_summary(const MethodDecl & decl);

/// A call-like site. Not resolved to any declaration.
struct MethodInvocation
{
  std::string name;
  uint32_t args_count = 0;
  uint32_t start_offset = 0;
  uint32_t line = 0;  // 1-based
};

struct ClassSummary
{
  std::string class_name;
  std::string package_name;  // empty when there is no package declaration
  std::vector<FieldSummary> fields;
  std::vector<MethodSummary> methods;
  std::vector<std::string> inner_classes;  // never contains class_name's declaration
};

// ============================================================================
// Call graph
// ============================================================================

struct MethodRef
{
  std::string class_name;
  std::string method_name;
  std::string file_path;
  uint32_t line = 0;
};

struct MethodCallGraph
{
  std::string method;  // "Class.method(paramsCount)"
  std::vector<MethodRef> callers;
  std::vector<MethodRef> callees;
};

// ============================================================================
// Framework heuristics
// ============================================================================

struct BinderServiceRegistration
{
  std::string name;  // "<unknown>" when no string literal is found
  uint32_t line = 0;
};

struct SystemServiceSummary
{
  std::string service_class;
  std::optional<uint32_t> on_start_line;
  std::vector<uint32_t> on_boot_phases;
  std::vector<BinderServiceRegistration> binder_services;
};

struct LifecycleEntry
{
  std::string name;
  uint32_t line = 0;
};

/// Entries are sorted ascending by line.
struct LifecycleTimeline
{
  std::string file_path;
  std::string class_name;
  std::vector<LifecycleEntry> entries;
};

// ============================================================================
// Concurrency
// ============================================================================

enum class ConcurrencyHazard : uint8_t {
  BinderCallInLock,
  HandlerCallInLock,
  NestedLock,
};

struct ConcurrencyWarning
{
  ConcurrencyHazard hazard = ConcurrencyHazard::BinderCallInLock;
  SourceRange range;  // from the `synchronized` keyword to the block's closing brace
  uint32_t line = 0;  // line of the `synchronized` keyword
  std::string message;
};

}  // namespace java_lens
