// java_lens/lsp/workspace.cpp - Serverless language service implementation
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "java_lens/analysis/analysis_cache.hpp"
#include "java_lens/analysis/call_graph.hpp"
#include "java_lens/analysis/concurrency.hpp"
#include "java_lens/analysis/json_export.hpp"
#include "java_lens/analysis/lifecycle.hpp"
#include "java_lens/basic/diagnostic.hpp"
#include "java_lens/basic/source_manager.hpp"
#include "java_lens/driver/aosp_definitions.hpp"
#include "java_lens/driver/workspace_scan.hpp"
#include "java_lens/lsp/lsp.hpp"
#include "java_lens/syntax/parser.hpp"

namespace java_lens::lsp
{
namespace
{

using json = nlohmann::json;
namespace fs = std::filesystem;

// -----------------------------
// Range helpers
// -----------------------------

json range_to_json(const java_lens::FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

/// Range covering a whole 1-based line.
json line_range_to_json(const java_lens::SourceManager & sm, uint32_t line)
{
  if (line == 0 || line > sm.get_line_count()) {
    return nullptr;
  }
  const uint32_t start = sm.line_starts()[line - 1];
  const auto text = sm.get_line_text(line - 1);
  const uint32_t end = start + static_cast<uint32_t>(text.size());
  return range_to_json(sm.get_full_range(java_lens::SourceRange(start, end)));
}

json severity_json(java_lens::Severity s) { return std::string(java_lens::to_string(s)); }

}  // namespace

// =============================================================================
// Workspace::Impl
// =============================================================================

struct Workspace::Impl
{
  ProjectConfig config;
  java_lens::JavaParser parser;
  std::unique_ptr<java_lens::AnalysisCache> cache;

  std::unordered_map<std::string, java_lens::DocumentInput> docs;

  explicit Impl(ProjectConfig cfg) : config(std::move(cfg))
  {
    cache = std::make_unique<java_lens::AnalysisCache>(parser, config.analysis);
  }

  const java_lens::DocumentInput * get_doc(std::string_view uri) const
  {
    auto it = docs.find(std::string(uri));
    if (it == docs.end()) {
      return nullptr;
    }
    return &it->second;
  }

  /// Cache lookup for an open document. Unknown URIs are unavailable.
  java_lens::CacheResult analyze(std::string_view uri)
  {
    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return java_lens::CacheResult::with_status(java_lens::CacheStatus::Unavailable);
    }
    return cache->get_analysis(*doc);
  }

  static json base_payload(std::string_view uri, const java_lens::CacheResult & r)
  {
    json out;
    out["uri"] = std::string(uri);
    out["status"] = std::string(java_lens::to_string(r.status));
    return out;
  }

  json class_summary_json_impl(std::string_view uri)
  {
    const auto r = analyze(uri);
    json out = base_payload(uri, r);
    out["summary"] = r.is_ok() ? json(r.analysis->summary) : json(nullptr);
    return out;
  }

  json document_symbols_json_impl(std::string_view uri)
  {
    const auto r = analyze(uri);
    json out = base_payload(uri, r);
    out["symbols"] = json::array();
    if (!r.is_ok()) {
      return out;
    }

    const auto * doc = get_doc(uri);
    const java_lens::SourceManager sm(doc->text);
    const auto & a = *r.analysis;

    auto push_sym = [&](std::string name, std::string kind, std::string detail, json range) {
      json s;
      s["name"] = std::move(name);
      s["kind"] = std::move(kind);
      s["detail"] = std::move(detail);
      if (!range.is_null()) {
        s["range"] = range;
        s["selectionRange"] = std::move(range);
      }
      out["symbols"].push_back(std::move(s));
    };

    push_sym(a.summary.class_name, "Class", a.summary.package_name, nullptr);
    for (const auto & inner : a.summary.inner_classes) {
      push_sym(inner, "InnerClass", "", nullptr);
    }
    for (const auto & f : a.summary.fields) {
      push_sym(
        f.name, "Field", f.type + " " + std::string(java_lens::to_string(f.visibility)),
        line_range_to_json(sm, f.start_line));
    }
    for (const auto & m : a.method_decls) {
      const java_lens::SourceRange decl_range(m.start_offset, m.end_offset);
      json s_range = range_to_json(sm.get_full_range(decl_range));
      push_sym(m.name, "Method", m.signature, std::move(s_range));
    }
    return out;
  }

  json method_call_graph_json_impl(std::string_view uri, uint32_t byte_offset)
  {
    const auto r = analyze(uri);
    json out = base_payload(uri, r);
    out["graph"] = nullptr;
    if (!r.is_ok()) {
      return out;
    }

    const auto * doc = get_doc(uri);
    const std::string file_path = doc->file_path.empty() ? doc->uri : doc->file_path;
    const auto & a = *r.analysis;
    if (
      auto graph = java_lens::build_method_call_graph(
        a.method_decls, a.method_invocations, a.summary.class_name, file_path, byte_offset)) {
      out["graph"] = *graph;
    }
    return out;
  }

  json diagnostics_json_impl(std::string_view uri)
  {
    const auto r = analyze(uri);
    json out = base_payload(uri, r);
    out["items"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr || r.status == java_lens::CacheStatus::NotApplicable) {
      return out;
    }

    const java_lens::SourceManager sm(doc->text);
    java_lens::DiagnosticBag diags;

    if (r.status == java_lens::CacheStatus::Unavailable) {
      std::string message = "Java analysis unavailable";
      java_lens::SourceRange range(0, 0);
      if (!r.errors.empty()) {
        message += ": " + r.errors.front().message;
        if (r.errors.front().range.is_valid()) {
          range = r.errors.front().range;
        }
      }
      diags.report_info(range, std::move(message))
        .with_code(java_lens::k_code_analysis_unavailable);
    }

    // The lock scan is textual and does not need a parse.
    java_lens::report_concurrency_warnings(java_lens::analyze_concurrency(sm), diags);

    for (const auto & d0 : diags.all()) {
      json item;
      item["source"] = d0.code == java_lens::k_code_analysis_unavailable ? "parser" : "concurrency";
      item["message"] = d0.message;
      item["severity"] = severity_json(d0.severity);
      if (!d0.code.empty()) {
        item["code"] = d0.code;
      }
      if (d0.help_message) {
        item["help"] = *d0.help_message;
      }
      item["range"] = range_to_json(sm.get_full_range(d0.primary_range()));
      out["items"].push_back(std::move(item));
    }
    return out;
  }

  json system_service_json_impl(std::string_view uri)
  {
    const auto r = analyze(uri);
    json out = base_payload(uri, r);
    out["systemService"] = nullptr;
    if (r.is_ok() && r.analysis->system_service) {
      out["systemService"] = *r.analysis->system_service;
    }
    return out;
  }

  json lifecycle_timeline_json_impl(std::string_view uri)
  {
    const auto r = analyze(uri);
    json out = base_payload(uri, r);
    out["timeline"] = nullptr;
    if (!r.is_ok()) {
      return out;
    }

    const auto * doc = get_doc(uri);
    const std::string file_path = doc->file_path.empty() ? doc->uri : doc->file_path;
    if (java_lens::is_lifecycle_target(file_path, config.analysis)) {
      out["timeline"] = java_lens::build_lifecycle_timeline(
        file_path, r.analysis->summary.class_name, r.analysis->method_decls, config.analysis);
    }
    return out;
  }

  json definition_json_impl(
    std::string_view uri, uint32_t byte_offset, std::string_view root_dir,
    const java_lens::CancellationFlag * cancel)
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr || doc->language_id != "java" || root_dir.empty()) {
      return out;
    }

    const java_lens::SourceManager sm(doc->text);
    const auto lc = sm.get_line_column(byte_offset);
    if (!lc.is_valid()) {
      return out;
    }
    const std::string_view line_text = sm.get_line_text(lc.line - 1);
    const auto request = java_lens::classify_definition(line_text, lc.column - 1);
    if (!request) {
      return out;
    }
    out["kind"] = std::string(java_lens::to_string(request->kind));
    out["symbol"] = request->symbol;

    const auto loc =
      java_lens::find_definition(fs::path(std::string(root_dir)), *request, config.scan, cancel);
    if (!loc) {
      return out;
    }

    const auto symbol_len = static_cast<uint32_t>(request->symbol.size());
    json l;
    l["uri"] = java_lens::path_to_file_uri(loc->path);
    l["range"] = json{
      {"startLine", loc->line + 1},
      {"startColumn", loc->column + 1},
      {"endLine", loc->line + 1},
      {"endColumn", loc->column + 1 + symbol_len},
    };
    out["locations"].push_back(std::move(l));
    return out;
  }

  json system_services_scan_json_impl(
    std::string_view root_dir, const java_lens::CancellationFlag * cancel)
  {
    json out;
    out["root"] = std::string(root_dir);
    out["services"] = json::array();
    const auto entries =
      java_lens::scan_system_services(*cache, fs::path(std::string(root_dir)), config.scan, cancel);
    for (const auto & e : entries) {
      out["services"].push_back(json{{"filePath", e.file_path}, {"summary", e.summary}});
    }
    out["cancelled"] = java_lens::is_cancelled(cancel);
    return out;
  }

  json lifecycle_timelines_scan_json_impl(
    std::string_view root_dir, const java_lens::CancellationFlag * cancel)
  {
    json out;
    out["root"] = std::string(root_dir);
    const auto timelines = java_lens::build_lifecycle_timelines(
      *cache, fs::path(std::string(root_dir)), config.scan, cancel);
    json items = json::array();
    for (const auto & t : timelines) {
      json item = t;
      item["label"] = java_lens::format_timeline_label(t);
      items.push_back(std::move(item));
    }
    out["timelines"] = std::move(items);
    out["cancelled"] = java_lens::is_cancelled(cancel);
    return out;
  }
};

// =============================================================================
// Workspace public API
// =============================================================================

Workspace::Workspace() : impl_(new Impl(ProjectConfig{})) {}

Workspace::Workspace(ProjectConfig config) : impl_(new Impl(std::move(config))) {}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

void Workspace::set_project_config(ProjectConfig config)
{
  impl_->config = std::move(config);
  impl_->cache = std::make_unique<java_lens::AnalysisCache>(impl_->parser, impl_->config.analysis);
}

const ProjectConfig & Workspace::project_config() const { return impl_->config; }

void Workspace::set_document(std::string uri, std::string text, std::string language_id)
{
  auto & d = impl_->docs[uri];
  const auto path = java_lens::file_uri_to_path(uri);
  d.file_path = path ? path->string() : std::string{};
  d.uri = std::move(uri);
  d.text = std::move(text);
  d.language_id = std::move(language_id);
}

void Workspace::remove_document(std::string_view uri)
{
  impl_->docs.erase(std::string(uri));
  impl_->cache->evict(uri);
}

bool Workspace::has_document(std::string_view uri) const
{
  return impl_->docs.find(std::string(uri)) != impl_->docs.end();
}

void Workspace::clear()
{
  impl_->docs.clear();
  impl_->cache->clear();
}

std::string Workspace::class_summary_json(std::string_view uri)
{
  const json j = impl_->class_summary_json_impl(uri);
  return j.dump();
}

std::string Workspace::document_symbols_json(std::string_view uri)
{
  const json j = impl_->document_symbols_json_impl(uri);
  return j.dump();
}

std::string Workspace::method_call_graph_json(std::string_view uri, uint32_t byte_offset)
{
  const json j = impl_->method_call_graph_json_impl(uri, byte_offset);
  return j.dump();
}

std::string Workspace::diagnostics_json(std::string_view uri)
{
  const json j = impl_->diagnostics_json_impl(uri);
  return j.dump();
}

std::string Workspace::system_service_json(std::string_view uri)
{
  const json j = impl_->system_service_json_impl(uri);
  return j.dump();
}

std::string Workspace::lifecycle_timeline_json(std::string_view uri)
{
  const json j = impl_->lifecycle_timeline_json_impl(uri);
  return j.dump();
}

std::string Workspace::definition_json(
  std::string_view uri, uint32_t byte_offset, std::string_view root_dir,
  const CancellationFlag * cancel)
{
  const json j = impl_->definition_json_impl(uri, byte_offset, root_dir, cancel);
  return j.dump();
}

std::string Workspace::system_services_scan_json(
  std::string_view root_dir, const CancellationFlag * cancel)
{
  const json j = impl_->system_services_scan_json_impl(root_dir, cancel);
  return j.dump();
}

std::string Workspace::lifecycle_timelines_scan_json(
  std::string_view root_dir, const CancellationFlag * cancel)
{
  const json j = impl_->lifecycle_timelines_scan_json_impl(root_dir, cancel);
  return j.dump();
}

}  // namespace java_lens::lsp
