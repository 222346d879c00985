// java_lens/lsp/lsp.hpp - LSP-like language service APIs (serverless)
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "java_lens/basic/cancellation.hpp"
#include "java_lens/project/project_config.hpp"

namespace java_lens::lsp
{

/**
 * Serverless language service for Java sources.
 *
 * Owns one JavaParser and one AnalysisCache for its whole lifetime. Every
 * query returns a JSON document; the host (the stdio LSP server, an editor
 * extension, tests) translates it into its own protocol.
 *
 * Positions going in are UTF-8 byte offsets. Ranges coming out carry
 * 1-based line/column plus byte offsets. Every per-document payload has a
 * "status" of "ok", "not-applicable", "unavailable" or "cancelled".
 */
class Workspace
{
public:
  Workspace();
  explicit Workspace(ProjectConfig config);
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  /// Replace the configuration. Drops every cached analysis.
  void set_project_config(ProjectConfig config);
  [[nodiscard]] const ProjectConfig & project_config() const;

  void set_document(std::string uri, std::string text, std::string language_id = "java");
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;
  void clear();

  // Structure
  std::string class_summary_json(std::string_view uri);
  std::string document_symbols_json(std::string_view uri);

  // Call graph of the method under the cursor
  std::string method_call_graph_json(std::string_view uri, uint32_t byte_offset);

  // Concurrency warnings (+ JL100 when the text does not parse)
  std::string diagnostics_json(std::string_view uri);

  // Framework heuristics for one document
  std::string system_service_json(std::string_view uri);
  std::string lifecycle_timeline_json(std::string_view uri);

  // Go-to-definition into service_contexts / *.rc / JNI sources under root_dir
  std::string definition_json(
    std::string_view uri, uint32_t byte_offset, std::string_view root_dir,
    const CancellationFlag * cancel = nullptr);

  // Scans of every Java file under root_dir (not limited to open documents)
  std::string system_services_scan_json(
    std::string_view root_dir, const CancellationFlag * cancel = nullptr);
  std::string lifecycle_timelines_scan_json(
    std::string_view root_dir, const CancellationFlag * cancel = nullptr);

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace java_lens::lsp
