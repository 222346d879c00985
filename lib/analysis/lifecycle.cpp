// java_lens/analysis/lifecycle.cpp - Android framework lifecycle heuristics
#include "java_lens/analysis/lifecycle.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>

namespace java_lens
{

namespace
{

bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

bool extends_system_service(std::string_view class_header) noexcept
{
  constexpr std::string_view k_extends = "extends";
  constexpr std::string_view k_base = "SystemService";

  size_t pos = class_header.find(k_extends);
  while (pos != std::string_view::npos) {
    size_t i = pos + k_extends.size();
    const size_t ws_begin = i;
    while (i < class_header.size() && is_space(class_header[i])) {
      ++i;
    }
    if (i > ws_begin && class_header.substr(i, k_base.size()) == k_base) {
      return true;
    }
    pos = class_header.find(k_extends, pos + 1);
  }
  return false;
}

std::optional<std::string> first_quoted_text(std::string_view line)
{
  for (size_t i = 0; i < line.size(); ++i) {
    if (line[i] != '"') {
      continue;
    }
    const size_t close = line.find('"', i + 1);
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    if (close > i + 1) {
      return std::string(line.substr(i + 1, close - i - 1));
    }
  }
  return std::nullopt;
}

std::optional<SystemServiceSummary> detect_system_service(
  std::string_view class_name, std::string_view class_header,
  const std::vector<MethodDecl> & decls, const std::vector<MethodInvocation> & invocations,
  const SourceManager & source)
{
  if (!extends_system_service(class_header)) {
    return std::nullopt;
  }

  SystemServiceSummary out;
  out.service_class = std::string(class_name);

  const auto on_start = std::find_if(
    decls.begin(), decls.end(), [](const MethodDecl & d) { return d.name == "onStart"; });
  if (on_start != decls.end()) {
    out.on_start_line = on_start->start_line;
  }

  for (const auto & decl : decls) {
    if (decl.name == "onBootPhase") {
      out.on_boot_phases.push_back(decl.start_line);
    }
  }

  for (const auto & invocation : invocations) {
    if (invocation.name != "publishBinderService" && invocation.name != "addService") {
      continue;
    }
    const std::string_view line_text =
      invocation.line > 0 ? source.get_line_text(invocation.line - 1) : std::string_view();

    BinderServiceRegistration registration;
    registration.name = first_quoted_text(line_text).value_or(std::string(k_unknown_binder_name));
    registration.line = invocation.line;
    out.binder_services.push_back(std::move(registration));
  }
  return out;
}

bool is_lifecycle_target(std::string_view file_path, const AnalysisOptions & options)
{
  const std::string base = std::filesystem::path(std::string(file_path)).filename().string();
  return std::find(options.lifecycle_target_files.begin(), options.lifecycle_target_files.end(),
                   base) != options.lifecycle_target_files.end();
}

LifecycleTimeline build_lifecycle_timeline(
  std::string_view file_path, std::string_view class_name, const std::vector<MethodDecl> & decls,
  const AnalysisOptions & options)
{
  LifecycleTimeline timeline;
  timeline.file_path = std::string(file_path);
  timeline.class_name = std::string(class_name);

  for (const auto & decl : decls) {
    const bool wanted =
      std::find(options.lifecycle_methods.begin(), options.lifecycle_methods.end(), decl.name) !=
      options.lifecycle_methods.end();
    if (wanted) {
      timeline.entries.push_back(LifecycleEntry{decl.name, decl.start_line});
    }
  }

  std::stable_sort(
    timeline.entries.begin(), timeline.entries.end(),
    [](const LifecycleEntry & a, const LifecycleEntry & b) { return a.line < b.line; });
  return timeline;
}

std::string format_timeline_label(const LifecycleTimeline & timeline)
{
  const std::string file = std::filesystem::path(timeline.file_path).filename().string();
  return fmt::format("{} ({})", timeline.class_name, file);
}

}  // namespace java_lens
