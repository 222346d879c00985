// jlens - java_lens Command Line Interface
//
// Usage:
//   jlens summary <file.java>
//   jlens callgraph <file.java> --line N [--column C]
//   jlens locks <file.java>
//   jlens services [dir]
//   jlens lifecycle [dir]
//
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "java_lens/analysis/analysis_cache.hpp"
#include "java_lens/analysis/call_graph.hpp"
#include "java_lens/analysis/concurrency.hpp"
#include "java_lens/analysis/file_analysis.hpp"
#include "java_lens/analysis/json_export.hpp"
#include "java_lens/analysis/lifecycle.hpp"
#include "java_lens/basic/diagnostic_printer.hpp"
#include "java_lens/basic/source_manager.hpp"
#include "java_lens/driver/workspace_scan.hpp"
#include "java_lens/project/project_config.hpp"
#include "java_lens/syntax/parser.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "java_lens v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  summary <file.java>      Print the class summary\n"
            << "  callgraph <file.java>    Print callers/callees of the method at --line\n"
            << "  locks <file.java>        Report lock hazards (exit 1 if any)\n"
            << "  services [dir]           List SystemService subclasses under dir\n"
            << "  lifecycle [dir]          Print framework lifecycle timelines under dir\n\n"
            << "Options:\n"
            << "  --line <N>               1-based line for callgraph\n"
            << "  --column <C>             1-based column for callgraph\n"
            << "  --json                   Machine-readable output\n"
            << "  --config <path>          Use this java_lens.yaml\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input;
  std::string config_path;
  std::optional<uint32_t> line;
  std::optional<uint32_t> column;
  bool json_output = false;
  bool verbose = false;
  bool show_help = false;
};

/// Decimal digits only; stoull alone would accept a sign or leading blanks.
std::optional<uint32_t> parse_positive(const std::string & text)
{
  if (text.empty() || text[0] < '0' || text[0] > '9') {
    return std::nullopt;
  }
  try {
    size_t used = 0;
    const unsigned long long value = std::stoull(text, &used);
    if (used != text.size() || value == 0 || value > std::numeric_limits<uint32_t>::max()) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(value);
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--line") {
      if (i + 1 < argc) {
        args.line = parse_positive(argv[++i]);
      }
    } else if (arg == "--column") {
      if (i + 1 < argc) {
        args.column = parse_positive(argv[++i]);
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--json") {
      args.json_output = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input.empty()) {
      args.input = arg;
    }
  }

  return args;
}

// ============================================================================
// Shared helpers
// ============================================================================

/// Explicit --config, else java_lens.yaml above the working directory, else defaults.
std::optional<java_lens::ProjectConfig> load_config(const CommandArgs & args)
{
  std::optional<fs::path> path;
  if (!args.config_path.empty()) {
    path = fs::path(args.config_path);
  } else {
    path = java_lens::find_project_config(fs::current_path());
  }

  if (!path) {
    if (args.verbose) {
      std::cerr << "Using built-in defaults (no " << java_lens::k_project_config_file_name
                << " found)\n";
    }
    return java_lens::ProjectConfig{};
  }

  auto result = java_lens::load_project_config(*path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    std::cerr << "Using config: " << path->string() << "\n";
  }
  return std::move(result.config);
}

struct LoadedFile
{
  fs::path path;
  java_lens::SourceManager source;
};

std::optional<LoadedFile> load_java_file(const CommandArgs & args)
{
  if (args.input.empty()) {
    std::cerr << "usage: jlens " << args.command << " <file.java>\n";
    return std::nullopt;
  }

  const fs::path path = fs::absolute(args.input);
  if (!fs::exists(path)) {
    std::cerr << "error: file not found: " << path.string() << "\n";
    return std::nullopt;
  }

  auto text = java_lens::read_file_to_string(path);
  if (!text) {
    std::cerr << "error: failed to open file: " << path.string() << "\n";
    return std::nullopt;
  }
  return LoadedFile{path, java_lens::SourceManager(path, std::move(*text))};
}

/// Analyze one file; prints the reason and returns nothing when unavailable.
std::shared_ptr<const java_lens::FileAnalysis> analyze_file(
  java_lens::AnalysisCache & cache, const LoadedFile & file)
{
  java_lens::DocumentInput doc;
  doc.uri = java_lens::path_to_file_uri(file.path);
  doc.file_path = file.path.string();
  doc.text = std::string(file.source.get_source());

  const auto result = cache.get_analysis(doc);
  if (result.is_ok()) {
    return result.analysis;
  }

  std::cerr << "error: " << file.path.string() << ": Java analysis "
            << java_lens::to_string(result.status);
  if (!result.errors.empty()) {
    const auto & e = result.errors.front();
    const auto lc = file.source.get_line_column(e.range.get_begin().get_offset());
    std::cerr << " (" << e.message << " at " << lc.line << ":" << lc.column << ")";
  }
  std::cerr << "\n";
  return nullptr;
}

fs::path scan_root(const CommandArgs & args)
{
  return args.input.empty() ? fs::current_path() : fs::absolute(args.input);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_summary(const CommandArgs & args)
{
  const auto config = load_config(args);
  const auto file = load_java_file(args);
  if (!config || !file) {
    return 1;
  }

  java_lens::JavaParser parser;
  java_lens::AnalysisCache cache(parser, config->analysis);

  java_lens::DocumentInput doc;
  doc.uri = java_lens::path_to_file_uri(file->path);
  doc.file_path = file->path.string();
  doc.text = std::string(file->source.get_source());
  const auto result = cache.get_analysis(doc);

  // A file that does not parse still gets a summary, named after the file.
  std::shared_ptr<const java_lens::FileAnalysis> analysis = result.analysis;
  if (!result.is_ok()) {
    std::cerr << "warning: " << file->path.string() << ": Java analysis "
              << java_lens::to_string(result.status) << ", showing a fallback summary\n";
    auto fallback = java_lens::empty_analysis(java_lens::fallback_class_name(doc.file_path));
    fallback.summary = java_lens::summarize_java_source(
      parser, doc.text, java_lens::fallback_class_name(doc.file_path));
    analysis = std::make_shared<const java_lens::FileAnalysis>(std::move(fallback));
  }

  if (args.json_output) {
    std::cout << json(*analysis).dump(2) << "\n";
    return 0;
  }

  const auto & s = analysis->summary;
  std::cout << "class " << s.class_name;
  if (!s.package_name.empty()) {
    std::cout << " (package " << s.package_name << ")";
  }
  std::cout << "\n";

  std::cout << "  fields:\n";
  for (const auto & f : s.fields) {
    std::cout << "    " << java_lens::to_string(f.visibility) << (f.is_static ? " static " : " ")
              << f.type << " " << f.name << "  line " << f.start_line << "\n";
  }
  std::cout << "  methods:\n";
  for (const auto & m : s.methods) {
    std::cout << "    " << java_lens::to_string(m.visibility) << (m.is_static ? " static " : " ")
              << m.name << "(" << m.params_count << ")  line " << m.start_line << "\n";
  }
  if (!s.inner_classes.empty()) {
    std::cout << "  inner classes:\n";
    for (const auto & name : s.inner_classes) {
      std::cout << "    " << name << "\n";
    }
  }
  if (analysis->system_service) {
    const auto & svc = *analysis->system_service;
    std::cout << "  system service: onStart ";
    if (svc.on_start_line) {
      std::cout << "@" << *svc.on_start_line;
    } else {
      std::cout << "-";
    }
    std::cout << "\n";
  }
  return 0;
}

int cmd_callgraph(const CommandArgs & args)
{
  if (!args.line) {
    std::cerr << "usage: jlens callgraph <file.java> --line N [--column C]\n";
    return 1;
  }

  const auto config = load_config(args);
  const auto file = load_java_file(args);
  if (!config || !file) {
    return 1;
  }

  const auto & sm = file->source;
  if (*args.line > sm.get_line_count()) {
    std::cerr << "error: line " << *args.line << " is past the end of the file\n";
    return 1;
  }

  // Without --column, use the first non-blank character of the line.
  const std::string_view line_text = sm.get_line_text(*args.line - 1);
  uint32_t column0 = 0;
  if (args.column) {
    column0 = std::min<uint32_t>(*args.column - 1, static_cast<uint32_t>(line_text.size()));
  } else {
    while (column0 < line_text.size() && (line_text[column0] == ' ' || line_text[column0] == '\t')) {
      ++column0;
    }
  }
  const uint32_t offset = sm.line_starts()[*args.line - 1] + column0;

  java_lens::JavaParser parser;
  java_lens::AnalysisCache cache(parser, config->analysis);
  const auto analysis = analyze_file(cache, *file);
  if (!analysis) {
    return 1;
  }

  const auto graph = java_lens::build_method_call_graph(
    analysis->method_decls, analysis->method_invocations, analysis->summary.class_name,
    file->path.string(), offset);

  if (args.json_output) {
    std::cout << (graph ? json(*graph) : json(nullptr)).dump(2) << "\n";
    return graph ? 0 : 1;
  }

  if (!graph) {
    std::cerr << "error: no method declaration at line " << *args.line << "\n";
    return 1;
  }

  std::cout << graph->method << "\n";
  std::cout << "  callers:\n";
  for (const auto & ref : graph->callers) {
    std::cout << "    " << java_lens::format_method_ref(ref) << "\n";
  }
  std::cout << "  callees:\n";
  for (const auto & ref : graph->callees) {
    std::cout << "    " << java_lens::format_method_ref(ref) << "\n";
  }
  return 0;
}

int cmd_locks(const CommandArgs & args)
{
  const auto file = load_java_file(args);
  if (!file) {
    return 1;
  }

  java_lens::DiagnosticBag diags;
  java_lens::report_concurrency_warnings(java_lens::analyze_concurrency(file->source), diags);

  if (args.json_output) {
    json out = json::array();
    for (const auto & d : diags) {
      out.push_back(java_lens::diagnostic_to_json(d, file->source));
    }
    std::cout << out.dump(2) << "\n";
  } else {
    // Detect if terminal supports colors (simple check for TTY)
    const bool use_color = isatty(fileno(stderr)) != 0;
    java_lens::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(diags, file->source);
    if (args.verbose) {
      std::cerr << diags.size() << " lock hazard(s) in " << file->path.string() << "\n";
    }
  }

  return diags.has_warnings() ? 1 : 0;
}

int cmd_services(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) {
    return 1;
  }

  const fs::path root = scan_root(args);
  java_lens::JavaParser parser;
  java_lens::AnalysisCache cache(parser, config->analysis);
  const auto entries = java_lens::scan_system_services(cache, root, config->scan);

  if (args.verbose) {
    std::cerr << "Analyzed " << cache.size() << " Java file(s) under " << root.string() << "\n";
  }

  if (args.json_output) {
    json out = json::array();
    for (const auto & e : entries) {
      out.push_back(json{{"filePath", e.file_path}, {"summary", e.summary}});
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  if (entries.empty()) {
    std::cout << "No SystemService classes found\n";
    return 0;
  }

  for (const auto & e : entries) {
    const auto & s = e.summary;
    std::cout << s.service_class << "  (" << e.file_path << ")\n";
    std::cout << "  onStart: ";
    if (s.on_start_line) {
      std::cout << "line " << *s.on_start_line << "\n";
    } else {
      std::cout << "-\n";
    }
    for (const auto line : s.on_boot_phases) {
      std::cout << "  onBootPhase: line " << line << "\n";
    }
    for (const auto & b : s.binder_services) {
      std::cout << "  binder service \"" << b.name << "\": line " << b.line << "\n";
    }
  }
  return 0;
}

int cmd_lifecycle(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) {
    return 1;
  }

  const fs::path root = scan_root(args);
  java_lens::JavaParser parser;
  java_lens::AnalysisCache cache(parser, config->analysis);
  const auto timelines = java_lens::build_lifecycle_timelines(cache, root, config->scan);

  if (args.json_output) {
    std::cout << json(timelines).dump(2) << "\n";
    return 0;
  }

  if (timelines.empty()) {
    std::cout << "No lifecycle files found\n";
    return 0;
  }

  for (const auto & t : timelines) {
    std::cout << java_lens::format_timeline_label(t) << "\n";
    if (t.entries.empty()) {
      std::cout << "  No lifecycle methods found\n";
      continue;
    }
    for (const auto & e : t.entries) {
      std::cout << "  " << e.name << "  line " << e.line << "\n";
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  try {
    const CommandArgs args = parse_args(argc, argv);

    if (args.show_help) {
      print_usage(argv[0]);
      return 0;
    }

    if (args.command == "summary") {
      return cmd_summary(args);
    }

    if (args.command == "callgraph") {
      return cmd_callgraph(args);
    }

    if (args.command == "locks") {
      return cmd_locks(args);
    }

    if (args.command == "services") {
      return cmd_services(args);
    }

    if (args.command == "lifecycle") {
      return cmd_lifecycle(args);
    }

    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    return 1;
  } catch (const std::exception & e) {
    std::cerr << "jlens: fatal error: " << e.what() << "\n";
    return 1;
  }
}
