// java_lens/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "java_lens/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace java_lens
{

namespace
{

constexpr std::string_view k_gutter = "      |";

const char * severity_name(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "info";
}

rang::fg severity_color(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::reset;
}

// Tabs are widened to four columns so the marker line stays aligned.
std::string expand_tabs(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  std::string filename = "<unknown>";
  if (source.has_file_path()) {
    const auto & abs_path = source.get_file_path();
    std::error_code ec;
    auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
    filename = (ec || rel_path.empty()) ? abs_path.string() : rel_path.string();
  }

  print_header(diag);

  const FullSourceRange fr = source.get_full_range(diag.primary_range());
  if (fr.is_valid()) {
    fmt::print(os_, "  --> {}:{}:{}\n", filename, fr.start_line, fr.start_column);
  } else {
    fmt::print(os_, "  --> {}\n", filename);
  }
  fmt::print(os_, "{}\n", k_gutter);

  if (const Label * label = diag.primary_label(); label != nullptr && fr.is_valid()) {
    print_snippet(source, fr, label->message);
  }

  if (diag.help_message) {
    fmt::print(os_, "{}\n", k_gutter);
    fmt::print(os_, "   = help: {}\n", *diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  for (const auto * d : sorted) {
    print(*d, source);
  }
}

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string title = diag.code.empty()
                              ? std::string(severity_name(diag.severity))
                              : fmt::format("{}[{}]", severity_name(diag.severity), diag.code);
  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << title << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", title, diag.message);
  }
}

void DiagnosticPrinter::print_snippet(
  const SourceManager & source, const FullSourceRange & fr, std::string_view label_message)
{
  const std::string_view line = source.get_line_text(fr.start_line - 1);
  if (line.empty()) {
    return;
  }

  fmt::print(os_, " {:>4} | {}\n", fr.start_line, expand_tabs(line));

  // Multi-line ranges are underlined on their first line only.
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : fr.start_column + 1;
  const std::string prefix =
    expand_tabs(line.substr(0, std::min<size_t>(fr.start_column - 1, line.size())));
  const std::string blank(prefix.size(), ' ');

  fmt::print(os_, "{} {}", k_gutter, blank);
  if (use_color_) {
    os_ << rang::fg::yellow << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(end_col - fr.start_column, '^'));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

}  // namespace java_lens
