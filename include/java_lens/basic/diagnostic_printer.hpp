// java_lens/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "java_lens/basic/diagnostic.hpp"
#include "java_lens/basic/source_manager.hpp"

namespace java_lens
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[JL001]: Binder call inside synchronized block may block other threads.
 *     --> services/core/Foo.java:42:9
 *      |
 *   42 |         synchronized (mLock) {
 *      |         ^^^^^^^^^^^^
 *      |
 *      = help: move the binder call outside the lock
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print a single diagnostic against the file it was reported for.
  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print all diagnostics from a DiagnosticBag, ordered by location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_header(const Diagnostic & diag);

  void print_snippet(
    const SourceManager & source, const FullSourceRange & fr, std::string_view label_message);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace java_lens
