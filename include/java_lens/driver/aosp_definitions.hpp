// java_lens/driver/aosp_definitions.hpp - Go-to-definition into AOSP side files
//
// Jumps from Java source to the places a framework name is declared outside
// Java: SELinux service_contexts, init .rc service blocks and JNI sources.
// Every lookup is a plain text search; the first hit wins.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "java_lens/analysis/analysis_options.hpp"
#include "java_lens/basic/cancellation.hpp"

namespace java_lens
{

enum class DefinitionKind : uint8_t {
  ServiceContext,  // binder service name -> service_contexts
  InitService,     // init service name -> *.rc
  JniMethod,       // native method -> jni/**/*.cpp
};

[[nodiscard]] std::string_view to_string(DefinitionKind kind) noexcept;

/// A quoted string on one line.
struct StringLiteralSpan
{
  std::string text;      // contents without the quotes
  uint32_t start = 0;    // column of the first content byte
  uint32_t end = 0;      // column of the closing quote
};

/**
 * The string literal around `column` (0-based byte column).
 *
 * The opening quote is the last '"' at or before the column, the closing
 * quote the next one after it. Escaped quotes are not recognized.
 */
[[nodiscard]] std::optional<StringLiteralSpan> string_literal_at(
  std::string_view line_text, uint32_t column);

/// The `[A-Za-z0-9_]+` word under or immediately before `column`.
[[nodiscard]] std::optional<std::string> word_at(std::string_view line_text, uint32_t column);

struct DefinitionRequest
{
  DefinitionKind kind = DefinitionKind::ServiceContext;
  std::string symbol;
};

/**
 * Decide what the cursor points at.
 *
 * A non-empty string literal on a line mentioning `publishBinderService` or
 * `addService` is a ServiceContext request; on a line mentioning `start` or
 * `init` an InitService request. Otherwise a line containing the word
 * `native` is a JniMethod request for the word under the cursor.
 */
[[nodiscard]] std::optional<DefinitionRequest> classify_definition(
  std::string_view line_text, uint32_t column);

/// A location in a side file. `line` and `column` are 0-based.
struct DefinitionLocation
{
  std::filesystem::path path;
  uint32_t line = 0;
  uint32_t column = 0;
};

/**
 * Search `root` for the declaration named by `request`.
 *
 * Files are visited in sorted path order, skipping excluded directories.
 * Returns nothing when nothing matches or the search was cancelled.
 */
[[nodiscard]] std::optional<DefinitionLocation> find_definition(
  const std::filesystem::path & root, const DefinitionRequest & request,
  const ScanOptions & options, const CancellationFlag * cancel = nullptr);

}  // namespace java_lens
