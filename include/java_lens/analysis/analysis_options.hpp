// java_lens/analysis/analysis_options.hpp - Tunables of the analysis engine and host scans
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace java_lens
{

/// Files larger than this are not parsed (1 MiB).
inline constexpr size_t k_default_max_parse_bytes = size_t{1024} * size_t{1024};

struct AnalysisOptions
{
  size_t max_parse_bytes = k_default_max_parse_bytes;

  /// File names whose declarations form a lifecycle timeline, in scan order.
  std::vector<std::string> lifecycle_target_files = {"ZygoteInit.java", "SystemServer.java"};

  /// Method names reported on a lifecycle timeline.
  std::vector<std::string> lifecycle_methods = {
    "main",
    "startBootstrapServices",
    "startCoreServices",
    "startOtherServices",
  };
};

/// Options of host-side workspace scans.
struct ScanOptions
{
  /// Directory names never descended into.
  std::vector<std::string> exclude_dirs = {"out", "build", ".gradle", "node_modules"};
};

}  // namespace java_lens
