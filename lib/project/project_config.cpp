// java_lens/project/project_config.cpp - Project configuration implementation
//
#include "java_lens/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <vector>

namespace java_lens
{

namespace
{

/// Read a list of strings; `error` is set when the node is not a sequence.
bool read_string_list(
  const YAML::Node & node, const char * key, std::vector<std::string> & out, std::string & error)
{
  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return false;
  }
  std::vector<std::string> values;
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = std::string(key) + " entries must be strings";
      return false;
    }
    values.push_back(item.as<std::string>());
  }
  out = std::move(values);
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  ProjectConfig config;
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;

  // 'analysis' section
  if (const auto analysis = root["analysis"]) {
    if (const auto max_bytes = analysis["max_parse_bytes"]) {
      long long value = 0;
      try {
        value = max_bytes.as<long long>();
      } catch (const YAML::Exception &) {
        return ConfigLoadResult::fail("analysis.max_parse_bytes must be an integer");
      }
      if (value <= 0) {
        return ConfigLoadResult::fail("analysis.max_parse_bytes must be positive");
      }
      config.analysis.max_parse_bytes = static_cast<size_t>(value);
    }
  }

  // 'lifecycle' section
  if (const auto lifecycle = root["lifecycle"]) {
    if (const auto targets = lifecycle["target_files"]) {
      if (!read_string_list(
            targets, "lifecycle.target_files", config.analysis.lifecycle_target_files, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
    if (const auto methods = lifecycle["methods"]) {
      if (!read_string_list(methods, "lifecycle.methods", config.analysis.lifecycle_methods, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  }

  // 'scan' section
  if (const auto scan = root["scan"]) {
    if (const auto exclude = scan["exclude_dirs"]) {
      if (!read_string_list(exclude, "scan.exclude_dirs", config.scan.exclude_dirs, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root);
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result = parse_root(root);
  if (result.success) {
    result.config.project_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // A file path starts the search in its directory
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace java_lens
