// declref/project/project_config.cpp - Project configuration implementation
//
#include "declref/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace declref
{

namespace
{

/// Parse the 'checker.unresolved' value
std::optional<Severity> parse_unresolved_severity(const std::string & text)
{
  if (text == "error") {
    return Severity::Error;
  }
  if (text == "warning") {
    return Severity::Warning;
  }
  return std::nullopt;
}

ConfigLoadResult parse_config(const YAML::Node & root, const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
  }

  // Parse 'model'
  if (!root["model"]) {
    return ConfigLoadResult::fail("missing 'model': path to the API model file");
  }
  config.model = root["model"].as<std::string>();

  // Parse 'references'
  if (root["references"]) {
    if (!root["references"].IsSequence()) {
      return ConfigLoadResult::fail("references must be a list");
    }
    for (const auto & ref : root["references"]) {
      config.references.emplace_back(ref.as<std::string>());
    }
  }

  // Parse 'checker' section
  if (root["checker"]) {
    const auto & checker = root["checker"];
    if (checker["unresolved"]) {
      const std::string text = checker["unresolved"].as<std::string>();
      const auto severity = parse_unresolved_severity(text);
      if (!severity) {
        return ConfigLoadResult::fail(
          "invalid checker.unresolved: '" + text + "' (must be 'error' or 'warning')");
      }
      config.checker.unresolved_severity = *severity;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML; conversion errors surface as YAML::Exception as well
  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_config(root, config_path);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace declref
