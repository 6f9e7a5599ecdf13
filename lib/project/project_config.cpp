// metadoc/project/project_config.cpp - Project configuration implementation
//
#include "metadoc/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace metadoc
{

namespace
{

/// Read a scalar of type T, reporting a typed error instead of throwing
template <typename T>
bool read_scalar(const YAML::Node & node, const char * key, T & out, std::string & error)
{
  const YAML::Node value = node[key];
  if (!value) {
    return true;
  }
  if (!value.IsScalar()) {
    error = std::string(key) + " must be a scalar";
    return false;
  }
  try {
    out = value.as<T>();
  } catch (const YAML::Exception & e) {
    error = "invalid value for " + std::string(key) + ": " + e.what();
    return false;
  }
  return true;
}

std::filesystem::path resolve(const std::filesystem::path & root, const std::string & entry)
{
  const std::filesystem::path p(entry);
  return p.is_absolute() ? p : (root / p).lexically_normal();
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;

  std::string target;
  if (!read_scalar(root, "target", target, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (!target.empty()) {
    config.target = resolve(config.project_root, target);
  }

  if (root["classpath"]) {
    if (!root["classpath"].IsSequence()) {
      return ConfigLoadResult::fail("classpath must be a list");
    }
    for (const auto & entry : root["classpath"]) {
      if (!entry.IsScalar()) {
        return ConfigLoadResult::fail("classpath entries must be strings");
      }
      config.classpath.push_back(resolve(config.project_root, entry.as<std::string>()));
    }
  }

  if (
    !read_scalar(root, "zip", config.zip, error) ||
    !read_scalar(root, "clean_target_first", config.clean_target_first, error) ||
    !read_scalar(root, "non_interactive", config.non_interactive, error)) {
    return ConfigLoadResult::fail(error);
  }

  int threads = 0;
  if (!read_scalar(root, "threads", threads, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (threads < 0) {
    return ConfigLoadResult::fail("threads must not be negative");
  }
  config.threads = static_cast<unsigned>(threads);

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
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

}  // namespace metadoc
