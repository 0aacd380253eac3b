// schema_gen/project/generator_config.cpp - Generator configuration implementation
//
#include "schema_gen/project/generator_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

namespace schema_gen
{

namespace
{

enum class ConfigFormat {
  Yaml,
  Json,
};

std::optional<ConfigFormat> format_of(const std::filesystem::path & path)
{
  std::string ext = path.extension().string();
  for (auto & c : ext) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (ext == ".yaml" || ext == ".yml") return ConfigFormat::Yaml;
  if (ext == ".json") return ConfigFormat::Json;
  return std::nullopt;
}

std::string unsupported_format_message(const std::filesystem::path & path)
{
  return "unsupported configuration format '" + path.extension().string() +
         "' (expected .yaml, .yml or .json): " + path.string();
}

/// Shared field validation for both formats
bool apply_tier(const std::string & name, GeneratorConfig & config, std::string & error)
{
  const auto tier = parse_tier(name);
  if (!tier) {
    error = "invalid default_tier: '" + name +
            "' (must be 'basic', 'standard', 'comprehensive' or 'expert')";
    return false;
  }
  config.default_tier = *tier;
  return true;
}

bool apply_overflow(const std::string & name, GeneratorConfig & config, std::string & error)
{
  const auto policy = parse_overflow_policy(name);
  if (!policy) {
    error = "invalid numeric_overflow: '" + name + "' (must be 'saturate' or 'error')";
    return false;
  }
  config.numeric_overflow = *policy;
  return true;
}

// ============================================================================
// YAML
// ============================================================================

ConfigLoadResult parse_yaml(const std::filesystem::path & config_path)
{
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  GeneratorConfig config;

  // An empty document is a valid, all-default configuration
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;
  try {
    if (root["default_tier"]) {
      if (!apply_tier(root["default_tier"].as<std::string>(), config, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
    if (root["pretty_output"]) {
      config.pretty_output = root["pretty_output"].as<bool>();
    }
    if (root["validate_schema"]) {
      config.validate_schema = root["validate_schema"].as<bool>();
    }
    if (root["output_directory"] && !root["output_directory"].IsNull()) {
      config.output_directory = root["output_directory"].as<std::string>();
    }
    if (root["file_extensions"]) {
      if (!root["file_extensions"].IsSequence()) {
        return ConfigLoadResult::fail("file_extensions must be a list");
      }
      config.file_extensions.clear();
      for (const auto & ext : root["file_extensions"]) {
        config.file_extensions.push_back(ext.as<std::string>());
      }
    }
    if (root["numeric_overflow"]) {
      if (!apply_overflow(root["numeric_overflow"].as<std::string>(), config, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

void emit_yaml(const GeneratorConfig & config, YAML::Emitter & out)
{
  out << YAML::BeginMap;
  out << YAML::Key << "default_tier" << YAML::Value << to_string(config.default_tier);
  out << YAML::Key << "pretty_output" << YAML::Value << config.pretty_output;
  out << YAML::Key << "validate_schema" << YAML::Value << config.validate_schema;
  if (config.output_directory) {
    out << YAML::Key << "output_directory" << YAML::Value << config.output_directory->string();
  }
  out << YAML::Key << "file_extensions" << YAML::Value << YAML::Flow << config.file_extensions;
  out << YAML::Key << "numeric_overflow" << YAML::Value << to_string(config.numeric_overflow);
  out << YAML::EndMap;
}

// ============================================================================
// JSON
// ============================================================================

ConfigLoadResult parse_json(const std::filesystem::path & config_path)
{
  std::ifstream in(config_path);
  if (!in) {
    return ConfigLoadResult::fail("failed to open configuration file: " + config_path.string());
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error & e) {
    return ConfigLoadResult::fail("failed to parse JSON: " + std::string(e.what()));
  }

  if (!root.is_object()) {
    return ConfigLoadResult::fail("configuration root must be an object");
  }

  GeneratorConfig config;
  std::string error;
  try {
    if (root.contains("default_tier")) {
      if (!apply_tier(root.at("default_tier").get<std::string>(), config, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
    if (root.contains("pretty_output")) {
      config.pretty_output = root.at("pretty_output").get<bool>();
    }
    if (root.contains("validate_schema")) {
      config.validate_schema = root.at("validate_schema").get<bool>();
    }
    if (root.contains("output_directory") && !root.at("output_directory").is_null()) {
      config.output_directory = root.at("output_directory").get<std::string>();
    }
    if (root.contains("file_extensions")) {
      if (!root.at("file_extensions").is_array()) {
        return ConfigLoadResult::fail("file_extensions must be a list");
      }
      config.file_extensions = root.at("file_extensions").get<std::vector<std::string>>();
    }
    if (root.contains("numeric_overflow")) {
      if (!apply_overflow(root.at("numeric_overflow").get<std::string>(), config, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  } catch (const nlohmann::json::exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

nlohmann::json config_to_json(const GeneratorConfig & config)
{
  nlohmann::json root;
  root["default_tier"] = to_string(config.default_tier);
  root["pretty_output"] = config.pretty_output;
  root["validate_schema"] = config.validate_schema;
  if (config.output_directory) {
    root["output_directory"] = config.output_directory->string();
  }
  root["file_extensions"] = config.file_extensions;
  root["numeric_overflow"] = to_string(config.numeric_overflow);
  return root;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

ConfigLoadResult load_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Missing file: fall back to defaults
  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::ok(GeneratorConfig{});
  }

  const auto format = format_of(config_path);
  if (!format) {
    return ConfigLoadResult::fail(unsupported_format_message(config_path));
  }

  ConfigLoadResult result =
    *format == ConfigFormat::Yaml ? parse_yaml(config_path) : parse_json(config_path);

  if (result.success && result.config.output_directory &&
      result.config.output_directory->is_relative()) {
    const fs::path root = fs::absolute(config_path).parent_path();
    result.config.output_directory = (root / *result.config.output_directory).lexically_normal();
  }

  return result;
}

ConfigSaveResult save_config(
  const GeneratorConfig & config, const std::filesystem::path & config_path)
{
  ConfigSaveResult result;

  const auto format = format_of(config_path);
  if (!format) {
    result.error = unsupported_format_message(config_path);
    return result;
  }

  std::ofstream out(config_path, std::ios::out | std::ios::trunc);
  if (!out) {
    result.error = "failed to open configuration file for writing: " + config_path.string();
    return result;
  }

  if (*format == ConfigFormat::Yaml) {
    YAML::Emitter emitter;
    emit_yaml(config, emitter);
    if (!emitter.good()) {
      result.error = "failed to emit YAML: " + emitter.GetLastError();
      return result;
    }
    out << emitter.c_str() << '\n';
  } else {
    out << config_to_json(config).dump(2) << '\n';
  }

  if (!out) {
    result.error = "failed to write configuration file: " + config_path.string();
    return result;
  }

  result.success = true;
  return result;
}

std::optional<std::filesystem::path> find_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_config_file_name;
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

GeneratorConfig merge_with_args(
  GeneratorConfig config, std::optional<Tier> tier, bool pretty, bool validate)
{
  if (tier) {
    config.default_tier = *tier;
  }
  config.pretty_output = config.pretty_output || pretty;
  config.validate_schema = config.validate_schema || validate;
  return config;
}

}  // namespace schema_gen
