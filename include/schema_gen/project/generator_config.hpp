// schema_gen/project/generator_config.hpp - Generator configuration (.schemagen.yaml)
//
// Loads, saves and discovers configuration files. YAML is the native
// format; JSON files are accepted as well.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "schema_gen/schema/numeric_bounds.hpp"
#include "schema_gen/schema/tier.hpp"

namespace schema_gen
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete generator configuration.
 */
struct GeneratorConfig
{
  Tier default_tier = Tier::Standard;

  /// Indent the written schema
  bool pretty_output = false;

  /// Run the schema checker on every produced document
  bool validate_schema = false;

  /// Where outputs go when no explicit output path is given
  std::optional<std::filesystem::path> output_directory;

  /// Extensions (without dot) picked up by batch mode; empty = any
  std::vector<std::string> file_extensions = {"json"};

  OverflowPolicy numeric_overflow = OverflowPolicy::Saturate;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  GeneratorConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(GeneratorConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Result of writing a configuration file.
 */
struct ConfigSaveResult
{
  bool success = false;
  std::string error;
};

// ============================================================================
// Configuration API
// ============================================================================

/**
 * Load a configuration file.
 *
 * A missing file yields the default configuration. `.yaml`/`.yml` files
 * are read as YAML, `.json` files as JSON; any other extension fails.
 * A relative `output_directory` is resolved against the file's directory.
 *
 * @param config_path Path to the configuration file
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_config(const std::filesystem::path & config_path);

/**
 * Write a configuration file, choosing the format from the extension
 * the same way load_config() does.
 */
[[nodiscard]] ConfigSaveResult save_config(
  const GeneratorConfig & config, const std::filesystem::path & config_path);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to .schemagen.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_config(
  const std::filesystem::path & start_dir);

/**
 * Overlay command-line flags on a loaded configuration.
 *
 * A flag can only switch an option on; an explicit tier replaces the
 * configured default.
 */
[[nodiscard]] GeneratorConfig merge_with_args(
  GeneratorConfig config, std::optional<Tier> tier, bool pretty, bool validate);

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_config_file_name = ".schemagen.yaml";

}  // namespace schema_gen
