// schema_gen/driver/completion.hpp - Shell completion scripts
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace schema_gen
{

enum class Shell : uint8_t {
  Bash,
  Zsh,
  Fish,
};

/// Case-sensitive lookup ("bash", "zsh", "fish")
[[nodiscard]] std::optional<Shell> parse_shell(std::string_view name);

[[nodiscard]] const char * to_string(Shell shell) noexcept;

/**
 * Generate a completion script for the command-line tool.
 *
 * The script completes subcommands, options, tier names and overflow
 * policy names, and falls back to file names for positional arguments.
 *
 * @param shell Target shell
 * @param program_name Name the tool is invoked as
 */
[[nodiscard]] std::string generate_completion(Shell shell, const std::string & program_name);

}  // namespace schema_gen
