// schema_gen/driver/completion.cpp - Shell completion scripts
#include "schema_gen/driver/completion.hpp"

#include <fmt/core.h>

#include <array>
#include <cctype>

#include "schema_gen/schema/numeric_bounds.hpp"
#include "schema_gen/schema/tier.hpp"

namespace schema_gen
{

namespace
{

enum class ValueHint : uint8_t {
  None,
  File,
  Tier,
  Overflow,
};

struct OptionSpec
{
  const char * short_name;  // without dash, may be null
  const char * long_name;   // without dashes
  ValueHint value;
  const char * help;
};

constexpr std::array<OptionSpec, 10> k_options = {{
  {"o", "output", ValueHint::File, "Output file path"},
  {"t", "tier", ValueHint::Tier, "Schema tier"},
  {"p", "pretty", ValueHint::None, "Pretty-print the JSON output"},
  {"v", "validate", ValueHint::None, "Check the generated schema"},
  {"b", "batch", ValueHint::None, "Treat the input as a glob pattern"},
  {"c", "config", ValueHint::File, "Configuration file"},
  {nullptr, "overflow", ValueHint::Overflow, "Numeric bound overflow policy"},
  {nullptr, "verbose", ValueHint::None, "Print progress"},
  {"h", "help", ValueHint::None, "Show help"},
  {nullptr, "version", ValueHint::None, "Show version"},
}};

struct SubcommandSpec
{
  const char * name;
  const char * help;
};

constexpr std::array<SubcommandSpec, 2> k_subcommands = {{
  {"completion", "Generate a shell completion script"},
  {"init-config", "Write a default configuration file"},
}};

constexpr std::array<const char *, 3> k_shell_names = {"bash", "zsh", "fish"};

std::string tier_list()
{
  std::string out;
  for (const char * name : k_tier_names) {
    if (!out.empty()) out += ' ';
    out += name;
  }
  return out;
}

std::string overflow_list()
{
  return std::string(to_string(OverflowPolicy::Saturate)) + " " + to_string(OverflowPolicy::Error);
}

std::string shell_list()
{
  std::string out;
  for (const char * name : k_shell_names) {
    if (!out.empty()) out += ' ';
    out += name;
  }
  return out;
}

std::string subcommand_list()
{
  std::string out;
  for (const auto & sub : k_subcommands) {
    if (!out.empty()) out += ' ';
    out += sub.name;
  }
  return out;
}

/// Shell function names cannot contain '-' or '.'
std::string function_name(const std::string & program_name)
{
  std::string out = "_";
  for (const char c : program_name) {
    out.push_back(std::isalnum(static_cast<unsigned char>(c)) != 0 ? c : '_');
  }
  return out;
}

// ============================================================================
// bash
// ============================================================================

std::string bash_script(const std::string & program)
{
  std::string all_options;
  std::string file_options;
  for (const auto & opt : k_options) {
    std::string names;
    if (opt.short_name != nullptr) {
      names += fmt::format("-{}", opt.short_name);
    }
    if (!names.empty()) names += ' ';
    names += fmt::format("--{}", opt.long_name);

    if (!all_options.empty()) all_options += ' ';
    all_options += names;

    if (opt.value == ValueHint::File) {
      for (char & c : names) {
        if (c == ' ') c = '|';
      }
      if (!file_options.empty()) file_options += '|';
      file_options += names;
    }
  }

  const std::string fn = function_name(program);

  std::string s;
  s += "# bash completion for " + program + "\n";
  s += fn + "() {\n";
  s += "    local cur prev\n";
  s += "    COMPREPLY=()\n";
  s += "    cur=\"${COMP_WORDS[COMP_CWORD]}\"\n";
  s += "    prev=\"${COMP_WORDS[COMP_CWORD-1]}\"\n";
  s += "\n";
  s += "    case \"${prev}\" in\n";
  s += "        -t|--tier)\n";
  s += "            COMPREPLY=( $(compgen -W \"" + tier_list() + "\" -- \"${cur}\") )\n";
  s += "            return 0\n";
  s += "            ;;\n";
  s += "        --overflow)\n";
  s += "            COMPREPLY=( $(compgen -W \"" + overflow_list() + "\" -- \"${cur}\") )\n";
  s += "            return 0\n";
  s += "            ;;\n";
  s += "        " + file_options + ")\n";
  s += "            COMPREPLY=( $(compgen -f -- \"${cur}\") )\n";
  s += "            return 0\n";
  s += "            ;;\n";
  s += "        completion)\n";
  s += "            COMPREPLY=( $(compgen -W \"" + shell_list() + "\" -- \"${cur}\") )\n";
  s += "            return 0\n";
  s += "            ;;\n";
  s += "    esac\n";
  s += "\n";
  s += "    if [[ \"${cur}\" == -* ]]; then\n";
  s += "        COMPREPLY=( $(compgen -W \"" + all_options + "\" -- \"${cur}\") )\n";
  s += "        return 0\n";
  s += "    fi\n";
  s += "\n";
  s += "    if [[ ${COMP_CWORD} -eq 1 ]]; then\n";
  s += "        COMPREPLY=( $(compgen -W \"" + subcommand_list() +
       "\" -- \"${cur}\") $(compgen -f -- \"${cur}\") )\n";
  s += "        return 0\n";
  s += "    fi\n";
  s += "\n";
  s += "    COMPREPLY=( $(compgen -f -- \"${cur}\") )\n";
  s += "}\n";
  s += "\n";
  s += "complete -F " + fn + " " + program + "\n";
  return s;
}

// ============================================================================
// zsh
// ============================================================================

std::string zsh_action(ValueHint hint)
{
  switch (hint) {
    case ValueHint::None:
      return "";
    case ValueHint::File:
      return ":file:_files";
    case ValueHint::Tier:
      return ":tier:(" + tier_list() + ")";
    case ValueHint::Overflow:
      return ":policy:(" + overflow_list() + ")";
  }
  return "";
}

std::string zsh_script(const std::string & program)
{
  const std::string fn = function_name(program);

  std::string s;
  s += "#compdef " + program + "\n";
  s += "\n";
  s += fn + "() {\n";
  s += "  if (( CURRENT > 2 )) && [[ ${words[2]} == completion ]]; then\n";
  s += "    _values 'shell' " + shell_list() + "\n";
  s += "    return\n";
  s += "  fi\n";
  s += "\n";
  s += "  _arguments -s \\\n";
  for (const auto & opt : k_options) {
    const std::string action = zsh_action(opt.value);
    if (opt.short_name != nullptr) {
      s += fmt::format(
        "    '(-{0} --{1})'{{-{0},--{1}}}'[{2}]{3}' \\\n", opt.short_name, opt.long_name,
        opt.help, action);
    } else {
      s += fmt::format("    '--{0}[{1}]{2}' \\\n", opt.long_name, opt.help, action);
    }
  }
  s += "    '1: :->first' \\\n";
  s += "    '*:file:_files'\n";
  s += "\n";
  s += "  case $state in\n";
  s += "    first)\n";
  s += "      local -a subcommands\n";
  s += "      subcommands=(\n";
  for (const auto & sub : k_subcommands) {
    s += fmt::format("        '{}:{}'\n", sub.name, sub.help);
  }
  s += "      )\n";
  s += "      _describe 'command' subcommands\n";
  s += "      _files\n";
  s += "      ;;\n";
  s += "  esac\n";
  s += "}\n";
  s += "\n";
  s += fn + " \"$@\"\n";
  return s;
}

// ============================================================================
// fish
// ============================================================================

std::string fish_script(const std::string & program)
{
  std::string s;
  s += "# fish completion for " + program + "\n";
  for (const auto & sub : k_subcommands) {
    s += fmt::format(
      "complete -c {} -n '__fish_use_subcommand' -f -a {} -d '{}'\n", program, sub.name, sub.help);
  }
  s += fmt::format(
    "complete -c {} -n '__fish_seen_subcommand_from completion' -f -a '{}'\n", program,
    shell_list());

  for (const auto & opt : k_options) {
    std::string line = "complete -c " + program;
    if (opt.short_name != nullptr) {
      line += fmt::format(" -s {}", opt.short_name);
    }
    line += fmt::format(" -l {}", opt.long_name);
    switch (opt.value) {
      case ValueHint::None:
        break;
      case ValueHint::File:
        line += " -r -F";
        break;
      case ValueHint::Tier:
        line += " -x -a '" + tier_list() + "'";
        break;
      case ValueHint::Overflow:
        line += " -x -a '" + overflow_list() + "'";
        break;
    }
    line += fmt::format(" -d '{}'\n", opt.help);
    s += line;
  }
  return s;
}

}  // namespace

std::optional<Shell> parse_shell(std::string_view name)
{
  if (name == "bash") return Shell::Bash;
  if (name == "zsh") return Shell::Zsh;
  if (name == "fish") return Shell::Fish;
  return std::nullopt;
}

const char * to_string(Shell shell) noexcept
{
  switch (shell) {
    case Shell::Bash:
      return "bash";
    case Shell::Zsh:
      return "zsh";
    case Shell::Fish:
      return "fish";
  }
  return "bash";
}

std::string generate_completion(Shell shell, const std::string & program_name)
{
  switch (shell) {
    case Shell::Bash:
      return bash_script(program_name);
    case Shell::Zsh:
      return zsh_script(program_name);
    case Shell::Fish:
      return fish_script(program_name);
  }
  return bash_script(program_name);
}

}  // namespace schema_gen
