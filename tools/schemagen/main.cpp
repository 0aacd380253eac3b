// schemagen - JSON Schema generator command line interface
//
// Usage:
//   schemagen [options] <input.json>
//   schemagen --batch [options] '<glob>'
//   schemagen completion <bash|zsh|fish>
//   schemagen init-config [path]
//
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "schema_gen/basic/diagnostic_printer.hpp"
#include "schema_gen/driver/completion.hpp"
#include "schema_gen/driver/generator_driver.hpp"
#include "schema_gen/project/generator_config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr const char * k_program_name = "schemagen";
constexpr const char * k_version = "0.1.0";

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(std::ostream & os)
{
  os << "JSON Schema generator v" << k_version << "\n\n"
     << "Usage: " << k_program_name << " [options] <input>\n"
     << "       " << k_program_name << " completion <bash|zsh|fish>\n"
     << "       " << k_program_name << " init-config [path]\n\n"
     << "Commands:\n"
     << "  completion <shell>       Print a shell completion script\n"
     << "  init-config [path]       Write a default configuration (.schemagen.yaml)\n\n"
     << "Options:\n"
     << "  -o, --output <file>      Output file (default: <input>.schema.json)\n"
     << "  -t, --tier <tier>        basic | standard | comprehensive | expert\n"
     << "  -p, --pretty             Pretty-print the JSON output\n"
     << "  -v, --validate           Check the generated schema before writing it\n"
     << "  -b, --batch              Treat <input> as a glob pattern\n"
     << "  -c, --config <file>      Configuration file (.yaml, .yml or .json)\n"
     << "  --overflow <policy>      saturate | error (numeric bound overflow)\n"
     << "  --verbose                Print progress to stderr\n"
     << "  -h, --help               Show this help message\n"
     << "  --version                Show version\n";
}

bool stderr_is_tty()
{
  return isatty(fileno(stderr)) != 0;
}

void print_diagnostics(
  const schema_gen::DiagnosticBag & diagnostics, const schema_gen::SourceFile * source)
{
  schema_gen::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  printer.print_all(diagnostics, source);
}

/// Report a CLI-level failure the same way the driver reports its own
void report_error(const std::string & code, const std::string & message, std::string help = {})
{
  schema_gen::DiagnosticBag diags;
  {
    auto builder = diags.report_error(message);
    builder.with_code(code);
    if (!help.empty()) {
      builder.with_help(std::move(help));
    }
  }
  print_diagnostics(diags, nullptr);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;  // "", "completion" or "init-config"
  std::vector<std::string> positionals;
  std::optional<std::string> output_path;
  std::optional<std::string> tier;
  std::optional<std::string> overflow;
  std::optional<std::string> config_path;
  bool pretty = false;
  bool validate = false;
  bool batch = false;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;

  /// Set when the command line is malformed
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  auto take_value = [&](int & i, const std::string & flag) -> std::optional<std::string> {
    if (i + 1 < argc) {
      return std::string(argv[++i]);
    }
    args.error = "missing value for option '" + flag + "'";
    return std::nullopt;
  };

  for (int i = 1; i < argc && args.error.empty(); ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      args.output_path = take_value(i, arg);
    } else if (arg == "-t" || arg == "--tier") {
      args.tier = take_value(i, arg);
    } else if (arg == "-c" || arg == "--config") {
      args.config_path = take_value(i, arg);
    } else if (arg == "--overflow") {
      args.overflow = take_value(i, arg);
    } else if (arg == "-p" || arg == "--pretty") {
      args.pretty = true;
    } else if (arg == "-v" || arg == "--validate") {
      args.validate = true;
    } else if (arg == "-b" || arg == "--batch") {
      args.batch = true;
    } else if (arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "--version") {
      args.show_version = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else if (
      args.command.empty() && args.positionals.empty() &&
      (arg == "completion" || arg == "init-config")) {
      args.command = arg;
    } else {
      args.positionals.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_completion(const CommandArgs & args)
{
  if (args.positionals.empty()) {
    std::cerr << "error: shell name required\n";
    std::cerr << "usage: " << k_program_name << " completion <bash|zsh|fish>\n";
    return 1;
  }

  const auto shell = schema_gen::parse_shell(args.positionals.front());
  if (!shell) {
    std::cerr << "error: unsupported shell '" << args.positionals.front()
              << "' (expected bash, zsh or fish)\n";
    return 1;
  }

  std::cout << schema_gen::generate_completion(*shell, k_program_name);
  return 0;
}

int cmd_init_config(const CommandArgs & args)
{
  const fs::path config_path = args.positionals.empty()
                                 ? fs::path(schema_gen::k_config_file_name)
                                 : fs::path(args.positionals.front());

  if (fs::exists(config_path)) {
    std::cerr << "error: configuration file already exists: " << config_path.string() << "\n";
    return 1;
  }

  const auto saved = schema_gen::save_config(schema_gen::GeneratorConfig{}, config_path);
  if (!saved.success) {
    report_error(schema_gen::diag_code::k_config_error, saved.error);
    return 1;
  }

  std::cout << "Created configuration file: " << config_path.string() << "\n";
  return 0;
}

/// Load the configuration named by -c, else the nearest .schemagen.yaml
std::optional<schema_gen::GeneratorConfig> resolve_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (args.config_path) {
    config_path = fs::path(*args.config_path);
  } else {
    config_path = schema_gen::find_config(fs::current_path());
  }

  if (!config_path) {
    return schema_gen::GeneratorConfig{};
  }

  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }

  auto loaded = schema_gen::load_config(*config_path);
  if (!loaded.success) {
    report_error(
      schema_gen::diag_code::k_config_error, loaded.error,
      "fix or remove " + config_path->string());
    return std::nullopt;
  }
  return std::move(loaded.config);
}

int run_single(const std::string & input, const schema_gen::DriverOptions & options)
{
  const auto result = schema_gen::GeneratorDriver::process_single_file(input, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.source.get());
  }

  if (!result.success) {
    return 1;
  }

  if (result.validated) {
    std::cout << "Schema validation passed\n";
  }
  std::cout << "Schema generated successfully: " << result.output.string() << "\n";
  return 0;
}

int run_batch(const std::string & pattern, const schema_gen::DriverOptions & options)
{
  const auto result = schema_gen::GeneratorDriver::process_batch(pattern, options);

  if (!result.success || result.diagnostics.has_warnings()) {
    print_diagnostics(result.diagnostics, nullptr);
  }
  if (!result.success) {
    return 1;
  }

  for (const auto & file : result.files) {
    if (file.success) {
      std::cout << "Schema generated successfully: " << file.output.string() << "\n";
    } else if (options.verbose) {
      print_diagnostics(file.diagnostics, file.source.get());
    }
  }

  std::cout << "Processed " << result.processed << " files successfully\n";
  if (result.failure_count() > 0) {
    std::cout << "Errors encountered:\n";
    for (const auto & file : result.files) {
      if (file.success) {
        continue;
      }
      const auto errors = file.diagnostics.errors();
      std::cout << "  " << file.input.string() << ": "
                << (errors.empty() ? std::string("unknown error") : errors.front().message) << "\n";
    }
  }

  return 0;
}

int cmd_generate(const CommandArgs & args)
{
  if (args.positionals.empty()) {
    std::cerr << "error: input file is required\n\n";
    print_usage(std::cerr);
    return 1;
  }
  if (args.positionals.size() > 1) {
    std::cerr << "error: unexpected argument '" << args.positionals[1] << "'\n";
    if (args.batch) {
      std::cerr << "Quote the glob pattern so the shell does not expand it.\n";
    }
    return 1;
  }

  std::optional<schema_gen::Tier> tier;
  if (args.tier) {
    tier = schema_gen::parse_tier(*args.tier);
    if (!tier) {
      std::cerr << "error: invalid tier '" << *args.tier
                << "' (expected basic, standard, comprehensive or expert)\n";
      return 1;
    }
  }

  std::optional<schema_gen::OverflowPolicy> overflow;
  if (args.overflow) {
    overflow = schema_gen::parse_overflow_policy(*args.overflow);
    if (!overflow) {
      std::cerr << "error: invalid overflow policy '" << *args.overflow
                << "' (expected saturate or error)\n";
      return 1;
    }
  }

  const auto loaded = resolve_config(args);
  if (!loaded) {
    return 1;
  }
  const schema_gen::GeneratorConfig config =
    schema_gen::merge_with_args(*loaded, tier, args.pretty, args.validate);

  schema_gen::DriverOptions options;
  options.tier = config.default_tier;
  options.overflow = overflow.value_or(config.numeric_overflow);
  options.pretty = config.pretty_output;
  options.validate = config.validate_schema;
  options.output_dir = config.output_directory;
  options.extensions = config.file_extensions;
  options.verbose = args.verbose;
  options.log = &std::cerr;

  if (args.verbose) {
    std::cerr << "Tier: " << schema_gen::to_string(options.tier) << "\n";
  }

  if (args.output_path) {
    options.output = fs::path(*args.output_path);
  }

  if (args.batch) {
    return run_batch(args.positionals.front(), options);
  }
  return run_single(args.positionals.front(), options);
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    std::cerr << "Run '" << k_program_name << " --help' for usage.\n";
    return 1;
  }

  if (args.show_help) {
    print_usage(std::cout);
    return 0;
  }

  if (args.show_version) {
    std::cout << k_program_name << " " << k_version << "\n";
    return 0;
  }

  if (args.command == "completion") {
    return cmd_completion(args);
  }
  if (args.command == "init-config") {
    return cmd_init_config(args);
  }

  return cmd_generate(args);
}
