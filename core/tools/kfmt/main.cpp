// kfmt - KiCad symbol library format tool
//
// Usage:
//   kfmt check <file.kicad_sym>
//   kfmt roundtrip <file.kicad_sym>
//   kfmt format <file.kicad_sym> [-o output]
//   kfmt dump <file.kicad_sym>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "kicad_format/basic/diagnostic_printer.hpp"
#include "kicad_format/model/json_export.hpp"
#include "kicad_format/model/symbol_library.hpp"
#include "kicad_format/project/library_check.hpp"
#include "kicad_format/project/tool_config.hpp"
#include "kicad_format/sexpr/writer.hpp"

namespace fs = std::filesystem;
using namespace kicad_format;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "kfmt - KiCad symbol library tool\n\n"
            << "Usage: " << program_name << " <command> <file> [options]\n\n"
            << "Commands:\n"
            << "  check <file>             Parse with both strategies and compare\n"
            << "  roundtrip <file>         Parse, serialize and compare with the input\n"
            << "  format <file>            Re-render the file after a full parse\n"
            << "  dump <file>              Print the parsed model as JSON\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (format only)\n"
            << "  --strategy <name>        owning | borrowing\n"
            << "  --config <path>          Use this kfmt.yaml instead of searching\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  if (diags.empty()) {
    return;
  }
  const bool use_color = isatty(fileno(stderr)) != 0;
  DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diags, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string config_path;
  std::optional<ParseStrategy> strategy;
  std::string usage_error;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output" || arg == "--strategy" || arg == "--config") {
      if (i + 1 >= argc) {
        args.usage_error = "option '" + arg + "' requires a value";
        return args;
      }
      const std::string value = argv[++i];
      if (arg == "--strategy") {
        args.strategy = parse_strategy(value);
        if (!args.strategy) {
          args.usage_error = "invalid strategy '" + value + "' (must be 'owning' or 'borrowing')";
          return args;
        }
      } else if (arg == "--config") {
        args.config_path = value;
      } else {
        args.output_path = value;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.usage_error = "unexpected argument '" + arg + "'";
      return args;
    }
  }

  return args;
}

// ============================================================================
// Shared command plumbing
// ============================================================================

/// Configuration from --config, kfmt.yaml found upward, or defaults.
std::optional<ToolConfig> resolve_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = find_tool_config(fs::current_path());
  }

  ToolConfig config;
  if (config_path) {
    auto loaded = load_tool_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return std::nullopt;
    }
    config = std::move(loaded.config);
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
  }

  if (args.strategy) {
    config.parser.strategy = *args.strategy;
  }
  return config;
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/// Everything a command needs after the input file has been loaded.
struct LoadedInput
{
  SourceRegistry sources;
  FileId file;
  std::string display_name;
  ToolConfig config;
  DiagnosticBag diags;

  [[nodiscard]] std::string_view text() const { return sources.file(file)->content(); }

  /// Print what was collected; exit code follows the errors among it.
  [[nodiscard]] int finish() const
  {
    print_diagnostics(diags, sources);
    return diags.has_errors() ? k_exit_failure : k_exit_ok;
  }
};

std::optional<LoadedInput> load_input(const CommandArgs & args)
{
  auto config = resolve_config(args);
  if (!config) {
    return std::nullopt;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  auto content = read_file(input_path);
  if (!content) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return std::nullopt;
  }

  LoadedInput input;
  input.display_name = args.input_file;
  input.file = input.sources.add(args.input_file, std::move(*content));
  input.config = std::move(*config);
  return input;
}

/// Parse with the configured strategy; failures stay in input.diags.
std::optional<SymbolLibraryFile> parse_input(LoadedInput & input, bool verbose)
{
  if (verbose) {
    std::cerr << "Parsing " << input.display_name << " ("
              << to_string(input.config.parser.strategy) << ")\n";
  }
  return load_library(input.text(), input.file, input.config.parser.strategy, input.diags);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  auto input = load_input(args);
  if (!input) {
    return k_exit_failure;
  }

  if (args.verbose) {
    std::cerr << "Checking " << input->display_name << " ("
              << to_string(input->config.parser.strategy) << ")\n";
  }
  auto lib = check_library(input->text(), input->file, input->config, input->diags);
  const int status = input->finish();
  if (lib && status == k_exit_ok) {
    std::cout << input->display_name << ": OK (" << lib->symbols.size() << " symbols)\n";
  }
  return status;
}

int cmd_roundtrip(const CommandArgs & args)
{
  auto input = load_input(args);
  if (!input) {
    return k_exit_failure;
  }

  auto lib = parse_input(*input, args.verbose);
  if (!lib || !verify_roundtrip(input->text(), input->file, *lib, input->diags)) {
    return input->finish();
  }

  std::cout << input->display_name << ": round trip OK\n";
  return k_exit_ok;
}

int cmd_format(const CommandArgs & args)
{
  auto input = load_input(args);
  if (!input) {
    return k_exit_failure;
  }

  auto lib = parse_input(*input, args.verbose);
  if (!lib) {
    return input->finish();
  }

  WriteOptions options;
  options.pretty = input->config.format.pretty;
  options.indent = input->config.format.indent;
  const std::string text = write_sexpr(lib->to_sexpr(), options);

  if (args.output_path.empty()) {
    std::cout << text;
    return k_exit_ok;
  }

  std::ofstream out(args.output_path, std::ios::binary);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return k_exit_failure;
  }
  out << text;
  if (args.verbose) {
    std::cerr << "Wrote " << args.output_path << "\n";
  }
  return k_exit_ok;
}

int cmd_dump(const CommandArgs & args)
{
  auto input = load_input(args);
  if (!input) {
    return k_exit_failure;
  }

  auto lib = parse_input(*input, args.verbose);
  if (!lib) {
    return input->finish();
  }

  std::cout << to_json(*lib).dump(2) << "\n";
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  using Command = int (*)(const CommandArgs &);
  Command command = nullptr;
  if (args.command == "check") {
    command = cmd_check;
  } else if (args.command == "roundtrip") {
    command = cmd_roundtrip;
  } else if (args.command == "format") {
    command = cmd_format;
  } else if (args.command == "dump") {
    command = cmd_dump;
  } else {
    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: " << argv[0] << " " << args.command << " <file.kicad_sym>\n";
    return k_exit_usage;
  }

  try {
    return command(args);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_failure;
  }
}
