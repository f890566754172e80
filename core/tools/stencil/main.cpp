// stencil - Layout template checker and tree dumper
//
// Usage:
//   stencil check [file.json | --project] [-c stencil.yaml]
//   stencil dump  [file.json | --project] [-c stencil.yaml]
//
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "stencil/basic/diagnostic_printer.hpp"
#include "stencil/driver/renderer.hpp"
#include "stencil/loader/template_json.hpp"
#include "stencil/node/node_json.hpp"
#include "stencil/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Stencil v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [file.json]        Build the template tree and report errors\n"
            << "  dump [file.json]         Build the template tree and print it as JSON\n\n"
            << "Options:\n"
            << "  --project                Render the entry points of stencil.yaml\n"
            << "  -c, --config <path>      Project configuration file\n"
            << "  -I <dir>                 Add a template search path (repeatable)\n"
            << "  --state <name=value>     Set a root state value (repeatable)\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const stencil::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  stencil::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string config_path;
  std::vector<std::string> search_paths;
  std::vector<std::string> state;
  bool use_project = false;
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
    std::string arg = argv[i];

    if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "-I") {
      if (i + 1 < argc) {
        args.search_paths.emplace_back(argv[++i]);
      }
    } else if (arg == "--state") {
      if (i + 1 < argc) {
        args.state.emplace_back(argv[++i]);
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

/// Parse `name=value`; the value is read as JSON, falling back to text
bool parse_state(const std::string & assignment, stencil::ValueMap & state)
{
  const size_t eq = assignment.find('=');
  if (eq == std::string::npos || eq == 0) {
    std::cerr << "error: --state expects name=value, got '" << assignment << "'\n";
    return false;
  }
  const std::string name = assignment.substr(0, eq);
  const std::string text = assignment.substr(eq + 1);

  const auto j = nlohmann::ordered_json::parse(text, nullptr, false);
  if (!j.is_discarded()) {
    auto value = stencil::value_from_json(j);
    if (value) {
      state[name] = std::move(value).value();
      return true;
    }
  }
  state[name] = stencil::Value::make_string(text);
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int run(const CommandArgs & args, bool dump)
{
  stencil::RenderOptions options;
  options.verbose = args.verbose;
  for (const auto & path : args.search_paths) {
    options.search_paths.emplace_back(fs::absolute(path));
  }
  for (const auto & assignment : args.state) {
    if (!parse_state(assignment, options.state)) {
      return 1;
    }
  }
  if (!args.config_path.empty()) {
    options.config_path = fs::absolute(args.config_path);
  }

  stencil::RenderResult result;

  if (args.use_project || args.input_file.empty()) {
    // Project mode
    auto config_path = options.config_path;
    if (!config_path) {
      config_path = stencil::find_project_config(fs::current_path());
    }
    if (!config_path) {
      std::cerr << "error: no stencil.yaml found in current directory or parents\n";
      return 1;
    }

    const auto config_result = stencil::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    if (args.verbose) {
      std::cerr << "Rendering project: " << config_result.config.package.name << "\n";
    }

    result = stencil::Renderer::render_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    result = stencil::Renderer::render_file(input_path, options);
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return 1;
  }

  if (dump) {
    for (const auto & root : result.roots) {
      std::cout << stencil::to_json(*root).dump(2) << "\n";
    }
  } else {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return run(args, false);
  }

  if (args.command == "dump") {
    return run(args, true);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
