// wfgraph - Workflow graph command line interface
//
// Usage:
//   wfgraph order <target>
//   wfgraph graph [script] [-o file.gv]
//   wfgraph validate
//   wfgraph trace [-o file.yml]
//   wfgraph locate <accessor> [-b building]
//
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

#include "wfgraph/basic/errors.hpp"
#include "wfgraph/basic/finding_printer.hpp"
#include "wfgraph/driver/catalog_finder.hpp"
#include "wfgraph/driver/json_report.hpp"
#include "wfgraph/driver/workflow.hpp"
#include "wfgraph/locator/locator.hpp"
#include "wfgraph/project/catalog.hpp"
#include "wfgraph/project/project_config.hpp"
#include "wfgraph/trace/trace_store.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "wfgraph v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  order <target>           Print the run order (all | script | artifact)\n"
            << "  graph [script]           Render the dependency graph (.gv)\n"
            << "  validate                 Report orphan inputs, cycles, dangling outputs\n"
            << "  trace                    Dry-run every script and write the trace file\n"
            << "  locate <accessor>        Resolve an accessor in the scenario\n\n"
            << "Options:\n"
            << "  --catalog <file>         Catalog to use (default: project or installed)\n"
            << "  --project                Require a wfgraph.yaml in this directory or above\n"
            << "  --traces <file>          Build from a trace file instead of dry runs\n"
            << "  --format <text|json>     Output format for order and validate\n"
            << "  -o, --output <path>      Output file for graph and trace\n"
            << "  -b, --building <name>    Building name for templated accessors\n"
            << "  -j, --jobs <n>           Parallel dry runs (0 = all cores)\n"
            << "  --strict                 Fail on warnings\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_findings(const wfgraph::FindingBag & findings)
{
  if (findings.empty()) {
    return;
  }
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  wfgraph::FindingPrinter printer(std::cerr, use_color);
  printer.print_all(findings);
  printer.print_summary(findings);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string operand;
  std::string catalog_path;
  std::string traces_path;
  std::string output_path;
  std::string building;
  std::string format = "text";
  std::optional<unsigned> jobs;
  bool use_project = false;
  bool strict = false;
  bool verbose = false;
  bool show_help = false;
  std::string usage_error;
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

  auto take_value = [&](int & i, const std::string & flag, std::string & out) {
    if (i + 1 < argc) {
      out = argv[++i];
    } else {
      args.usage_error = "missing value for " + flag;
    }
  };

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--catalog") {
      take_value(i, arg, args.catalog_path);
    } else if (arg == "--traces") {
      take_value(i, arg, args.traces_path);
    } else if (arg == "-o" || arg == "--output") {
      take_value(i, arg, args.output_path);
    } else if (arg == "-b" || arg == "--building") {
      take_value(i, arg, args.building);
    } else if (arg == "--format") {
      take_value(i, arg, args.format);
      if (args.format != "text" && args.format != "json") {
        args.usage_error = "invalid --format '" + args.format + "' (must be text or json)";
      }
    } else if (arg == "-j" || arg == "--jobs") {
      std::string value;
      take_value(i, arg, value);
      char * end = nullptr;
      errno = 0;
      const long n = std::strtol(value.c_str(), &end, 10);
      if (
        value.empty() || *end != '\0' || errno == ERANGE || n < 0 ||
        static_cast<unsigned long>(n) > std::numeric_limits<unsigned>::max()) {
        args.usage_error = "invalid --jobs '" + value + "'";
      } else {
        args.jobs = static_cast<unsigned>(n);
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--strict") {
      args.strict = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.operand.empty()) {
      args.operand = arg;
    } else {
      args.usage_error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Setup
// ============================================================================

struct Session
{
  std::optional<wfgraph::ProjectConfig> project;
  wfgraph::Catalog catalog;
};

/// Load wfgraph.yaml (if any) and the catalog; prints errors itself
bool open_session(const CommandArgs & args, Session & session)
{
  auto config_path = wfgraph::find_project_config(fs::current_path());
  if (!config_path && args.use_project) {
    std::cerr << "error: no wfgraph.yaml found in current directory or parents\n";
    return false;
  }
  if (config_path) {
    auto config_result = wfgraph::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return false;
    }
    if (args.verbose) {
      std::cerr << "Project: " << config_result.config.project.name << " ("
                << config_path->string() << ")\n";
    }
    session.project = std::move(config_result.config);
  }

  std::optional<fs::path> catalog_path;
  if (!args.catalog_path.empty()) {
    catalog_path = fs::absolute(args.catalog_path);
  } else if (session.project && session.project->catalog) {
    catalog_path = *session.project->catalog;
  } else {
    catalog_path = wfgraph::find_default_catalog();
  }
  if (!catalog_path) {
    std::cerr << "error: no catalog given and no installed catalog found (use --catalog)\n";
    return false;
  }

  auto catalog_result = wfgraph::load_catalog(*catalog_path);
  if (!catalog_result.success) {
    std::cerr << "error: " << catalog_result.error << "\n";
    return false;
  }
  if (args.verbose) {
    std::cerr << "Catalog: " << catalog_path->string() << " ("
              << catalog_result.catalog.registry->size() << " accessors, "
              << catalog_result.catalog.scripts.size() << " scripts)\n";
  }
  session.catalog = std::move(catalog_result.catalog);
  return true;
}

/// Where to write a file artifact: -o, then the project's output dir, else stdout
std::optional<fs::path> output_file(
  const CommandArgs & args, const Session & session, const std::string & default_name)
{
  if (!args.output_path.empty()) {
    return fs::path(args.output_path);
  }
  if (session.project) {
    return session.project->output.dir / default_name;
  }
  return std::nullopt;
}

bool write_text(const fs::path & path, const std::string & text)
{
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      std::cerr << "error: cannot create " << path.parent_path().string() << ": " << ec.message()
                << "\n";
      return false;
    }
  }
  std::ofstream out(path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << path.string() << "\n";
    return false;
  }
  out << text;
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_workflow(const CommandArgs & args, wfgraph::OutputMode mode)
{
  Session session;
  if (!open_session(args, session)) {
    return 1;
  }

  wfgraph::WorkflowOptions options;
  options.mode = mode;
  options.strict = args.strict;
  if (session.project) {
    options.trace.jobs = session.project->tracer.jobs;
    options.trace.dry_run_root = session.project->tracer.dry_run_root;
  }
  if (args.jobs) {
    options.trace.jobs = *args.jobs;
  }
  if (!args.traces_path.empty()) {
    options.traces_file = fs::absolute(args.traces_path);
  }

  if (mode == wfgraph::OutputMode::Order) {
    if (args.operand.empty()) {
      std::cerr << "error: target required\n";
      std::cerr << "usage: wfgraph order <all | script | artifact>\n";
      return 1;
    }
    options.target = args.operand;
  } else if (mode == wfgraph::OutputMode::Graph && !args.operand.empty()) {
    options.render_script = args.operand;
  }

  if (args.verbose) {
    if (options.traces_file) {
      std::cerr << "Loading traces: " << options.traces_file->string() << "\n";
    } else {
      std::cerr << "Tracing " << session.catalog.scripts.size() << " script(s)\n";
    }
  }

  const auto result = wfgraph::Workflow::run(session.catalog, options);

  if (args.verbose) {
    std::cerr << "Graph: " << result.graph.script_count() << " scripts, "
              << result.graph.artifact_count() << " artifacts, " << result.graph.edge_count()
              << " edges\n";
  }

  const bool json_output =
    args.format == "json" &&
    (mode == wfgraph::OutputMode::Order || mode == wfgraph::OutputMode::Validate);
  if (json_output) {
    std::cout << wfgraph::to_json(result, mode).dump(2) << "\n";
  } else {
    print_findings(result.findings);
  }

  switch (mode) {
    case wfgraph::OutputMode::Order:
      if (!json_output) {
        for (const auto & script : result.plan) {
          std::cout << script << "\n";
        }
      }
      break;

    case wfgraph::OutputMode::Graph: {
      if (result.rendered.empty()) break;
      const std::string name =
        (options.render_script ? *options.render_script : std::string("trace_inputlocator")) +
        ".gv";
      if (auto file = output_file(args, session, name)) {
        if (!write_text(*file, result.rendered)) return 1;
        std::cerr << "Generated: " << file->string() << "\n";
      } else {
        std::cout << result.rendered;
      }
      break;
    }

    case wfgraph::OutputMode::Trace: {
      std::ostringstream text;
      wfgraph::write_trace_set(result.traces, text);
      if (auto file = output_file(args, session, wfgraph::k_trace_file_name)) {
        if (!write_text(*file, text.str())) return 1;
        std::cerr << "Generated: " << file->string() << "\n";
      } else {
        std::cout << text.str();
      }
      break;
    }

    case wfgraph::OutputMode::Validate:
      if (!json_output && result.success) {
        std::cout << "validate: OK\n";
      }
      break;
  }

  return result.success ? 0 : 1;
}

int cmd_locate(const CommandArgs & args)
{
  if (args.operand.empty()) {
    std::cerr << "error: accessor name required\n";
    std::cerr << "usage: wfgraph locate <accessor> [-b building]\n";
    return 1;
  }

  Session session;
  if (!open_session(args, session)) {
    return 1;
  }

  const fs::path scenario = session.project && session.project->scenario
                              ? *session.project->scenario
                              : fs::current_path();
  if (args.verbose) {
    std::cerr << "Scenario: " << scenario.string() << "\n";
  }

  try {
    wfgraph::ScenarioLocator locator(session.catalog.registry, scenario);
    const fs::path path = args.building.empty()
                            ? locator.path(args.operand)
                            : locator.building_path(args.operand, args.building);
    std::cout << path.string() << "\n";
    return 0;
  } catch (const wfgraph::Error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.usage_error.empty()) {
    std::cerr << "error: " << args.usage_error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "order") {
    return cmd_workflow(args, wfgraph::OutputMode::Order);
  }

  if (args.command == "graph") {
    return cmd_workflow(args, wfgraph::OutputMode::Graph);
  }

  if (args.command == "validate") {
    return cmd_workflow(args, wfgraph::OutputMode::Validate);
  }

  if (args.command == "trace") {
    return cmd_workflow(args, wfgraph::OutputMode::Trace);
  }

  if (args.command == "locate") {
    return cmd_locate(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
