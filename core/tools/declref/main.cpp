// declref - Declaration Reference Checker Command Line Interface
//
// Usage:
//   declref check [model.json refs.json... | --project] [--warn] [-v]
//   declref resolve <model.json> <refs.json>... [--json]
//   declref init <project-name>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "declref/basic/diagnostic_printer.hpp"
#include "declref/driver/reference_checker.hpp"
#include "declref/io/api_model_loader.hpp"
#include "declref/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "declref - declaration reference checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [model.json refs.json...]   Check that every reference resolves\n"
            << "  resolve <model.json> <refs.json>  Print the target of every reference\n"
            << "  init <project-name>               Initialize a new project\n\n"
            << "Options:\n"
            << "  --project                Check the project described by declref.yaml\n"
            << "  --warn                   Report unresolved references as warnings\n"
            << "  --json                   Print resolve output as JSON\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const declref::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  declref::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  bool use_project = false;
  bool warn_only = false;
  bool json_output = false;
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

    if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--warn") {
      args.warn_only = true;
    } else if (arg == "--json") {
      args.json_output = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.inputs.push_back(arg);
    } else {
      std::cerr << "warning: ignoring unknown option '" << arg << "'\n";
    }
  }

  return args;
}

declref::CheckOptions make_options(const CommandArgs & args)
{
  declref::CheckOptions options;
  if (args.warn_only) {
    options.severity_override = declref::Severity::Warning;
  }
  return options;
}

std::vector<fs::path> batch_paths(const CommandArgs & args)
{
  std::vector<fs::path> paths;
  for (size_t i = 1; i < args.inputs.size(); ++i) {
    paths.push_back(fs::absolute(args.inputs[i]));
  }
  return paths;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  const declref::CheckOptions options = make_options(args);
  declref::CheckResult result;
  std::string label;

  if (args.use_project || args.inputs.empty()) {
    // Project mode: find declref.yaml
    auto config_path = declref::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no declref.yaml found in current directory or parents\n";
      return 1;
    }

    const auto config_result = declref::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    label = "project";
    if (args.verbose) {
      std::cerr << "Checking project: " << config_result.config.project_root.string() << "\n";
    }

    result = declref::ReferenceChecker::check_project(config_result.config, options);
  } else {
    if (args.inputs.size() < 2) {
      std::cerr << "error: expected an API model and at least one reference batch\n";
      return 1;
    }

    const fs::path model_path = fs::absolute(args.inputs[0]);
    label = args.inputs[0];
    if (args.verbose) {
      std::cerr << "Checking against: " << model_path.string() << "\n";
    }

    result = declref::ReferenceChecker::check_files(model_path, batch_paths(args), options);
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (args.verbose) {
    std::cerr << "Resolved " << result.resolved_count << " of "
              << (result.resolved_count + result.failed_count) << " references\n";
  }

  if (result.success) {
    std::cout << label << ": OK\n";
    return 0;
  }

  std::cerr << label << ": " << result.diagnostics.count(declref::Severity::Error)
            << " error(s), " << result.diagnostics.count(declref::Severity::Warning)
            << " warning(s)\n";
  return 1;
}

int cmd_resolve(const CommandArgs & args)
{
  if (args.inputs.size() < 2) {
    std::cerr << "error: expected an API model and at least one reference batch\n";
    std::cerr << "usage: declref resolve <model.json> <refs.json>...\n";
    return 1;
  }

  // Unresolved references are listed, not reported
  declref::CheckOptions options;
  options.severity_override = declref::Severity::Info;

  const declref::CheckResult result = declref::ReferenceChecker::check_files(
    fs::absolute(args.inputs[0]), batch_paths(args), options);

  if (!result.model) {
    print_diagnostics(result.diagnostics);
    return 1;
  }
  const declref::DeclarationGraph & decls = result.model->decls;

  if (args.json_output) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto & ref : result.references) {
      nlohmann::json item{{"reference", ref.text}};
      if (ref.failure) {
        item["failure"] = std::string(declref::to_string(*ref.failure));
      } else {
        item["target"] = declref::to_json(decls, ref.target);
      }
      out.push_back(std::move(item));
    }
    std::cout << out.dump(2) << "\n";
  } else {
    for (const auto & ref : result.references) {
      std::cout << ref.text << " -> ";
      if (ref.failure) {
        std::cout << "<" << declref::to_string(*ref.failure) << ">\n";
      } else {
        const declref::DeclNode * node = decls.get(ref.target);
        std::cout << decls.qualified_name(ref.target) << " ("
                  << declref::to_string(node->kind) << ")\n";
      }
    }
  }

  if (args.verbose && !result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  return result.diagnostics.has_errors() ? 1 : 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: declref init <project-name>\n";
    return 1;
  }

  const std::string & name = args.inputs[0];
  const fs::path project_dir = fs::current_path() / name;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "api");
    fs::create_directories(project_dir / "refs");

    // Emitted rather than templated so any project name stays valid YAML
    YAML::Emitter yaml;
    yaml << YAML::BeginMap;
    yaml << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
    yaml << YAML::Key << "name" << YAML::Value << name;
    yaml << YAML::EndMap;
    yaml << YAML::Key << "model" << YAML::Value << ("./api/" + name + ".api.json");
    yaml << YAML::Key << "references" << YAML::Value << YAML::BeginSeq << "./refs/docs.json"
         << YAML::EndSeq;
    yaml << YAML::Key << "checker" << YAML::Value << YAML::BeginMap;
    yaml << YAML::Key << "unresolved" << YAML::Value << "error";
    yaml << YAML::EndMap;
    yaml << YAML::EndMap;
    if (!yaml.good()) {
      std::cerr << "error: cannot write project config: " << yaml.GetLastError() << "\n";
      return 1;
    }

    std::ofstream config(project_dir / declref::k_project_config_file_name);
    config << yaml.c_str() << "\n";
    config.close();

    nlohmann::json main_export{{"name", "main"}, {"declarations", nlohmann::json::array()}};
    main_export["declarations"].push_back(nlohmann::json{{"kind", "function"}});
    nlohmann::json index_module{{"name", "index"}, {"exports", nlohmann::json::array()}};
    index_module["exports"].push_back(std::move(main_export));
    nlohmann::json model{{"package", name}, {"entryModule", "index"}};
    model["modules"] = nlohmann::json::array();
    model["modules"].push_back(std::move(index_module));

    std::ofstream model_file(project_dir / "api" / (name + ".api.json"));
    model_file << model.dump(2) << "\n";
    model_file.close();

    nlohmann::json ref{{"text", name + "#main"}, {"packageName", name}};
    ref["members"] = nlohmann::json::array();
    ref["members"].push_back(nlohmann::json{{"identifier", "main"}});
    nlohmann::json refs;
    refs["references"] = nlohmann::json::array();
    refs["references"].push_back(std::move(ref));

    std::ofstream refs_file(project_dir / "refs" / "docs.json");
    refs_file << refs.dump(2) << "\n";
    refs_file.close();

    std::cout << "Initialized new declref project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << name << "\n"
              << "  declref check\n";

    return 0;
  } catch (const std::exception & e) {
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

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "resolve") {
    return cmd_resolve(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
