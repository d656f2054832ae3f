#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <variant>

#include "cli_args.h"
#include "cli_utils.h"
#include "condkit/condkit.h"
#include "condkit/extensions.h"
#include "condkit/json.h"
#include "config.h"
#include "ui/color.h"

namespace {

using condkit::cli::kColor;

constexpr int kExitTrue = 0;
constexpr int kExitFalse = 1;
constexpr int kExitError = 2;

void print_error(const std::string& message, bool color) {
  std::cerr << condkit::cli::color_on(kColor.red, color) << "Error: " << message
            << condkit::cli::color_on(kColor.reset, color) << std::endl;
}

void print_operators(const condkit::OperatorRegistry& registry, bool color) {
  std::cout << condkit::cli::color_on(kColor.dim, color) << "# built-in"
            << condkit::cli::color_on(kColor.reset, color) << std::endl;
  for (const auto& name : condkit::builtin_operator_names()) {
    std::cout << name << std::endl;
  }
  auto custom = registry.list();
  std::sort(custom.begin(), custom.end());
  std::cout << condkit::cli::color_on(kColor.dim, color) << "# registered"
            << condkit::cli::color_on(kColor.reset, color) << std::endl;
  for (const auto& name : custom) {
    std::cout << name << std::endl;
  }
}

/// Runs the requested CLI mode.
/// MUST return 0 or 1 for results and throw on errors for main to report.
/// Inputs are parsed and resolved options; side effects are stdout/stderr writes.
int run(const condkit::cli::CliOptions& options, const condkit::cli::ResolvedOptions& resolved) {
  condkit::OperatorRegistry registry;
  if (resolved.extensions) {
    condkit::register_standard_extensions(registry);
  }
  if (resolved.report_faults) {
    bool color = resolved.color;
    registry.set_fault_handler([color](const std::string& op, const std::string& message) {
      std::cerr << condkit::cli::color_on(kColor.yellow, color) << "Warning: operator '" << op
                << "' failed: " << message << condkit::cli::color_on(kColor.reset, color)
                << std::endl;
    });
  }

  if (options.list_operators) {
    print_operators(registry, resolved.color);
    return kExitTrue;
  }

  if (options.condition.empty()) {
    throw std::runtime_error("Missing --condition");
  }
  condkit::AnyCondition condition =
      condkit::any_condition_from_json(condkit::cli::load_json_argument(options.condition));

  if (options.to_chain) {
    condkit::ConditionChain chain;
    if (const auto* tree = std::get_if<condkit::Condition>(&condition)) {
      chain = condkit::convert_tree_to_chain(*tree);
    } else {
      chain = std::get<condkit::ConditionChain>(condition);
    }
    std::cout << condkit::chain_to_json(chain).dump(2) << std::endl;
    return kExitTrue;
  }

  condkit::Evaluator evaluator(registry);

  if (!options.lines.empty()) {
    condkit::cli::FilterStats stats;
    if (options.lines == "-") {
      stats = condkit::cli::filter_json_lines(std::cin, std::cout, std::cerr, condition, evaluator);
    } else {
      std::ifstream in(options.lines);
      if (!in) {
        throw std::runtime_error("Failed to open file: " + options.lines);
      }
      stats = condkit::cli::filter_json_lines(in, std::cout, std::cerr, condition, evaluator);
    }
    if (stats.skipped > 0) {
      std::cerr << condkit::cli::color_on(kColor.yellow, resolved.color) << stats.skipped
                << " line(s) skipped" << condkit::cli::color_on(kColor.reset, resolved.color)
                << std::endl;
    }
    return kExitTrue;
  }

  if (options.data.empty()) {
    throw std::runtime_error("Missing --data or --lines");
  }
  condkit::DataRecord record =
      condkit::record_from_json(condkit::cli::load_json_argument(options.data));
  bool result = evaluator.evaluate_either(condition, record);
  const char* code = result ? kColor.green : kColor.red;
  bool highlight = resolved.color && resolved.output_mode == "plain";
  std::cout << condkit::cli::color_on(code, highlight)
            << condkit::cli::format_result(result, resolved.output_mode)
            << condkit::cli::color_on(kColor.reset, highlight) << std::endl;
  return result ? kExitTrue : kExitFalse;
}

}  // namespace

int main(int argc, char** argv) {
  condkit::cli::CliOptions options;
  std::string error;
  if (!condkit::cli::parse_cli_args(argc, argv, options, error)) {
    std::cerr << error << std::endl;
    condkit::cli::print_help(std::cerr);
    return kExitError;
  }
  if (options.show_help) {
    condkit::cli::print_help(std::cout);
    return kExitTrue;
  }
  if (argc == 1) {
    condkit::cli::print_startup_help(std::cout);
    return kExitTrue;
  }

  std::string config_path =
      options.config_path.empty() ? condkit::cli::resolve_config_path() : options.config_path;
  std::error_code ec;
  if (!options.config_path.empty() && !std::filesystem::exists(config_path, ec)) {
    print_error("Config file not found: " + config_path, isatty(fileno(stderr)) != 0);
    return kExitError;
  }
  condkit::cli::CliSettings settings;
  if (!condkit::cli::load_cli_config(config_path, settings, error) && !error.empty()) {
    print_error(error, isatty(fileno(stderr)) != 0);
    return kExitError;
  }
  condkit::cli::ResolvedOptions resolved = condkit::cli::resolve_options(settings, options);
  if (!isatty(fileno(stdout)) || !isatty(fileno(stderr))) {
    resolved.color = false;
  }

  try {
    return run(options, resolved);
  } catch (const std::exception& ex) {
    print_error(ex.what(), resolved.color);
    return kExitError;
  }
}
