#include "cli_utils.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "condkit/json.h"
#include "util/string_util.h"

namespace condkit::cli {

/// Reads a whole file into memory.
/// MUST throw when the file cannot be opened.
/// Inputs are paths; outputs are file contents.
std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

/// Resolves a JSON argument from a file, stdin or inline text.
/// MUST throw ParseError naming the source on invalid JSON.
/// Inputs are CLI argument strings; side effects are file or stdin reads.
nlohmann::json load_json_argument(const std::string& arg) {
  std::string text;
  std::string origin;
  if (arg == "-") {
    text = read_stdin();
    origin = "stdin";
  } else if (!arg.empty() && arg[0] == '@') {
    text = read_file(arg.substr(1));
    origin = arg.substr(1);
  } else {
    text = arg;
    origin = "argument";
  }
  nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    throw ParseError("Invalid JSON in " + origin);
  }
  return parsed;
}

/// Echoes the JSON lines whose records satisfy the condition.
/// MUST skip blank lines and report malformed ones without stopping.
/// Inputs are streams, condition and evaluator; side effects are stream writes.
FilterStats filter_json_lines(std::istream& in,
                              std::ostream& out,
                              std::ostream& err,
                              const AnyCondition& condition,
                              const Evaluator& evaluator) {
  FilterStats stats;
  std::string line;
  while (std::getline(in, line)) {
    ++stats.lines;
    if (util::trim_ws(line).empty()) continue;
    nlohmann::json parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      err << "Warning: line " << stats.lines << ": expected a JSON object, skipped" << std::endl;
      ++stats.skipped;
      continue;
    }
    DataRecord record;
    try {
      record = record_from_json(parsed);
    } catch (const ParseError& ex) {
      err << "Warning: line " << stats.lines << ": " << ex.what() << ", skipped" << std::endl;
      ++stats.skipped;
      continue;
    }
    if (evaluator.evaluate_either(condition, record)) {
      out << line << '\n';
      ++stats.matched;
    }
  }
  out.flush();
  return stats;
}

std::string format_result(bool result, const std::string& output_mode) {
  if (output_mode == "json") {
    nlohmann::json out = nlohmann::json::object();
    out["result"] = result;
    return out.dump();
  }
  return result ? "true" : "false";
}

}  // namespace condkit::cli
