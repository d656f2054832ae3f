#pragma once

#include <istream>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "condkit/condkit.h"

namespace condkit::cli {

/// Reads a file into memory.
/// MUST throw std::runtime_error on missing/unreadable files.
std::string read_file(const std::string& path);
/// Reads all stdin content until EOF.
std::string read_stdin();
/// Resolves a JSON argument: `@path` reads a file, `-` reads stdin, anything
/// else is inline JSON text. Throws condkit::ParseError on invalid JSON.
nlohmann::json load_json_argument(const std::string& arg);

/// Counters reported after a --lines run.
struct FilterStats {
  size_t lines = 0;
  size_t matched = 0;
  size_t skipped = 0;
};

/// Writes every JSON line of `in` whose record satisfies the condition to `out`.
/// Blank lines are ignored; malformed lines are reported on `err` with their
/// line number and skipped.
FilterStats filter_json_lines(std::istream& in,
                              std::ostream& out,
                              std::ostream& err,
                              const AnyCondition& condition,
                              const Evaluator& evaluator);

/// Renders a single evaluation result as `true`/`false` or `{"result":...}`.
std::string format_result(bool result, const std::string& output_mode);

}  // namespace condkit::cli
