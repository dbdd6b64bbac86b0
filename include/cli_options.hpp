#pragma once

#include "table_extractor.hpp"

#include <string>

struct CliOptions {
  std::string pdfPath;
  ExtractOptions extract;
  std::string csvOutDir; // empty: print tab rows to stdout
  bool verbose = false;
  bool help = false;
};

// Parses `--key=value` style arguments. Mode presets are applied before any
// explicit tolerance, whatever the argument order.
// Throws std::invalid_argument on unknown options, malformed values or an
// option set rejected by validateOptions.
CliOptions parseCommandLine(int argc, char** argv);

std::string usage(const std::string& program);
