#include "cli_options.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace {

bool takeValue(const std::string& arg, const std::string& key, std::string& value) {
  std::string prefix = "--" + key + "=";
  if (arg.rfind(prefix, 0) != 0) return false;
  value = arg.substr(prefix.size());
  return true;
}

double toDouble(const std::string& key, const std::string& value) {
  try {
    size_t used = 0;
    double v = std::stod(value, &used);
    if (used == value.size()) return v;
  } catch (const std::logic_error&) {
  }
  throw std::invalid_argument("--" + key + " expects a number, got '" + value + "'");
}

int toInt(const std::string& key, const std::string& value) {
  try {
    size_t used = 0;
    int v = std::stoi(value, &used);
    if (used == value.size()) return v;
  } catch (const std::logic_error&) {
  }
  throw std::invalid_argument("--" + key + " expects an integer, got '" + value + "'");
}

} // namespace

CliOptions parseCommandLine(int argc, char** argv) {
  CliOptions opts;
  RowMode mode = RowMode::Basic;
  std::optional<double> rowThreshold;
  std::optional<double> snap;
  std::optional<double> mergeGap;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "--skip-bad-pages") {
      opts.extract.onLayoutError = LayoutErrorPolicy::SkipPage;
    } else if (takeValue(arg, "mode", value)) {
      if (value == "basic") mode = RowMode::Basic;
      else if (value == "column-exact") mode = RowMode::ColumnExact;
      else throw std::invalid_argument("--mode must be basic or column-exact");
    } else if (takeValue(arg, "level", value)) {
      if (value == "block") opts.extract.level = ContainerLevel::Block;
      else if (value == "line") opts.extract.level = ContainerLevel::Line;
      else if (value == "word") opts.extract.level = ContainerLevel::Word;
      else throw std::invalid_argument("--level must be block, line or word");
    } else if (takeValue(arg, "row-threshold", value)) {
      rowThreshold = toDouble("row-threshold", value);
    } else if (takeValue(arg, "snap", value)) {
      snap = toDouble("snap", value);
    } else if (takeValue(arg, "merge-gap", value)) {
      mergeGap = toDouble("merge-gap", value);
    } else if (takeValue(arg, "first", value)) {
      opts.extract.firstPage = toInt("first", value);
    } else if (takeValue(arg, "last", value)) {
      opts.extract.lastPage = toInt("last", value);
    } else if (takeValue(arg, "jobs", value)) {
      int jobs = toInt("jobs", value);
      if (jobs < 1) throw std::invalid_argument("--jobs must be at least 1");
      opts.extract.jobs = static_cast<unsigned>(jobs);
    } else if (takeValue(arg, "csv-out", value)) {
      opts.csvOutDir = value;
    } else if (arg.rfind("--", 0) == 0) {
      throw std::invalid_argument("unknown option " + arg);
    } else if (opts.pdfPath.empty()) {
      opts.pdfPath = arg;
    } else {
      throw std::invalid_argument("unexpected argument " + arg);
    }
  }

  opts.extract.rows = RowBuilderConfig::forMode(mode);
  if (rowThreshold) opts.extract.rows.rowThreshold = *rowThreshold;
  if (snap) opts.extract.rows.columnSnapTolerance = *snap;
  if (mergeGap) opts.extract.rows.mergeGapTolerance = *mergeGap;
  validateOptions(opts.extract);
  return opts;
}

std::string usage(const std::string& program) {
  return "Usage: " + program + " [options] <pdf_path>\n"
    "  --mode=basic|column-exact  row building strategy (default basic)\n"
    "  --row-threshold=F          max y0 distance within a row (5 basic, 8 column-exact)\n"
    "  --snap=F                   column snap tolerance (default 5)\n"
    "  --merge-gap=F              column merge gap tolerance (default 10)\n"
    "  --first=N --last=N         page range\n"
    "  --level=block|line|word    text container granularity (default block)\n"
    "  --jobs=N                   pages processed in parallel (default 1)\n"
    "  --skip-bad-pages           skip pages whose layout cannot be read\n"
    "  --csv-out=dir              write table_<page>_0.csv files instead of tab rows\n"
    "  --verbose                  debug diagnostics on stderr\n";
}
