#include "cli_options.hpp"
#include "log.hpp"
#include "table_extractor.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char** argv)
{
  CliOptions opts;
  try {
    opts = parseCommandLine(argc, argv);
  } catch (const std::invalid_argument& ex) {
    std::cerr << "Error: " << ex.what() << "\n" << usage(argv[0]);
    return 2;
  }

  if (opts.help) {
    std::cout << usage(argv[0]);
    return 0;
  }
  if (opts.verbose) setLogLevel(LogLevel::Debug);

  if (opts.pdfPath.empty() || !std::filesystem::exists(opts.pdfPath)) {
    std::cerr << "PDF not found: " << opts.pdfPath << "\n";
    std::cerr << usage(argv[0]);
    return 2;
  }

  try {
    auto tables = extractTablesFromPdf(opts.pdfPath, opts.extract);

    if (!opts.csvOutDir.empty()) {
      writeTablesAsCsv(tables, opts.csvOutDir);
      std::cout << "Extracted " << tables.size() << " table(s) to '" << opts.csvOutDir << "'\n";
      return 0;
    }

    for (const auto& line : serializeTables(tables)) {
      std::cout << line << "\n";
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
