#include "table_extractor.hpp"

#include "log.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <stdexcept>

namespace {

struct PageOutcome {
  int pageNumber;
  PageTable table;
  std::exception_ptr fault;
};

PageOutcome processPage(const PageSlot& slot, const RowBuilderConfig& config) {
  PageOutcome outcome{slot.layout.pageNumber, PageTable{slot.layout.pageNumber, {}}, slot.fault};
  if (!outcome.fault) outcome.table = buildPageTable(slot.layout, config);
  return outcome;
}

std::vector<PageOutcome> processAll(const std::vector<PageSlot>& pages, const ExtractOptions& options) {
  std::vector<PageOutcome> outcomes;
  outcomes.reserve(pages.size());
  if (options.jobs <= 1 || pages.size() < 2) {
    for (const auto& p : pages) outcomes.push_back(processPage(p, options.rows));
    return outcomes;
  }

  // Bounded fan-out: at most `jobs` pages in flight.
  for (size_t batch = 0; batch < pages.size(); batch += options.jobs) {
    size_t stop = std::min(pages.size(), batch + options.jobs);
    std::vector<std::future<PageOutcome>> inFlight;
    for (size_t i = batch; i < stop; ++i) {
      inFlight.push_back(std::async(std::launch::async, processPage, std::cref(pages[i]), std::cref(options.rows)));
    }
    for (auto& f : inFlight) outcomes.push_back(f.get());
  }
  return outcomes;
}

} // namespace

void validateOptions(const ExtractOptions& options) {
  validateConfig(options.rows);
  if (options.jobs == 0) {
    throw std::invalid_argument("jobs must be at least 1");
  }
  if (options.firstPage < 1) {
    throw std::invalid_argument("first page must be at least 1");
  }
  if (options.lastPage != -1 && options.lastPage < options.firstPage) {
    throw std::invalid_argument("last page precedes first page");
  }
}

PageTable buildPageTable(const PageLayout& page, const RowBuilderConfig& config) {
  PageTable t;
  t.pageNumber = page.pageNumber;
  t.rows = buildRows(fragmentsFromPage(page), config);
  return t;
}

std::vector<PageTable> extractTables(const std::vector<PageSlot>& pages, const ExtractOptions& options) {
  validateOptions(options);
  std::vector<PageOutcome> outcomes = processAll(pages, options);

  // Order by page number, not by completion.
  std::stable_sort(outcomes.begin(), outcomes.end(), [](const PageOutcome& a, const PageOutcome& b) {
    return a.pageNumber < b.pageNumber;
  });

  std::vector<PageTable> tables;
  for (auto& o : outcomes) {
    if (o.fault) {
      if (options.onLayoutError == LayoutErrorPolicy::Abort) {
        logError("aborting at page " + std::to_string(o.pageNumber));
        std::rethrow_exception(o.fault);
      }
      try {
        std::rethrow_exception(o.fault);
      } catch (const DocumentLayoutError& e) {
        logWarn("skipping page " + std::to_string(o.pageNumber) + ": " + e.what());
      }
      continue;
    }
    logDebug("page " + std::to_string(o.pageNumber) + ": " + std::to_string(o.table.rows.size()) + " row(s)");
    if (o.table.rows.empty()) continue;
    tables.push_back(std::move(o.table));
  }
  return tables;
}

std::vector<PageTable> extractTablesFromPdf(const std::string& pdfPath, const ExtractOptions& options) {
  validateOptions(options);
  std::vector<PageSlot> pages = loadPdfLayout(pdfPath, options.level, options.firstPage, options.lastPage);
  logInfo("read layout of " + std::to_string(pages.size()) + " page(s) from " + pdfPath);
  return extractTables(pages, options);
}

std::vector<std::string> extractTableRows(const std::string& pdfPath, const ExtractOptions& options) {
  return serializeTables(extractTablesFromPdf(pdfPath, options));
}
