#pragma once

#include "layout.hpp"
#include "layout_source.hpp"
#include "row_builder.hpp"
#include "table_writer.hpp"

#include <string>
#include <vector>

enum class LayoutErrorPolicy { Abort, SkipPage };

struct ExtractOptions {
  RowBuilderConfig rows;
  ContainerLevel level = ContainerLevel::Block;
  int firstPage = 1;
  int lastPage = -1;
  unsigned jobs = 1;
  LayoutErrorPolicy onLayoutError = LayoutErrorPolicy::Abort;
};

// Throws std::invalid_argument on a bad page range, zero jobs or negative tolerances.
void validateOptions(const ExtractOptions& options);

PageTable buildPageTable(const PageLayout& page, const RowBuilderConfig& config);

// Reconstructs rows of every page. Pages are independent; with jobs > 1 they
// run concurrently and results are reassembled in ascending page order.
// Pages yielding no rows are omitted. A faulted page rethrows its
// DocumentLayoutError under LayoutErrorPolicy::Abort and is skipped otherwise.
std::vector<PageTable> extractTables(const std::vector<PageSlot>& pages, const ExtractOptions& options);

std::vector<PageTable> extractTablesFromPdf(const std::string& pdfPath, const ExtractOptions& options = {});

// Serialized rows of the whole document, pages in ascending order.
std::vector<std::string> extractTableRows(const std::string& pdfPath, const ExtractOptions& options = {});
