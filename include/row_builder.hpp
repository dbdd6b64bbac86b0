#pragma once

#include "layout.hpp"

#include <string>
#include <vector>

enum class RowMode { Basic, ColumnExact };

struct RowBuilderConfig {
  RowMode mode = RowMode::Basic;
  // Max |y0| distance for two fragments to share a row. Basic mode measures
  // against the row's first member, column-exact against the previous one.
  double rowThreshold = 5.0;
  double columnSnapTolerance = 5.0;
  double mergeGapTolerance = 10.0;

  // Defaults for the given mode (row threshold 5 for basic, 8 for column-exact).
  static RowBuilderConfig forMode(RowMode mode);
};

struct ColumnInterval {
  double xmin;
  double xmax;
};

using FragmentRow = std::vector<TextFragment>;
using CellRow = std::vector<std::string>;

// Throws std::invalid_argument for negative tolerances.
void validateConfig(const RowBuilderConfig& config);

// Groups fragments into rows ordered top to bottom. Fragments inside a row keep
// the order of the y0-descending sort; they are not sorted by x0 here.
std::vector<FragmentRow> clusterRows(std::vector<TextFragment> fragments,
                                     const RowBuilderConfig& config);

// Interval discovery over rows already sorted by x0. Order dependent: the
// first interval that snaps to a fragment absorbs it.
std::vector<ColumnInterval> discoverColumns(const std::vector<FragmentRow>& rows,
                                            double snapTolerance);

// Sorts by xmin and folds together intervals whose gap is within mergeGap.
std::vector<ColumnInterval> mergeColumns(std::vector<ColumnInterval> intervals,
                                         double mergeGap);

std::vector<ColumnInterval> resolveColumns(const std::vector<FragmentRow>& rows,
                                           const RowBuilderConfig& config);

// Collapses whitespace runs to a single space and trims.
std::string cleanCellText(const std::string& text);

CellRow assembleBasicRow(const FragmentRow& row);
CellRow assembleColumnRow(const FragmentRow& row,
                          const std::vector<ColumnInterval>& columns,
                          double snapTolerance);

// Full per-page pipeline. Fragments with blank text are discarded before
// clustering; rows with no cells are left out.
std::vector<CellRow> buildRows(std::vector<TextFragment> fragments,
                               const RowBuilderConfig& config);
