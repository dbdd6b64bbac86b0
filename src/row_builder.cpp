#include "row_builder.hpp"

#include "log.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

// Accumulator for the row fold: rows closed so far plus the row in progress.
struct RowFold {
  std::vector<FragmentRow> rows;
  FragmentRow current;
  double referenceY = 0.0;
};

bool joinsCurrentRow(const RowFold& acc, const TextFragment& f, const RowBuilderConfig& config) {
  double anchor = config.mode == RowMode::Basic ? acc.referenceY : acc.current.back().y0;
  return std::abs(f.y0 - anchor) < config.rowThreshold;
}

void sortByX(FragmentRow& row) {
  std::stable_sort(row.begin(), row.end(), [](const TextFragment& a, const TextFragment& b) {
    return a.x0 < b.x0;
  });
}

} // namespace

RowBuilderConfig RowBuilderConfig::forMode(RowMode mode) {
  RowBuilderConfig config;
  config.mode = mode;
  config.rowThreshold = mode == RowMode::Basic ? 5.0 : 8.0;
  return config;
}

void validateConfig(const RowBuilderConfig& config) {
  if (config.rowThreshold < 0 || config.columnSnapTolerance < 0 || config.mergeGapTolerance < 0) {
    throw std::invalid_argument("row builder tolerances must be non-negative");
  }
}

std::vector<FragmentRow> clusterRows(std::vector<TextFragment> fragments, const RowBuilderConfig& config) {
  std::stable_sort(fragments.begin(), fragments.end(), [](const TextFragment& a, const TextFragment& b) {
    return a.y0 > b.y0; // top to bottom
  });

  RowFold acc;
  for (auto& f : fragments) {
    if (acc.current.empty()) {
      acc.referenceY = f.y0;
    } else if (!joinsCurrentRow(acc, f, config)) {
      acc.rows.push_back(std::move(acc.current));
      acc.current.clear();
      acc.referenceY = f.y0;
    }
    acc.current.push_back(std::move(f));
  }
  if (!acc.current.empty()) acc.rows.push_back(std::move(acc.current));
  return std::move(acc.rows);
}

std::vector<ColumnInterval> discoverColumns(const std::vector<FragmentRow>& rows, double snapTolerance) {
  std::vector<ColumnInterval> intervals;
  for (const auto& row : rows) {
    for (const auto& f : row) {
      auto it = std::find_if(intervals.begin(), intervals.end(), [&](const ColumnInterval& c) {
        return f.x0 >= c.xmin - snapTolerance && f.x0 <= c.xmax + snapTolerance;
      });
      if (it != intervals.end()) {
        it->xmin = std::min(it->xmin, f.x0);
        it->xmax = std::max(it->xmax, f.x1);
      } else {
        intervals.push_back(ColumnInterval{f.x0, f.x1});
      }
    }
  }
  return intervals;
}

std::vector<ColumnInterval> mergeColumns(std::vector<ColumnInterval> intervals, double mergeGap) {
  std::stable_sort(intervals.begin(), intervals.end(), [](const ColumnInterval& a, const ColumnInterval& b) {
    return a.xmin < b.xmin;
  });
  std::vector<ColumnInterval> merged;
  for (const auto& c : intervals) {
    if (!merged.empty() && c.xmin <= merged.back().xmax + mergeGap) {
      merged.back().xmax = std::max(merged.back().xmax, c.xmax);
    } else {
      merged.push_back(c);
    }
  }
  return merged;
}

std::vector<ColumnInterval> resolveColumns(const std::vector<FragmentRow>& rows, const RowBuilderConfig& config) {
  return mergeColumns(discoverColumns(rows, config.columnSnapTolerance), config.mergeGapTolerance);
}

std::string cleanCellText(const std::string& text) {
  return collapseWhitespace(text);
}

CellRow assembleBasicRow(const FragmentRow& row) {
  CellRow cells;
  for (const auto& f : row) {
    std::string cell = cleanCellText(f.text);
    if (!cell.empty()) cells.push_back(std::move(cell));
  }
  return cells;
}

CellRow assembleColumnRow(const FragmentRow& row, const std::vector<ColumnInterval>& columns, double snapTolerance) {
  std::vector<std::string> slots(columns.size());
  for (const auto& f : row) {
    std::string text = cleanCellText(f.text);
    if (text.empty()) continue;
    size_t i = 0;
    for (; i < columns.size(); ++i) {
      if (f.x0 >= columns[i].xmin - snapTolerance && f.x1 <= columns[i].xmax + snapTolerance) break;
    }
    if (i == columns.size()) {
      logDebug("dropping fragment outside every column: '" + text + "'");
      continue;
    }
    if (!slots[i].empty()) slots[i] += ' ';
    slots[i] += text;
  }

  CellRow cells;
  for (auto& s : slots) {
    if (!s.empty()) cells.push_back(std::move(s));
  }
  return cells;
}

std::vector<CellRow> buildRows(std::vector<TextFragment> fragments, const RowBuilderConfig& config) {
  validateConfig(config);
  fragments.erase(std::remove_if(fragments.begin(), fragments.end(), [](const TextFragment& f) {
    return cleanCellText(f.text).empty();
  }), fragments.end());
  std::vector<FragmentRow> rows = clusterRows(std::move(fragments), config);
  for (auto& r : rows) sortByX(r);

  std::vector<ColumnInterval> columns;
  if (config.mode == RowMode::ColumnExact) columns = resolveColumns(rows, config);

  std::vector<CellRow> out;
  out.reserve(rows.size());
  for (const auto& r : rows) {
    CellRow cells = config.mode == RowMode::Basic
      ? assembleBasicRow(r)
      : assembleColumnRow(r, columns, config.columnSnapTolerance);
    if (!cells.empty()) out.push_back(std::move(cells));
  }
  return out;
}
