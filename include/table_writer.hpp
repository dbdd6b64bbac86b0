#pragma once

#include <string>
#include <vector>

struct PageTable {
  int pageNumber;
  std::vector<std::vector<std::string>> rows;
};

// "\t " + cells joined by " \t " + " \t". Downstream consumers split on the
// tab character, so this layout must not change.
std::string serializeRow(const std::vector<std::string>& cells);

// Serialized rows of every table, in the order given.
std::vector<std::string> serializeTables(const std::vector<PageTable>& tables);

// Serialized rows joined with '\n'.
std::string serializeDocument(const std::vector<PageTable>& tables);

// Inverse of serializeRow.
std::vector<std::string> splitSerializedRow(const std::string& line);

// Write tables into CSV files in outDir as table_<page>_<index>.csv
void writeTablesAsCsv(const std::vector<PageTable>& tables, const std::string& outDir);
