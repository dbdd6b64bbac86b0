#include "table_writer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

std::string serializeRow(const std::vector<std::string>& cells) {
  std::string out = "\t ";
  for (size_t i = 0; i < cells.size(); ++i) {
    if (i > 0) out += " \t ";
    out += cells[i];
  }
  out += " \t";
  return out;
}

std::vector<std::string> serializeTables(const std::vector<PageTable>& tables) {
  std::vector<std::string> lines;
  for (const auto& t : tables) {
    for (const auto& r : t.rows) lines.push_back(serializeRow(r));
  }
  return lines;
}

std::string serializeDocument(const std::vector<PageTable>& tables) {
  std::string out;
  bool first = true;
  for (const auto& line : serializeTables(tables)) {
    if (!first) out += '\n';
    out += line;
    first = false;
  }
  return out;
}

std::vector<std::string> splitSerializedRow(const std::string& line) {
  std::vector<std::string> tokens;
  size_t start = 0;
  while (true) {
    size_t tab = line.find('\t', start);
    tokens.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
    if (tab == std::string::npos) break;
    start = tab + 1;
  }
  if (tokens.size() < 2 || !tokens.front().empty() || !tokens.back().empty()) {
    throw std::invalid_argument("not a serialized row: missing leading or trailing tab");
  }

  std::vector<std::string> cells;
  for (size_t i = 1; i + 1 < tokens.size(); ++i) {
    std::string cell = tokens[i];
    // Each cell is padded by exactly one space on either side.
    if (cell.size() < 2 || cell.front() != ' ' || cell.back() != ' ') {
      throw std::invalid_argument("not a serialized row: bad cell padding");
    }
    cells.push_back(cell.substr(1, cell.size() - 2));
  }
  return cells;
}

void writeTablesAsCsv(const std::vector<PageTable>& tables, const std::string& outDir) {
  if (!std::filesystem::exists(outDir)) {
    std::filesystem::create_directories(outDir);
  }
  int indexPerPage = 0;
  int prevPage = -1;
  for (const auto& t : tables) {
    if (t.pageNumber != prevPage) { prevPage = t.pageNumber; indexPerPage = 0; }
    std::string filename = outDir + "/table_" + std::to_string(t.pageNumber) + "_" + std::to_string(indexPerPage++) + ".csv";
    std::ofstream ofs(filename);
    if (!ofs) throw std::runtime_error("Cannot open " + filename + " for writing");
    auto writeRow = [&](const std::vector<std::string>& row) {
      for (size_t i = 0; i < row.size(); ++i) {
        const std::string& cell = row[i];
        bool needQuotes = cell.find(',') != std::string::npos || cell.find('"') != std::string::npos || cell.find('\n') != std::string::npos;
        if (needQuotes) {
          std::string escaped;
          for (char ch : cell) {
            if (ch == '"') escaped += '"';
            escaped += ch;
          }
          ofs << '"' << escaped << '"';
        } else {
          ofs << cell;
        }
        if (i + 1 < row.size()) ofs << ',';
      }
      ofs << "\n";
    };

    for (const auto& r : t.rows) writeRow(r);
  }
}
