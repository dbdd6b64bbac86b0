#include <catch2/catch_all.hpp>

#include "table_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

TEST_CASE("serializeRow produces the tab layout", "[writer]") {
  REQUIRE(serializeRow({"a", "b", "c"}) == "\t a \t b \t c \t");
  REQUIRE(serializeRow({"Total: 42"}) == "\t Total: 42 \t");
}

TEST_CASE("splitting a serialized row recovers the cells", "[writer]") {
  std::vector<std::string> cells = {"Name", "Total due", "A&B", "42"};

  auto back = splitSerializedRow(serializeRow(cells));

  REQUIRE(back == cells);
  REQUIRE_THROWS_AS(splitSerializedRow("a \t b"), std::invalid_argument);
  REQUIRE_THROWS_AS(splitSerializedRow("\tx\t"), std::invalid_argument);
}

TEST_CASE("document serialization joins pages in the given order", "[writer]") {
  std::vector<PageTable> tables = {
    PageTable{1, {{"a", "b"}, {"c"}}},
    PageTable{2, {{"d"}}},
  };

  REQUIRE(serializeTables(tables).size() == 3);
  REQUIRE(serializeDocument(tables) == "\t a \t b \t\n\t c \t\n\t d \t");
  REQUIRE(serializeDocument({}).empty());
}

TEST_CASE("writeTablesAsCsv quotes cells that need it", "[writer]") {
  auto dir = std::filesystem::temp_directory_path() / "pdftable_csv_test";
  std::filesystem::remove_all(dir);

  writeTablesAsCsv({PageTable{3, {{"Item", "Price"}, {"Tea, green", "say \"hi\""}}}}, dir.string());

  std::ifstream in(dir / "table_3_0.csv");
  REQUIRE(in.good());
  std::stringstream ss;
  ss << in.rdbuf();
  REQUIRE(ss.str() == "Item,Price\n\"Tea, green\",\"say \"\"hi\"\"\"\n");

  std::filesystem::remove_all(dir);
}
