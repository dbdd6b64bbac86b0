#include <catch2/catch_all.hpp>

#include "table_extractor.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

PageSlot page(int number, std::vector<LayoutElement> elements) {
  PageSlot slot;
  slot.layout = PageLayout{number, 612, 792, std::move(elements)};
  return slot;
}

LayoutElement text(const std::string& s, double x0, double y0, double x1) {
  return LayoutElement{ElementKind::TextContainer, s, x0, y0, x1, y0 + 10};
}

PageSlot faulted(int number) {
  PageSlot slot = page(number, {});
  slot.fault = std::make_exception_ptr(DocumentLayoutError("broken page", number));
  return slot;
}

} // namespace

TEST_CASE("pages without usable text produce no table", "[extract]") {
  std::vector<PageSlot> pages = {
    page(1, {}),
    page(2, {LayoutElement{ElementKind::Rectangle, "", 0, 0, 100, 100}, text("   ", 10, 100, 20)}),
  };

  auto tables = extractTables(pages, ExtractOptions{});

  REQUIRE(tables.empty());
  REQUIRE(serializeDocument(tables).empty());
}

TEST_CASE("a block holding only an ideographic space adds no cell", "[extract]") {
  std::vector<PageSlot> pages = {page(1, {text("\xE3\x80\x80", 10, 700, 40), text("A", 60, 700, 70)})};

  auto rows = serializeTables(extractTables(pages, ExtractOptions{}));

  REQUIRE(rows.size() == 1);
  REQUIRE(rows[0] == "\t A \t");
  REQUIRE(splitSerializedRow(rows[0]).size() == 1);
}

TEST_CASE("tables come back in ascending page order", "[extract]") {
  std::vector<PageSlot> pages;
  for (int n : {4, 1, 7, 2, 6, 3, 8, 5}) {
    pages.push_back(page(n, {text("page " + std::to_string(n), 10, 700, 60), text("x", 100, 700, 110)}));
  }

  for (unsigned jobs : {1u, 3u, 8u}) {
    ExtractOptions options;
    options.jobs = jobs;
    auto tables = extractTables(pages, options);

    REQUIRE(tables.size() == 8);
    for (size_t i = 0; i < tables.size(); ++i) {
      REQUIRE(tables[i].pageNumber == static_cast<int>(i + 1));
      REQUIRE(tables[i].rows.front().front() == "page " + std::to_string(i + 1));
    }
  }
}

TEST_CASE("column-exact extraction through the page pipeline", "[extract]") {
  ExtractOptions options;
  options.rows = RowBuilderConfig::forMode(RowMode::ColumnExact);
  std::vector<PageSlot> pages = {page(1, {
    text("Item", 10, 700, 40), text("Qty", 100, 702, 120),
    text("Tea\n green", 10, 680, 45), text("2", 104, 683, 110),
  })};

  auto rows = serializeTables(extractTables(pages, options));

  REQUIRE(rows.size() == 2);
  REQUIRE(rows[0] == "\t Item \t Qty \t");
  REQUIRE(rows[1] == "\t Tea green \t 2 \t");
}

TEST_CASE("layout faults abort or skip according to policy", "[extract]") {
  std::vector<PageSlot> pages = {page(1, {text("one", 10, 700, 40)}), faulted(2), page(3, {text("three", 10, 700, 40)})};

  ExtractOptions options;
  REQUIRE_THROWS_AS(extractTables(pages, options), DocumentLayoutError);

  options.onLayoutError = LayoutErrorPolicy::SkipPage;
  options.jobs = 2;
  auto tables = extractTables(pages, options);
  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].pageNumber == 1);
  REQUIRE(tables[1].pageNumber == 3);
}

TEST_CASE("invalid extraction options are rejected", "[extract]") {
  ExtractOptions options;
  options.jobs = 0;
  REQUIRE_THROWS_AS(validateOptions(options), std::invalid_argument);

  options = ExtractOptions{};
  options.firstPage = 4;
  options.lastPage = 2;
  REQUIRE_THROWS_AS(validateOptions(options), std::invalid_argument);

  options = ExtractOptions{};
  options.rows.rowThreshold = -5;
  REQUIRE_THROWS_AS(extractTables({}, options), std::invalid_argument);

  REQUIRE_NOTHROW(validateOptions(ExtractOptions{}));
}
