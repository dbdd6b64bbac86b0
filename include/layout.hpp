#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Coordinates are in page units with the origin at the bottom-left corner,
// so a larger y0 means closer to the top of the page.
struct TextFragment {
  std::string text;
  double x0;
  double y0;
  double x1;
  double y1;
  double pageHeight;
};

enum class ElementKind { TextContainer, Rectangle, Line };

struct LayoutElement {
  ElementKind kind;
  std::string text; // empty for rectangles and lines
  double x0;
  double y0;
  double x1;
  double y1;
};

struct PageLayout {
  int pageNumber;
  double width;
  double height;
  std::vector<LayoutElement> elements;
};

// Raised when the layout of a page (or of the whole document, page == 0)
// cannot be obtained from the page-layout collaborator.
class DocumentLayoutError : public std::runtime_error {
public:
  DocumentLayoutError(const std::string& what, int page = 0)
    : std::runtime_error(what), page_(page) {}

  int page() const { return page_; }

private:
  int page_;
};

// Text containers of the page whose trimmed text is non-empty, in order of
// appearance. Rectangles and lines are skipped.
std::vector<TextFragment> fragmentsFromPage(const PageLayout& page);
