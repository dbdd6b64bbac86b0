#include "layout.hpp"

#include "text_util.hpp"

std::vector<TextFragment> fragmentsFromPage(const PageLayout& page) {
  std::vector<TextFragment> fragments;
  for (const auto& e : page.elements) {
    if (e.kind != ElementKind::TextContainer) continue;
    std::string text = trimText(e.text);
    if (text.empty()) continue;
    fragments.push_back(TextFragment{std::move(text), e.x0, e.y0, e.x1, e.y1, page.height});
  }
  return fragments;
}
