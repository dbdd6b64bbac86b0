#include "text_util.hpp"

namespace {

unsigned char byteAt(const std::string& s, std::size_t pos) {
  return pos < s.size() ? static_cast<unsigned char>(s[pos]) : 0;
}

} // namespace

std::size_t whitespaceLength(const std::string& s, std::size_t pos) {
  unsigned char b0 = byteAt(s, pos);
  if (b0 == ' ' || (b0 >= 0x09 && b0 <= 0x0D) || (b0 >= 0x1C && b0 <= 0x1F)) return 1;

  unsigned char b1 = byteAt(s, pos + 1);
  if (b0 == 0xC2 && (b1 == 0x85 || b1 == 0xA0)) return 2;

  unsigned char b2 = byteAt(s, pos + 2);
  switch (b0) {
    case 0xE1: // U+1680
      return b1 == 0x9A && b2 == 0x80 ? 3 : 0;
    case 0xE2:
      if (b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) return 3;
      return b1 == 0x81 && b2 == 0x9F ? 3 : 0; // U+205F
    case 0xE3: // U+3000
      return b1 == 0x80 && b2 == 0x80 ? 3 : 0;
    default:
      return 0;
  }
}

std::string trimText(const std::string& s) {
  std::size_t start = 0;
  while (std::size_t n = whitespaceLength(s, start)) start += n;

  // Trailing side: remember where the last non-space code point ends.
  std::size_t end = start;
  std::size_t pos = start;
  while (pos < s.size()) {
    std::size_t n = whitespaceLength(s, pos);
    if (n == 0) {
      ++pos;
      end = pos;
    } else {
      pos += n;
    }
  }
  return s.substr(start, end - start);
}

std::string collapseWhitespace(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool pendingSpace = false;
  std::size_t pos = 0;
  while (pos < s.size()) {
    std::size_t n = whitespaceLength(s, pos);
    if (n > 0) {
      pendingSpace = !out.empty();
      pos += n;
      continue;
    }
    if (pendingSpace) out.push_back(' ');
    pendingSpace = false;
    out.push_back(s[pos++]);
  }
  return out;
}
