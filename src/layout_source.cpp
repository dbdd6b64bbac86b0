#include "layout_source.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

struct Box {
  double xMin = 0;
  double yMin = 0;
  double xMax = 0;
  double yMax = 0;
};

struct Word {
  Box box;
  std::string text;
};

struct Line {
  Box box;
  std::vector<Word> words;
};

struct Block {
  Box box;
  std::vector<Line> lines;
};

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string runPdftotextBboxLayout(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!commandExists("pdftotext")) {
    throw DocumentLayoutError("pdftotext not found; install poppler-utils");
  }
  std::string cmd = "pdftotext -bbox-layout";
  if (firstPage > 0) {
    cmd += " -f " + std::to_string(firstPage);
  }
  if (lastPage > 0 && lastPage >= firstPage) {
    cmd += " -l " + std::to_string(lastPage);
  }
  cmd += " -q " + shellQuote(pdfPath) + " -";

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw DocumentLayoutError("Failed to run pdftotext -bbox-layout");
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int rc = pclose(pipe);
  if (rc != 0) throw DocumentLayoutError("pdftotext -bbox-layout returned error");
  return out;
}

std::map<std::string, std::string> parseAttributes(const std::string& raw) {
  static const std::regex attrRe("([A-Za-z]+)=\"([^\"]*)\"");
  std::map<std::string, std::string> attrs;
  for (std::sregex_iterator it(raw.begin(), raw.end(), attrRe), end; it != end; ++it) {
    attrs[(*it)[1].str()] = (*it)[2].str();
  }
  return attrs;
}

double numberAttr(const std::map<std::string, std::string>& attrs, const std::string& key, int page) {
  auto it = attrs.find(key);
  if (it == attrs.end()) {
    throw DocumentLayoutError("page " + std::to_string(page) + ": missing attribute " + key, page);
  }
  try {
    size_t used = 0;
    double v = std::stod(it->second, &used);
    if (used != it->second.size()) throw std::invalid_argument(key);
    return v;
  } catch (const std::logic_error&) {
    throw DocumentLayoutError("page " + std::to_string(page) + ": bad " + key + " value '" + it->second + "'", page);
  }
}

// A bad number attribute faults the page under the number it would have had.
int pageNumberAttr(const std::map<std::string, std::string>& attrs, int expected) {
  const std::string& raw = attrs.at("number");
  try {
    size_t used = 0;
    int v = std::stoi(raw, &used);
    if (used == raw.size() && v >= 1) return v;
  } catch (const std::logic_error&) {
  }
  throw DocumentLayoutError("page " + std::to_string(expected) + ": bad number value '" + raw + "'", expected);
}

Box boxAttr(const std::map<std::string, std::string>& attrs, int page) {
  Box b;
  b.xMin = numberAttr(attrs, "xMin", page);
  b.yMin = numberAttr(attrs, "yMin", page);
  b.xMax = numberAttr(attrs, "xMax", page);
  b.yMax = numberAttr(attrs, "yMax", page);
  return b;
}

// pdftotext measures y from the top edge; flip to a bottom-left origin.
LayoutElement textElement(const Box& b, std::string text, double pageHeight) {
  return LayoutElement{ElementKind::TextContainer, std::move(text),
                       b.xMin, pageHeight - b.yMax, b.xMax, pageHeight - b.yMin};
}

std::string lineText(const Line& line) {
  std::string out;
  for (const auto& w : line.words) {
    if (!out.empty()) out += ' ';
    out += w.text;
  }
  return out;
}

std::string blockText(const Block& block) {
  std::string out;
  for (size_t i = 0; i < block.lines.size(); ++i) {
    if (i > 0) out += '\n';
    out += lineText(block.lines[i]);
  }
  return out;
}

void emitBlock(const Block& block, ContainerLevel level, PageLayout& page) {
  switch (level) {
    case ContainerLevel::Block:
      page.elements.push_back(textElement(block.box, blockText(block), page.height));
      break;
    case ContainerLevel::Line:
      for (const auto& l : block.lines) page.elements.push_back(textElement(l.box, lineText(l), page.height));
      break;
    case ContainerLevel::Word:
      for (const auto& l : block.lines) {
        for (const auto& w : l.words) page.elements.push_back(textElement(w.box, w.text, page.height));
      }
      break;
  }
}

} // namespace

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (char ch : arg) {
    if (ch == '\'') out += "'\\''";
    else out += ch;
  }
  out += "'";
  return out;
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          bool valid = !digits.empty();
          for (char c : digits) {
            if (!(hex ? std::isxdigit(static_cast<unsigned char>(c)) : std::isdigit(static_cast<unsigned char>(c)))) valid = false;
          }
          if (valid && digits.size() <= 6) {
            unsigned long code = std::stoul(digits, nullptr, hex ? 16 : 10);
            // UTF-8 encode
            if (code < 0x80) {
              rep.push_back(static_cast<char>(code));
            } else if (code < 0x800) {
              rep.push_back(static_cast<char>(0xC0 | (code >> 6)));
              rep.push_back(static_cast<char>(0x80 | (code & 0x3F)));
            } else if (code < 0x10000) {
              rep.push_back(static_cast<char>(0xE0 | (code >> 12)));
              rep.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
              rep.push_back(static_cast<char>(0x80 | (code & 0x3F)));
            } else if (code < 0x110000) {
              rep.push_back(static_cast<char>(0xF0 | (code >> 18)));
              rep.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
              rep.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
              rep.push_back(static_cast<char>(0x80 | (code & 0x3F)));
            }
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

std::vector<PageSlot> parseBboxLayout(const std::string& xhtml, ContainerLevel level, int firstPage) {
  static const std::regex tagRe("<(/?)(page|block|line|word)\\b([^>]*)>");

  std::vector<PageSlot> pages;
  PageSlot slot;
  bool inPage = false;
  Block block;
  Line line;
  int nextNumber = firstPage > 0 ? firstPage : 1;

  auto begin = std::sregex_iterator(xhtml.begin(), xhtml.end(), tagRe);
  for (auto it = begin, end = std::sregex_iterator(); it != end; ++it) {
    const std::smatch& m = *it;
    bool closing = m[1].length() > 0;
    std::string tag = m[2].str();

    if (tag == "page") {
      if (closing) {
        if (inPage) pages.push_back(std::move(slot));
        slot = PageSlot{};
        inPage = false;
        continue;
      }
      slot = PageSlot{};
      inPage = true;
      auto attrs = parseAttributes(m[3].str());
      slot.layout.pageNumber = nextNumber;
      slot.layout.width = 0;
      slot.layout.height = 0;
      try {
        if (attrs.count("number")) slot.layout.pageNumber = pageNumberAttr(attrs, nextNumber);
        slot.layout.width = numberAttr(attrs, "width", slot.layout.pageNumber);
        slot.layout.height = numberAttr(attrs, "height", slot.layout.pageNumber);
        if (slot.layout.height <= 0) {
          throw DocumentLayoutError("page " + std::to_string(slot.layout.pageNumber) + ": non-positive height",
                                    slot.layout.pageNumber);
        }
      } catch (const DocumentLayoutError&) {
        slot.fault = std::current_exception();
      }
      nextNumber = slot.layout.pageNumber + 1;
      continue;
    }

    // Once a page is faulted the rest of its content is ignored.
    if (!inPage || slot.fault) continue;

    try {
      if (tag == "block") {
        if (closing) {
          emitBlock(block, level, slot.layout);
        } else {
          block = Block{};
          block.box = boxAttr(parseAttributes(m[3].str()), slot.layout.pageNumber);
        }
      } else if (tag == "line") {
        if (closing) {
          block.lines.push_back(std::move(line));
        } else {
          line = Line{};
          line.box = boxAttr(parseAttributes(m[3].str()), slot.layout.pageNumber);
        }
      } else if (!closing) { // word
        Word w;
        w.box = boxAttr(parseAttributes(m[3].str()), slot.layout.pageNumber);
        size_t textStart = m.position(0) + m.length(0);
        size_t textEnd = xhtml.find("</word>", textStart);
        if (textEnd == std::string::npos) {
          throw DocumentLayoutError("page " + std::to_string(slot.layout.pageNumber) + ": unterminated word",
                                    slot.layout.pageNumber);
        }
        w.text = decodeEntities(xhtml.substr(textStart, textEnd - textStart));
        line.words.push_back(std::move(w));
      }
    } catch (const DocumentLayoutError&) {
      slot.fault = std::current_exception();
    }
  }

  // Output truncated before </page>.
  if (inPage) {
    if (!slot.fault) {
      slot.fault = std::make_exception_ptr(DocumentLayoutError(
        "page " + std::to_string(slot.layout.pageNumber) + ": truncated layout", slot.layout.pageNumber));
    }
    pages.push_back(std::move(slot));
  }
  return pages;
}

std::vector<PageSlot> loadPdfLayout(const std::string& pdfPath, ContainerLevel level, int firstPage, int lastPage) {
  std::string xhtml = runPdftotextBboxLayout(pdfPath, firstPage, lastPage);
  return parseBboxLayout(xhtml, level, firstPage);
}
