#pragma once

#include "layout.hpp"

#include <exception>
#include <string>
#include <vector>

// Which pdftotext element becomes one text container.
enum class ContainerLevel { Block, Line, Word };

// One page of the layout collaborator's output. When the page could not be
// read, fault holds a DocumentLayoutError and layout is only partially set.
struct PageSlot {
  PageLayout layout;
  std::exception_ptr fault;
};

// Parses `pdftotext -bbox-layout` output. Pages lacking a number attribute
// are numbered consecutively from firstPage. Per-page problems are stored in
// PageSlot::fault rather than thrown.
std::vector<PageSlot> parseBboxLayout(const std::string& xhtml,
                                      ContainerLevel level = ContainerLevel::Block,
                                      int firstPage = 1);

// Runs `pdftotext -bbox-layout` on the file and parses the result.
// lastPage == -1 reads until the end; callers validate the range beforehand.
// Throws DocumentLayoutError when pdftotext is missing or fails.
std::vector<PageSlot> loadPdfLayout(const std::string& pdfPath,
                                    ContainerLevel level = ContainerLevel::Block,
                                    int firstPage = 1,
                                    int lastPage = -1);

std::string decodeEntities(const std::string& in);

// Single-quotes an argument for /bin/sh; embedded quotes become '\''.
std::string shellQuote(const std::string& arg);
