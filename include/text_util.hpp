#pragma once

#include <cstddef>
#include <string>

// Byte length of the whitespace code point starting at s[pos], or 0 when the
// code point there is not whitespace. Input is UTF-8; the whitespace set is
// ASCII \t \n \v \f \r, U+001C-U+001F, space, U+0085, U+00A0, U+1680,
// U+2000-U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
std::size_t whitespaceLength(const std::string& s, std::size_t pos);

// Strips leading and trailing whitespace.
std::string trimText(const std::string& s);

// Replaces every whitespace run with a single ASCII space and trims.
std::string collapseWhitespace(const std::string& s);
