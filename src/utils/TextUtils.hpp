#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace utils
{

/// Number of Unicode code points in a UTF-8 string.
/// Malformed sequences count one per byte.
std::size_t countCodepoints(std::string_view utf8_str);

/// Unicode whitespace test (Zs category, or bidi class WS / B / S)
bool isUnicodeSpace(char32_t cp);

/// True when the string is empty or made only of Unicode whitespace
bool isBlank(std::string_view utf8_str);

/// Split into lines, keeping line terminators (\n, \r\n, \r, \v, \f,
/// \x1c-\x1e, U+0085, U+2028, U+2029). A trailing piece without a
/// terminator is kept; an empty string yields no lines.
std::vector<std::string> splitLinesKeepEnds(std::string_view utf8_str);

/// Split on runs of Unicode whitespace, dropping empty pieces
std::vector<std::string> splitWhitespace(std::string_view utf8_str);

} // namespace utils
