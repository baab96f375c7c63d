#include "TextUtils.hpp"
#include <utf8proc.h>

namespace utils
{

namespace
{

// Decodes one code point at `pos`. Returns the number of bytes consumed, never 0.
std::size_t nextCodepoint(std::string_view str, std::size_t pos, char32_t& out)
{
    const auto* bytes = reinterpret_cast<const utf8proc_uint8_t*>(str.data() + pos);
    utf8proc_int32_t codepoint = -1;
    utf8proc_ssize_t len = utf8proc_iterate(bytes, static_cast<utf8proc_ssize_t>(str.size() - pos), &codepoint);
    if (len <= 0)
    {
        out = static_cast<unsigned char>(str[pos]);
        return 1;
    }
    out = static_cast<char32_t>(codepoint);
    return static_cast<std::size_t>(len);
}

} // namespace

std::size_t countCodepoints(std::string_view utf8_str)
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        char32_t cp;
        pos += nextCodepoint(utf8_str, pos, cp);
        ++count;
    }
    return count;
}

bool isUnicodeSpace(char32_t cp)
{
    if (cp < 0x80)
        return cp == U' ' || (cp >= U'\t' && cp <= U'\r') || (cp >= 0x1C && cp <= 0x1F);

    const utf8proc_property_t* prop = utf8proc_get_property(static_cast<utf8proc_int32_t>(cp));
    if (prop->category == UTF8PROC_CATEGORY_ZS)
        return true;
    return prop->bidi_class == UTF8PROC_BIDI_CLASS_WS || prop->bidi_class == UTF8PROC_BIDI_CLASS_B ||
           prop->bidi_class == UTF8PROC_BIDI_CLASS_S;
}

bool isBlank(std::string_view utf8_str)
{
    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        char32_t cp;
        pos += nextCodepoint(utf8_str, pos, cp);
        if (!isUnicodeSpace(cp))
            return false;
    }
    return true;
}

std::vector<std::string> splitLinesKeepEnds(std::string_view utf8_str)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        char32_t cp;
        std::size_t len = nextCodepoint(utf8_str, pos, cp);
        bool is_break = false;
        switch (cp)
        {
        case U'\r':
            if (pos + 1 < utf8_str.size() && utf8_str[pos + 1] == '\n')
                ++len;
            is_break = true;
            break;
        case U'\n':
        case U'\v':
        case U'\f':
        case 0x1C:
        case 0x1D:
        case 0x1E:
        case 0x85:
        case 0x2028:
        case 0x2029:
            is_break = true;
            break;
        default:
            break;
        }
        pos += len;
        if (is_break)
        {
            lines.emplace_back(utf8_str.substr(start, pos - start));
            start = pos;
        }
    }
    if (start < utf8_str.size())
        lines.emplace_back(utf8_str.substr(start));
    return lines;
}

std::vector<std::string> splitWhitespace(std::string_view utf8_str)
{
    std::vector<std::string> parts;
    std::size_t start = std::string_view::npos;
    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        char32_t cp;
        std::size_t len = nextCodepoint(utf8_str, pos, cp);
        if (isUnicodeSpace(cp))
        {
            if (start != std::string_view::npos)
            {
                parts.emplace_back(utf8_str.substr(start, pos - start));
                start = std::string_view::npos;
            }
        }
        else if (start == std::string_view::npos)
        {
            start = pos;
        }
        pos += len;
    }
    if (start != std::string_view::npos)
        parts.emplace_back(utf8_str.substr(start));
    return parts;
}

} // namespace utils
