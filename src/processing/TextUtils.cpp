#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // one replacement character per rejected byte, decoding resumes after it
            result.push_back(kReplacementCharacter);
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

std::wstring utf8ToWide(const std::string& utf8_str)
{
    std::u32string cps = utf8ToUtf32(utf8_str);
    std::wstring result;
    result.reserve(cps.size());
    for (char32_t cp : cps)
    {
        if constexpr (sizeof(wchar_t) == 2)
        {
            if (cp >= 0x10000u)
            {
                cp -= 0x10000u;
                result.push_back(static_cast<wchar_t>(0xD800u + (cp >> 10)));
                result.push_back(static_cast<wchar_t>(0xDC00u + (cp & 0x3FFu)));
                continue;
            }
        }
        result.push_back(static_cast<wchar_t>(cp));
    }
    return result;
}

std::string wideToUtf8(const std::wstring& wide_str)
{
    std::u32string cps;
    cps.reserve(wide_str.size());
    for (size_t i = 0; i < wide_str.size(); ++i)
    {
        char32_t cp = static_cast<char32_t>(wide_str[i]);
        if constexpr (sizeof(wchar_t) == 2)
        {
            if (cp >= 0xD800u && cp <= 0xDBFFu && i + 1 < wide_str.size())
            {
                char32_t low = static_cast<char32_t>(wide_str[i + 1]);
                if (low >= 0xDC00u && low <= 0xDFFFu)
                {
                    cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
                    ++i;
                }
            }
        }
        cps.push_back(cp);
    }
    return utf32ToUtf8(cps);
}

bool isWhitespace(char32_t cp)
{
    if ((cp >= 0x09u && cp <= 0x0Du) || (cp >= 0x1Cu && cp <= 0x1Fu))
        return true;

    // no-break spaces are separators but not whitespace
    if (cp == 0x00A0u || cp == 0x2007u || cp == 0x202Fu)
        return false;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

bool isBlank(const std::optional<std::string>& text)
{
    if (isEmpty(text))
        return true;
    for (char32_t cp : utf8ToUtf32(*text))
    {
        if (!isWhitespace(cp))
            return false;
    }
    return true;
}

bool isEmpty(const std::optional<std::string>& text)
{
    return !text || text->empty();
}

std::string defaultString(const std::optional<std::string>& text)
{
    return text.value_or(std::string());
}

int indexOf(const std::u32string& text, char32_t cp, int from)
{
    if (from < 0)
        from = 0;
    if (static_cast<size_t>(from) >= text.size())
        return kIndexNotFound;

    auto pos = text.find(cp, static_cast<size_t>(from));
    return pos == std::u32string::npos ? kIndexNotFound : static_cast<int>(pos);
}

const std::string& platformLineSeparator()
{
#ifdef _WIN32
    static const std::string separator = "\r\n";
#else
    static const std::string separator = "\n";
#endif
    return separator;
}

} // namespace processing
