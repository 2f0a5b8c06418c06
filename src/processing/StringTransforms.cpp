#include "StringTransforms.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <unordered_set>

#include <utf8proc.h>

namespace processing
{

namespace
{

std::unordered_set<char32_t> makeDelimiterSet(const std::string& delimiters)
{
    std::u32string cps = utf8ToUtf32(delimiters);
    return std::unordered_set<char32_t>(cps.begin(), cps.end());
}

// Category alone misses Other_Uppercase / Other_Lowercase (U+24B6, U+2160, ...)
bool isUpperOrTitle(char32_t cp)
{
    const auto c = static_cast<utf8proc_int32_t>(cp);
    const auto category = utf8proc_category(c);
    return category == UTF8PROC_CATEGORY_LU || category == UTF8PROC_CATEGORY_LT || utf8proc_isupper(c);
}

bool isLower(char32_t cp)
{
    const auto c = static_cast<utf8proc_int32_t>(cp);
    return utf8proc_category(c) == UTF8PROC_CATEGORY_LL || utf8proc_islower(c);
}

char32_t toLower(char32_t cp) { return static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp))); }

char32_t toUpper(char32_t cp) { return static_cast<char32_t>(utf8proc_toupper(static_cast<utf8proc_int32_t>(cp))); }

char32_t toTitle(char32_t cp) { return static_cast<char32_t>(utf8proc_totitle(static_cast<utf8proc_int32_t>(cp))); }

} // anonymous namespace

void validateAbbreviateBounds(int lower, int upper)
{
    if (upper < -1)
        throw std::invalid_argument("upper value cannot be less than -1");
    if (upper < lower && upper != -1)
        throw std::invalid_argument("upper value is less than lower value");
}

std::optional<std::string> abbreviate(const std::optional<std::string>& text, int lower, int upper,
                                      const std::optional<std::string>& suffix)
{
    validateAbbreviateBounds(lower, upper);
    if (isEmpty(text))
        return text;

    const std::u32string cps = utf8ToUtf32(*text);
    const int length = static_cast<int>(cps.size());

    lower = std::clamp(lower, 0, length);
    if (upper == -1 || upper > length)
        upper = length;

    std::u32string result;
    const int space = indexOf(cps, U' ', lower);
    if (space == kIndexNotFound)
    {
        result.assign(cps, 0, static_cast<size_t>(upper));
        if (upper != length)
            result += utf8ToUtf32(defaultString(suffix));
    }
    else
    {
        result.assign(cps, 0, static_cast<size_t>(std::min(space, upper)));
        result += utf8ToUtf32(defaultString(suffix));
    }

    TEXTKIT_TRACE << "[abbreviate] lower=" << lower << " upper=" << upper << " space=" << space
                  << " input=" << Diagnostics::Preview(*text);
    return utf32ToUtf8(result);
}

std::optional<std::string> initials(const std::optional<std::string>& text, const std::optional<std::string>& delimiters)
{
    if (isEmpty(text))
        return text;
    if (delimiters && delimiters->empty())
        return std::string();

    const bool use_whitespace = !delimiters.has_value();
    const auto delimiter_set = use_whitespace ? std::unordered_set<char32_t>{} : makeDelimiterSet(*delimiters);

    std::u32string result;
    bool last_was_gap = true;
    for (char32_t cp : utf8ToUtf32(*text))
    {
        const bool is_delimiter = use_whitespace ? isWhitespace(cp) : delimiter_set.count(cp) != 0;
        if (is_delimiter)
        {
            last_was_gap = true;
        }
        else if (last_was_gap)
        {
            result.push_back(cp);
            last_was_gap = false;
        }
    }

    TEXTKIT_TRACE << "[initials] words=" << result.size() << " input=" << Diagnostics::Preview(*text);
    return utf32ToUtf8(result);
}

std::optional<std::string> swapCase(const std::optional<std::string>& text)
{
    if (isEmpty(text))
        return text;

    std::u32string cps = utf8ToUtf32(*text);
    bool whitespace = true;
    std::size_t changed = 0;
    for (char32_t& cp : cps)
    {
        const char32_t before = cp;
        if (isUpperOrTitle(cp))
        {
            cp = toLower(cp);
            whitespace = false;
        }
        else if (isLower(cp))
        {
            if (whitespace)
            {
                cp = toTitle(cp);
                whitespace = false;
            }
            else
            {
                cp = toUpper(cp);
            }
        }
        else
        {
            whitespace = isWhitespace(cp);
        }
        if (cp != before)
            ++changed;
    }

    TEXTKIT_TRACE << "[swapCase] changed=" << changed << " input=" << Diagnostics::Preview(*text);
    return utf32ToUtf8(cps);
}

} // namespace processing
