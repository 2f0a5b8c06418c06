#pragma once

#include <optional>
#include <string>

namespace processing
{

/// Returned by index searches when nothing matches
constexpr int kIndexNotFound = -1;

/// Substituted for every byte that is not part of a valid UTF-8 sequence
constexpr char32_t kReplacementCharacter = U'\uFFFD';

/// UTF-8 to UTF-32 conversion. Invalid bytes decode to kReplacementCharacter.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// UTF-8 to wide conversion for std::wregex input (one element per code point
/// where wchar_t is 32 bits, surrogate pairs where it is 16 bits)
std::wstring utf8ToWide(const std::string& utf8_str);

/// Wide to UTF-8 conversion, inverse of utf8ToWide
std::string wideToUtf8(const std::wstring& wide_str);

/// Breaking whitespace: Zs/Zl/Zp
/// without the no-break spaces, plus U+0009..U+000D and U+001C..U+001F
[[nodiscard]] bool isWhitespace(char32_t cp);

/// Absent, empty, or whitespace only
[[nodiscard]] bool isBlank(const std::optional<std::string>& text);

/// Absent or empty
[[nodiscard]] bool isEmpty(const std::optional<std::string>& text);

/// Absent becomes the empty string
[[nodiscard]] std::string defaultString(const std::optional<std::string>& text);

/// First index of cp at or after from, or kIndexNotFound
[[nodiscard]] int indexOf(const std::u32string& text, char32_t cp, int from);

/// Line terminator of the host platform
[[nodiscard]] const std::string& platformLineSeparator();

} // namespace processing
