#include <catch2/catch_test_macros.hpp>
#include "processing/LineWrapper.hpp"
#include "processing/TextUtils.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using processing::LineWrapper;
using processing::WrapOptions;
using processing::wrap;

namespace
{
std::vector<std::string> splitLines(const std::string& text, const std::string& separator = "\n")
{
    std::vector<std::string> lines;
    size_t start = 0;
    size_t pos = 0;
    while ((pos = text.find(separator, start)) != std::string::npos)
    {
        lines.push_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }
    lines.push_back(text.substr(start));
    return lines;
}

size_t codePoints(const std::string& text)
{
    return processing::utf8ToUtf32(text).size();
}
} // namespace

TEST_CASE("wrap breaks at the last space that fits", "[line_wrapper]")
{
    const std::string input = "Here is one line of text that is going to be wrapped after 20 columns.";
    auto result = wrap(input, 20, "\n", false);
    REQUIRE(result == "Here is one line of\ntext that is going\nto be wrapped after\n20 columns.");

    for (const auto& line : splitLines(*result))
        REQUIRE(codePoints(line) <= 20);
}

TEST_CASE("wrap splits long words when asked to", "[line_wrapper]")
{
    REQUIRE(wrap("abcdefghij", 3, "\n", true) == "abc\ndef\nghi\nj");

    auto result = wrap("Click here to jump to the commons website - https://commons.apache.org", 20, "\n", true, " ");
    REQUIRE(result == "Click here to jump\nto the commons\nwebsite -\nhttps://commons.apac\nhe.org");
    for (const auto& line : splitLines(*result))
        REQUIRE(codePoints(line) <= 20);
}

TEST_CASE("wrap keeps long words whole and lets that line run over the limit", "[line_wrapper]")
{
    auto result = wrap("Click here to jump to the commons website - https://commons.apache.org", 20, "\n", false, " ");
    REQUIRE(result == "Click here to jump\nto the commons\nwebsite -\nhttps://commons.apache.org");

    auto lines = splitLines(*result);
    REQUIRE(lines.size() == 4);
    for (size_t i = 0; i + 1 < lines.size(); ++i)
        REQUIRE(codePoints(lines[i]) <= 20);
    // the unbreakable word is the one permitted overrun
    REQUIRE(codePoints(lines.back()) > 20);
    REQUIRE(lines.back().find(' ') == std::string::npos);
}

TEST_CASE("wrap without wrapLongWords breaks at the next match past the limit", "[line_wrapper]")
{
    REQUIRE(wrap("Click here, https://commons.apache.org, to jump to the commons website", 20, "\n", false, ",") ==
            "Click here\n https://commons.apache.org\n to jump to the commons website");
    REQUIRE(wrap("abcdef", 2, "|", false, "z") == "abcdef");
    REQUIRE(wrap("abcdef", 2, "|", true, "z") == "ab|cd|ef");
}

TEST_CASE("wrap on a custom single-character pattern", "[line_wrapper]")
{
    REQUIRE(wrap("flammable", 4, "\n", true, "a") == "fl\nmm\nble");
}

TEST_CASE("wrap uses the given newline between lines only", "[line_wrapper]")
{
    REQUIRE(wrap("aaa bbb ccc", 3, "<br/>", false) == "aaa<br/>bbb<br/>ccc");
    REQUIRE(wrap("short", 10, "<br/>", false) == "short");
}

TEST_CASE("wrap defaults to the platform line separator and a space pattern", "[line_wrapper]")
{
    const std::string& nl = processing::platformLineSeparator();
    REQUIRE(wrap("aaa bbb", 3) == "aaa" + nl + "bbb");
    REQUIRE(wrap("aaa bbb", 3, "\n", false, "   ") == "aaa\nbbb");
    REQUIRE(wrap("aaa bbb", 3, "\n", false, "") == "aaa\nbbb");
}

TEST_CASE("wrap consumes delimiters at a window start without emitting empty lines", "[line_wrapper]")
{
    REQUIRE(wrap("   leading", 5, "\n", true) == "leadi\nng");
    REQUIRE(wrap("a  b", 1, "\n", false) == "a\nb");
}

TEST_CASE("wrap clamps the width up to one", "[line_wrapper]")
{
    REQUIRE(wrap("ab cd", 0, "\n", false) == "ab\ncd");
    REQUIRE(wrap("ab cd", -3, "\n", false) == "ab\ncd");
    REQUIRE(wrap("abc", 0, "\n", true) == "a\nb\nc");
    REQUIRE(LineWrapper(WrapOptions{ .wrap_length = -7 }).wrapLength() == 1);
}

TEST_CASE("wrap measures the width in code points", "[line_wrapper]")
{
    REQUIRE(wrap("日本語 テキスト です", 4, "\n", false) == "日本語\nテキスト\nです");
    REQUIRE(wrap("😀😀😀😀", 2, "\n", true) == "😀😀\n😀😀");
}

TEST_CASE("wrap on a zero-width pattern drops the character the break lands on", "[line_wrapper]")
{
    REQUIRE(wrap("ab,cd,ef", 2, "|", false, "(?=,)") == "ab|cd|ef");
}

TEST_CASE("zero-width match at a window start steps the cursor back before a forced cut", "[line_wrapper]")
{
    REQUIRE(wrap("bxxxxx", 2, "|", true, "(?=b)") == "|xx|xx|x");
    REQUIRE(wrap("bxxxxx", 2, "|", false, "(?=b)") == "|xxxxx");
}

TEST_CASE("wrap terminates on patterns that match everywhere", "[line_wrapper]")
{
    std::optional<std::string> result;
    REQUIRE_NOTHROW(result = wrap("abcdef", 2, "|", true, "x*"));
    REQUIRE(result.has_value());
    REQUIRE_NOTHROW(result = wrap("abcdef", 2, "|", false, "x*"));
    REQUIRE(result.has_value());
}

TEST_CASE("wrap passes absent text through and keeps empty text empty", "[line_wrapper]")
{
    REQUIRE_FALSE(wrap(std::nullopt, 5).has_value());
    REQUIRE(wrap("", 5, "\n") == "");
}

TEST_CASE("wrap rejects a malformed break pattern", "[line_wrapper]")
{
    REQUIRE_THROWS_AS(wrap("abc", 2, "\n", false, "("), std::invalid_argument);
    REQUIRE_THROWS_AS(LineWrapper(WrapOptions{ .wrap_on = "[" }), std::invalid_argument);
}

TEST_CASE("wrapped text joined back on the break character restores the input", "[line_wrapper]")
{
    const std::string input = "The quick brown fox jumps over the lazy dog and keeps on running far away";
    for (int width = 5; width <= 30; ++width)
    {
        auto result = wrap(input, width, "\n", false);
        REQUIRE(result.has_value());

        std::string rejoined;
        auto lines = splitLines(*result);
        for (size_t i = 0; i < lines.size(); ++i)
        {
            if (i > 0)
                rejoined += ' ';
            rejoined += lines[i];
        }
        REQUIRE(rejoined == input);
    }
}

TEST_CASE("LineWrapper reuses one compiled pattern across inputs", "[line_wrapper]")
{
    LineWrapper wrapper(WrapOptions{ .wrap_length = 5, .newline = "\n", .wrap_long_words = true, .wrap_on = "[ ,]" });
    REQUIRE(wrapper.wrapLength() == 5);
    REQUIRE(wrapper.newline() == "\n");
    REQUIRE(wrapper.wrap("one,two three") == "one\ntwo\nthree");
    REQUIRE(wrapper.wrap("abcdefgh") == "abcde\nfgh");

    LineWrapper moved(std::move(wrapper));
    REQUIRE(moved.wrap("a b") == "a b");
}

TEST_CASE("wrap keeps the text after an invalid byte", "[line_wrapper]")
{
    std::string stray = "abc";
    stray.push_back(static_cast<char>(0xFF));
    stray += "def ghi";

    REQUIRE(wrap(stray, 4, "|") == "abc\uFFFDdef|ghi");
}
