#include "LineWrapper.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace processing
{

namespace
{

// Successive searches over one input: each find resumes where the previous
// match ended, one position further after an empty match.
class BreakMatcher
{
public:
    BreakMatcher(const std::wregex& pattern, std::wstring input)
        : pattern_(pattern)
        , input_(std::move(input))
    {
    }

    bool find()
    {
        if (next_ > input_.size())
            return false;

        std::wsmatch match;
        auto flags = next_ > 0 ? std::regex_constants::match_prev_avail : std::regex_constants::match_default;
        auto first = input_.cbegin() + static_cast<std::ptrdiff_t>(next_);
        if (!std::regex_search(first, input_.cend(), match, pattern_, flags))
        {
            next_ = input_.size() + 1;
            return false;
        }

        start_ = static_cast<int>(next_ + static_cast<size_t>(match.position(0)));
        end_ = start_ + static_cast<int>(match.length(0));
        next_ = static_cast<size_t>(end_ == start_ ? end_ + 1 : end_);
        return true;
    }

    int start() const { return start_; }
    int end() const { return end_; }

private:
    const std::wregex& pattern_;
    std::wstring input_;
    size_t next_ = 0;
    int start_ = -1;
    int end_ = -1;
};

} // anonymous namespace

struct LineWrapper::Impl
{
    int wrap_length = 1;
    bool wrap_long_words = false;
    std::string newline;
    std::wstring wide_newline;
    std::wregex pattern;
};

LineWrapper::LineWrapper(const WrapOptions& options)
    : impl_(std::make_unique<Impl>())
{
    impl_->wrap_length = std::max(options.wrap_length, 1);
    impl_->wrap_long_words = options.wrap_long_words;
    impl_->newline = options.newline.value_or(platformLineSeparator());
    impl_->wide_newline = utf8ToWide(impl_->newline);

    const std::string wrap_on = isBlank(options.wrap_on) ? std::string(" ") : *options.wrap_on;
    try
    {
        impl_->pattern = std::wregex(utf8ToWide(wrap_on), std::regex_constants::ECMAScript);
    }
    catch (const std::regex_error& ex)
    {
        PLOG_WARNING << "Rejected wrap pattern '" << Diagnostics::Preview(wrap_on) << "': " << ex.what();
        throw std::invalid_argument("invalid wrap pattern '" + wrap_on + "': " + ex.what());
    }
}

LineWrapper::~LineWrapper() = default;

LineWrapper::LineWrapper(LineWrapper&&) noexcept = default;

LineWrapper& LineWrapper::operator=(LineWrapper&&) noexcept = default;

int LineWrapper::wrapLength() const noexcept { return impl_->wrap_length; }

const std::string& LineWrapper::newline() const noexcept { return impl_->newline; }

std::string LineWrapper::wrap(const std::string& text) const
{
    const std::wstring str = utf8ToWide(text);
    const int length = static_cast<int>(str.size());
    const int wrap_length = impl_->wrap_length;
    const std::wstring& newline = impl_->wide_newline;

    std::wstring out;
    out.reserve(str.size() + 32);

    int offset = 0;
    // width of the last match consumed at a window start; 0 means the cursor
    // was pushed one past a zero-width match and must step back before copying
    int matcher_size = -1;
    int lines = 0;

    auto emit = [&](int from, int to)
    {
        out.append(str, static_cast<size_t>(from), static_cast<size_t>(to - from));
        out += newline;
        ++lines;
    };

    while (offset < length)
    {
        int break_at = -1;
        const int window_end =
            static_cast<int>(std::min<long long>(static_cast<long long>(offset) + wrap_length + 1, length));
        BreakMatcher matcher(impl_->pattern, str.substr(static_cast<size_t>(offset),
                                                        static_cast<size_t>(window_end - offset)));
        if (matcher.find())
        {
            if (matcher.start() == 0)
            {
                matcher_size = matcher.end();
                if (matcher_size != 0)
                {
                    offset += matcher.end();
                    continue;
                }
                offset += 1;
            }
            break_at = matcher.start() + offset;
        }

        if (length - offset <= wrap_length)
            break;

        while (matcher.find())
            break_at = matcher.start() + offset;

        if (break_at >= offset)
        {
            emit(offset, std::min(break_at, length));
            offset = break_at + 1;
        }
        else if (impl_->wrap_long_words)
        {
            if (matcher_size == 0)
                --offset;
            emit(offset, offset + wrap_length);
            offset += wrap_length;
            matcher_size = -1;
        }
        else
        {
            const int limit = offset + wrap_length;
            BreakMatcher tail(impl_->pattern, str.substr(static_cast<size_t>(limit)));
            if (tail.find())
            {
                matcher_size = tail.end() - tail.start();
                break_at = tail.start() + limit;
            }

            if (matcher_size == 0 && offset != 0)
                --offset;

            if (break_at >= 0)
            {
                emit(offset, std::min(break_at, length));
                offset = break_at + 1;
            }
            else
            {
                out.append(str, static_cast<size_t>(offset), std::wstring::npos);
                offset = length;
                matcher_size = -1;
            }
        }
    }

    if (matcher_size == 0 && offset < length)
        offset = std::max(offset - 1, 0);

    if (offset < length)
        out.append(str, static_cast<size_t>(offset), std::wstring::npos);

    TEXTKIT_TRACE << "[LineWrapper] width=" << wrap_length << " long_words=" << impl_->wrap_long_words
                  << " breaks=" << lines << " input=" << Diagnostics::Preview(text);
    return wideToUtf8(out);
}

std::optional<std::string> wrap(const std::optional<std::string>& text, int wrap_length,
                                const std::optional<std::string>& newline, bool wrap_long_words,
                                const std::optional<std::string>& wrap_on)
{
    return wrap(text, WrapOptions{ wrap_length, newline, wrap_long_words, wrap_on });
}

std::optional<std::string> wrap(const std::optional<std::string>& text, const WrapOptions& options)
{
    if (!text)
        return std::nullopt;
    return LineWrapper(options).wrap(*text);
}

} // namespace processing
