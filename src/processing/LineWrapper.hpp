#pragma once

#include <memory>
#include <optional>
#include <string>

namespace processing
{

struct WrapOptions
{
    int wrap_length = 80;                   // clamped up to 1
    std::optional<std::string> newline;     // platform line separator when unset
    bool wrap_long_words = false;           // split words longer than wrap_length
    std::optional<std::string> wrap_on;     // ECMAScript break pattern, " " when unset or blank
};

/**
 * @brief Greedy word wrapper with a regular-expression break pattern.
 *
 * Each line breaks at the last pattern match inside the next wrap_length + 1
 * code points. When a window has no match, the line is either cut mid-word
 * (wrap_long_words) or extended to the next match past the limit, so lines can
 * be longer than wrap_length in that case. The matched break character is
 * dropped; the final line gets no trailing newline.
 *
 * The pattern is compiled once per instance. Instances are immutable and can
 * be shared between threads.
 */
class LineWrapper
{
public:
    /// @throws std::invalid_argument if wrap_on is not a valid regular expression
    explicit LineWrapper(const WrapOptions& options);
    ~LineWrapper();

    LineWrapper(LineWrapper&&) noexcept;
    LineWrapper& operator=(LineWrapper&&) noexcept;

    LineWrapper(const LineWrapper&) = delete;
    LineWrapper& operator=(const LineWrapper&) = delete;

    [[nodiscard]] std::string wrap(const std::string& text) const;

    [[nodiscard]] int wrapLength() const noexcept;
    [[nodiscard]] const std::string& newline() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// One-shot wrap; absent text is passed through as absent
[[nodiscard]] std::optional<std::string> wrap(const std::optional<std::string>& text, int wrap_length,
                                              const std::optional<std::string>& newline = std::nullopt,
                                              bool wrap_long_words = false,
                                              const std::optional<std::string>& wrap_on = std::nullopt);

[[nodiscard]] std::optional<std::string> wrap(const std::optional<std::string>& text, const WrapOptions& options);

} // namespace processing
