#pragma once

#include <optional>
#include <string>

namespace processing
{

/// @throws std::invalid_argument with the message abbreviate would throw for these bounds
void validateAbbreviateBounds(int lower, int upper);

/**
 * @brief Shortens text to at most upper code points, preferring to cut at the
 *        first space at or after lower.
 *
 * A space found at or after lower always gets the suffix appended, even when
 * nothing was dropped. Without such a space the suffix is appended only if the
 * text was actually shortened. upper == -1 means no upper bound.
 *
 * @throws std::invalid_argument if upper < -1, or upper < lower with upper != -1
 * @return text unchanged when absent or empty
 */
[[nodiscard]] std::optional<std::string> abbreviate(const std::optional<std::string>& text, int lower, int upper,
                                                    const std::optional<std::string>& suffix);

/**
 * @brief First code point of every word.
 *
 * With delimiters unset, whitespace separates words. Otherwise exactly the code
 * points of delimiters do, and an explicitly empty delimiter set yields "".
 */
[[nodiscard]] std::optional<std::string> initials(const std::optional<std::string>& text,
                                                  const std::optional<std::string>& delimiters = std::nullopt);

/**
 * @brief Inverts letter case. A lowercase letter that follows whitespace (or
 *        starts the text) becomes title case instead of upper case.
 */
[[nodiscard]] std::optional<std::string> swapCase(const std::optional<std::string>& text);

} // namespace processing
