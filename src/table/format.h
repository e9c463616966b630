#pragma once

/// @file format.h
/// @brief Numeric formatting, merge patterns and footnote marks

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace clintab::table {

enum class FormatKind {
    kInteger,  ///< Rounded, no decimals
    kFixed,    ///< Fixed number of decimals
    kPercent   ///< value * 100, fixed decimals, trailing '%'
};

/// @brief How numbers in a column are turned into text
struct FormatRule {
    FormatKind kind = FormatKind::kFixed;
    int decimals = 0;
    bool thousands_separator = false;

    static FormatRule Integer(bool thousands_separator = false) {
        return {FormatKind::kInteger, 0, thousands_separator};
    }
    static FormatRule Fixed(int decimals, bool thousands_separator = false) {
        return {FormatKind::kFixed, decimals, thousands_separator};
    }
    static FormatRule Percent(int decimals) {
        return {FormatKind::kPercent, decimals, false};
    }
};

/// @brief Format a number with a rule
std::string FormatNumber(double value, const FormatRule& rule);

/// @brief Text of a number no rule applies to: shortest round-trip form
std::string DefaultNumberText(double value);

/// @brief Placeholder indices ({1}, {2}, ...) in pattern order
std::vector<int> PatternPlaceholders(std::string_view pattern);

/// @brief Check that a pattern references exactly {1}..{n}
///
/// Fails with ErrorCode::kInvalidMergePattern otherwise.
absl::Status ValidatePattern(std::string_view pattern, size_t source_count);

/// @brief Replace {k} with values[k - 1]; other text is copied unchanged
std::string SubstitutePattern(std::string_view pattern,
                              const std::vector<std::string>& values);

/// @brief Footnote mark alphabet
enum class MarkStyle {
    kNumeric,  ///< 1, 2, 3, ...
    kLetters,  ///< a, b, ..., z, aa, ab, ...
    kSymbols   ///< *, †, ‡, §, ¶, **, ††, ...
};

std::string_view MarkStyleToString(MarkStyle style);
absl::StatusOr<MarkStyle> ParseMarkStyle(std::string_view name);

/// @brief Mark of the index-th footnote (0-based)
std::string FootnoteMark(size_t index, MarkStyle style);

/// @brief Display width in code points of a UTF-8 string
size_t DisplayWidth(std::string_view text);

}  // namespace clintab::table
