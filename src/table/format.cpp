/// @file format.cpp
/// @brief Formatting helpers

#include "table/format.h"

#include <algorithm>
#include <cmath>
#include <set>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <spdlog/fmt/fmt.h>

#include "common/error.h"

namespace clintab::table {

namespace {

constexpr std::string_view kSymbols[] = {"*", "†", "‡", "§", "¶"};

/// Insert ',' every three digits of the integer part
std::string GroupThousands(const std::string& text) {
    size_t start = (!text.empty() && text[0] == '-') ? 1 : 0;
    size_t end = text.find('.');
    if (end == std::string::npos) {
        end = text.size();
    }

    std::string grouped = text.substr(0, start);
    const size_t digits = end - start;
    for (size_t i = 0; i < digits; ++i) {
        if (i > 0 && (digits - i) % 3 == 0) {
            grouped.push_back(',');
        }
        grouped.push_back(text[start + i]);
    }
    grouped.append(text, end, std::string::npos);
    return grouped;
}

/// "-0", "-0.0" and friends read as zero in a table
std::string DropNegativeZero(std::string text) {
    if (!text.empty() && text[0] == '-' &&
        text.find_first_of("123456789") == std::string::npos) {
        text.erase(0, 1);
    }
    return text;
}

}  // namespace

std::string FormatNumber(double value, const FormatRule& rule) {
    if (!std::isfinite(value)) {
        return DefaultNumberText(value);
    }

    std::string text;
    switch (rule.kind) {
        case FormatKind::kInteger:
            text = absl::StrCat(std::llround(value));
            break;
        case FormatKind::kFixed:
            text = absl::StrFormat("%.*f", std::max(rule.decimals, 0), value);
            break;
        case FormatKind::kPercent:
            text = absl::StrFormat("%.*f", std::max(rule.decimals, 0), value * 100.0);
            break;
    }

    text = DropNegativeZero(std::move(text));
    if (rule.thousands_separator) {
        text = GroupThousands(text);
    }
    if (rule.kind == FormatKind::kPercent) {
        text.push_back('%');
    }
    return text;
}

std::string DefaultNumberText(double value) {
    return fmt::format("{}", value);
}

std::vector<int> PatternPlaceholders(std::string_view pattern) {
    std::vector<int> indices;
    size_t pos = 0;
    while ((pos = pattern.find('{', pos)) != std::string_view::npos) {
        size_t end = pos + 1;
        while (end < pattern.size() && absl::ascii_isdigit(pattern[end])) {
            ++end;
        }
        if (end > pos + 1 && end < pattern.size() && pattern[end] == '}') {
            int index = 0;
            for (size_t i = pos + 1; i < end; ++i) {
                index = index * 10 + (pattern[i] - '0');
            }
            indices.push_back(index);
            pos = end + 1;
        } else {
            ++pos;
        }
    }
    return indices;
}

absl::Status ValidatePattern(std::string_view pattern, size_t source_count) {
    const std::vector<int> indices = PatternPlaceholders(pattern);
    const std::set<int> distinct(indices.begin(), indices.end());

    if (distinct.size() != source_count) {
        return InvalidMergePatternError(absl::StrCat(
            "Pattern \"", absl::string_view(pattern.data(), pattern.size()), "\" references ", distinct.size(),
            " distinct placeholders for ", source_count, " source columns"));
    }
    for (int index : distinct) {
        if (index < 1 || static_cast<size_t>(index) > source_count) {
            return InvalidMergePatternError(absl::StrCat(
                "Pattern \"", absl::string_view(pattern.data(), pattern.size()), "\" references {", index, "} but only ",
                source_count, " source columns are given"));
        }
    }
    return absl::OkStatus();
}

std::string SubstitutePattern(std::string_view pattern,
                              const std::vector<std::string>& values) {
    std::string result;
    result.reserve(pattern.size());

    size_t pos = 0;
    while (pos < pattern.size()) {
        if (pattern[pos] == '{') {
            size_t end = pos + 1;
            while (end < pattern.size() && absl::ascii_isdigit(pattern[end])) {
                ++end;
            }
            if (end > pos + 1 && end < pattern.size() && pattern[end] == '}') {
                size_t index = 0;
                for (size_t i = pos + 1; i < end; ++i) {
                    index = index * 10 + static_cast<size_t>(pattern[i] - '0');
                }
                if (index >= 1 && index <= values.size()) {
                    result.append(values[index - 1]);
                    pos = end + 1;
                    continue;
                }
            }
        }
        result.push_back(pattern[pos]);
        ++pos;
    }
    return result;
}

std::string_view MarkStyleToString(MarkStyle style) {
    switch (style) {
        case MarkStyle::kNumeric: return "numeric";
        case MarkStyle::kLetters: return "letters";
        case MarkStyle::kSymbols: return "symbols";
    }
    return "numeric";
}

absl::StatusOr<MarkStyle> ParseMarkStyle(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lowered == "numeric" || lowered == "numbers") return MarkStyle::kNumeric;
    if (lowered == "letters" || lowered == "alphabetic") return MarkStyle::kLetters;
    if (lowered == "symbols") return MarkStyle::kSymbols;
    return MakeError(ErrorCode::kConfigurationError,
                     absl::StrCat("Unknown footnote mark style: ", absl::string_view(name.data(), name.size())));
}

std::string FootnoteMark(size_t index, MarkStyle style) {
    switch (style) {
        case MarkStyle::kLetters: {
            // Bijective base 26: a..z, aa..az, ba..
            std::string mark;
            size_t n = index + 1;
            while (n > 0) {
                --n;
                mark.insert(mark.begin(), static_cast<char>('a' + n % 26));
                n /= 26;
            }
            return mark;
        }
        case MarkStyle::kSymbols: {
            const size_t count = std::size(kSymbols);
            std::string mark;
            for (size_t i = 0; i <= index / count; ++i) {
                mark.append(kSymbols[index % count]);
            }
            return mark;
        }
        case MarkStyle::kNumeric:
        default:
            return absl::StrCat(index + 1);
    }
}

size_t DisplayWidth(std::string_view text) {
    size_t width = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

}  // namespace clintab::table
