#pragma once

/// @file value.h
/// @brief Cell value shared by subject records, data frames and table cells

#include <optional>
#include <string>
#include <variant>

namespace clintab {

/// @brief A single datum: missing, numeric, or text
///
/// std::monostate is the missing value. Undefined statistics (e.g. an odds
/// ratio with a zero denominator) are stored as missing, never as NaN.
using Value = std::variant<std::monostate, double, std::string>;

inline bool IsMissing(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

/// @brief Numeric content, if any
inline std::optional<double> AsNumber(const Value& value) {
    if (const double* number = std::get_if<double>(&value)) {
        return *number;
    }
    return std::nullopt;
}

/// @brief Convert an optional statistic to a cell value
inline Value ToValue(const std::optional<double>& statistic) {
    if (statistic.has_value()) {
        return *statistic;
    }
    return std::monostate{};
}

/// @brief Category key of a value: text as-is, numbers in shortest form
///
/// Missing values have no key.
std::optional<std::string> CategoryKey(const Value& value);

}  // namespace clintab
