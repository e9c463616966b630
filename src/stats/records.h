#pragma once

/// @file records.h
/// @brief Subject-level input records and variable descriptors

#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "common/value.h"

namespace clintab::stats {

/// @brief One trial subject: variable name -> value
///
/// The treatment arm is an ordinary variable; summaries name it through
/// their group_var argument.
struct SubjectRecord {
    std::unordered_map<std::string, Value> values;

    /// @brief Value of a variable, missing if the record lacks it
    const Value& Get(std::string_view name) const;
};

/// @brief Categorical variable metadata
struct CategoricalType {
    /// Display order of the levels. Observed levels not listed here follow
    /// in first-appearance order; listed levels never observed get zero rows.
    std::vector<std::string> levels;
};

/// @brief Continuous variable metadata
struct ContinuousType {
    std::string unit;
};

/// @brief Variable type descriptor; monostate means "no type metadata"
using VariableType = std::variant<std::monostate, CategoricalType, ContinuousType>;

/// @brief A variable to summarize
struct VariableSpec {
    std::string name;
    std::string label;
    VariableType type;

    /// @brief Row-group label: "label" or "label (unit)" for continuous
    /// variables with a unit
    std::string CategoryLabel() const;
};

/// @brief Distinct values of group_var in first-appearance order
///
/// Records with a missing group value are skipped.
std::vector<std::string> GroupLevels(const std::vector<SubjectRecord>& records,
                                     std::string_view group_var);

}  // namespace clintab::stats
