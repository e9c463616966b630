/// @file records.cpp
/// @brief Record lookup, category labels and group levels

#include "stats/records.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

namespace clintab::stats {

const Value& SubjectRecord::Get(std::string_view name) const {
    static const Value kMissing;
    auto it = values.find(std::string(name));
    return it == values.end() ? kMissing : it->second;
}

std::string VariableSpec::CategoryLabel() const {
    const std::string& base = label.empty() ? name : label;
    if (const auto* continuous = std::get_if<ContinuousType>(&type)) {
        if (!continuous->unit.empty()) {
            return absl::StrCat(base, " (", continuous->unit, ")");
        }
    }
    return base;
}

std::vector<std::string> GroupLevels(const std::vector<SubjectRecord>& records,
                                     std::string_view group_var) {
    std::vector<std::string> levels;
    for (const auto& record : records) {
        auto key = CategoryKey(record.Get(group_var));
        if (!key.has_value()) {
            continue;
        }
        if (std::find(levels.begin(), levels.end(), *key) == levels.end()) {
            levels.push_back(std::move(*key));
        }
    }
    return levels;
}

}  // namespace clintab::stats
