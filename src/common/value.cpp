/// @file value.cpp
/// @brief Cell value helpers

#include "value.h"

#include <absl/strings/str_cat.h>

namespace clintab {

std::optional<std::string> CategoryKey(const Value& value) {
    if (const std::string* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const double* number = std::get_if<double>(&value)) {
        return absl::StrCat(*number);
    }
    return std::nullopt;
}

}  // namespace clintab
