/// @file table_types.cpp
/// @brief Alignment names

#include "table/table_types.h"

namespace clintab::table {

std::string_view AlignmentToString(Alignment alignment) {
    switch (alignment) {
        case Alignment::kAuto: return "auto";
        case Alignment::kLeft: return "left";
        case Alignment::kCenter: return "center";
        case Alignment::kRight: return "right";
    }
    return "auto";
}

}  // namespace clintab::table
