#pragma once

/// @file renderer.h
/// @brief Turns a TableModel into a display Grid

#include "table/grid.h"
#include "table/table_model.h"

namespace clintab::table {

/// @brief Render a table model
///
/// Cell text is built in stages: number formatting of the underlying value,
/// missing-value substitution, merge rules in declaration order (each
/// pattern sees the current text of its sources, so merges chain), then
/// coalesce rules. Rendering does not modify the model and is idempotent.
Grid Render(const TableModel& model);

}  // namespace clintab::table
