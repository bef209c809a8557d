#pragma once

#include "cairn/data/row.hpp"
#include "cairn/data/schema.hpp"
#include "cairn/parser/ast.hpp"

#include <vector>

namespace cairn::executor {

// Builds the stored row for an INSERT. With no column list the values bind
// positionally; otherwise unlisted columns take their DEFAULT, or NULL when
// nullable. Values are constant expressions. Failures throw std::system_error
// with a RowErrc or EvaluateErrc.
[[nodiscard]] data::Row build_row(const data::Schema& schema,
                                  const std::vector<parser::Identifier>& columns,
                                  const std::vector<parser::InsertRow>& rows);

}  // namespace cairn::executor
