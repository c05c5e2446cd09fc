#pragma once

#include "alignment_document.hpp"
#include "edit_operations.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tmx_align {

struct CellRef {
    RowId row_id = 0;
    Column column = Column::Source;

    bool operator==(const CellRef&) const = default;
};

struct FindOptions {
    bool case_sensitive = false;
    bool forward = true;
};

// Byte position of the first match at or after `from`, or npos. Case folding is ASCII only.
std::size_t find_in_text(std::string_view text, std::string_view query, bool case_sensitive, std::size_t from = 0);

// Cells are visited row by row, source before target, wrapping around. The
// search starts after `from` (or at the first cell) and ends on `from` itself.
std::optional<CellRef> find_next(
    const AlignmentDocument& doc,
    std::string_view query,
    const std::optional<CellRef>& from,
    const FindOptions& options = {}
);

std::string replace_in_text(
    std::string_view text,
    std::string_view query,
    std::string_view replacement,
    bool case_sensitive
);

// Replaces the first match inside `cell` as a single edit. `replaced` is
// false (and `out` untouched) when the cell holds no match.
bool replace_one(
    AlignmentDocument& doc,
    const CellRef& cell,
    std::string_view query,
    std::string_view replacement,
    bool case_sensitive,
    Command& out,
    bool& replaced,
    OperationError& error
);

// Replaces every occurrence in both columns as a single command.
// `replaced_cells` is 0 (and `out` untouched) when nothing matched.
bool replace_all(
    AlignmentDocument& doc,
    std::string_view query,
    std::string_view replacement,
    bool case_sensitive,
    Command& out,
    std::size_t& replaced_cells,
    OperationError& error
);

}  // namespace tmx_align
