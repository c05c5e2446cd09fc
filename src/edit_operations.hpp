#pragma once

#include "alignment_document.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace tmx_align {

enum class Direction {
    Up,
    Down
};

const char* direction_name(Direction direction);
Direction opposite(Direction direction);

enum class OperationErrorCode {
    InvalidSplitPoint,
    NoRowBelow,
    AtBoundary,
    NotFound,
    RowNotEmpty,
    InvalidEditToken,
    SaveInProgress,
    NoDocument,
    DuplicateRowId,
    InvalidLanguagePair
};

const char* operation_error_name(OperationErrorCode code);

struct OperationError {
    OperationErrorCode code = OperationErrorCode::NotFound;
    RowId row_id = 0;
    std::string message;
};

// Primitive document transformations. Each one is exactly invertible by
// another primitive; offsets and lengths are in code points.

// Cuts `column` of `row_id` at `offset`, skips `drop` code points, and
// inserts the remainder as a new row `new_row_id` directly below.
struct SplitRow {
    RowId row_id = 0;
    Column column = Column::Source;
    std::size_t offset = 0;
    std::size_t drop = 0;
    RowId new_row_id = 0;
    std::string new_row_other_text;
};

// Appends `separator` and the next row's `column` text to `row_id`, then
// removes the next row, which must be `next_row_id`.
struct JoinRows {
    RowId row_id = 0;
    RowId next_row_id = 0;
    Column column = Column::Source;
    std::string separator;
};

struct SwapRows {
    RowId row_id = 0;
    Direction direction = Direction::Up;
};

struct SetText {
    RowId row_id = 0;
    Column column = Column::Source;
    std::string text;
};

struct ReplaceTexts {
    std::vector<SetText> cells;
};

struct RemoveRow {
    RowId row_id = 0;
};

struct InsertRow {
    std::size_t index = 0;
    AlignmentRow row;
};

using Operation = std::variant<SplitRow, JoinRows, SwapRows, SetText, ReplaceTexts, RemoveRow, InsertRow>;

struct Command {
    std::string label;
    Operation forward;
    Operation inverse;
    std::vector<RowId> affected_row_ids;
};

// Validates `op` against `doc` and applies it. On failure the document is untouched.
bool apply_operation(AlignmentDocument& doc, const Operation& op, OperationError& error);

// User-level edits. Each validates its preconditions, applies the edit and
// fills `out` with the committed command. Failures leave `doc` untouched.
bool split_row(
    AlignmentDocument& doc,
    RowId row_id,
    Column column,
    std::size_t split_offset,
    Command& out,
    OperationError& error
);

bool merge_rows(AlignmentDocument& doc, RowId row_id, Column column, Command& out, OperationError& error);

bool move_row(AlignmentDocument& doc, RowId row_id, Direction direction, Command& out, OperationError& error);

bool set_text(
    AlignmentDocument& doc,
    RowId row_id,
    Column column,
    std::string new_text,
    Command& out,
    OperationError& error
);

bool delete_empty_row(AlignmentDocument& doc, RowId row_id, Command& out, OperationError& error);

// Applies every replacement as one command. `cells` must reference existing rows.
bool replace_texts(AlignmentDocument& doc, std::vector<SetText> cells, Command& out, OperationError& error);

}  // namespace tmx_align
