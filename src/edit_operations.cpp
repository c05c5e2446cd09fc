#include "edit_operations.hpp"

#include "text_utils.hpp"

#include <utility>

namespace tmx_align {

// Sole write access to AlignmentDocument internals.
class DocumentMutator {
public:
    static std::string& text(AlignmentDocument& doc, std::size_t index, Column column) {
        auto& row = doc.rows_[index];
        return column == Column::Source ? row.source_text : row.target_text;
    }

    static void insert_row(AlignmentDocument& doc, std::size_t index, AlignmentRow row) {
        if (row.id >= doc.next_id_) {
            doc.next_id_ = row.id + 1;
        }
        doc.rows_.insert(doc.rows_.begin() + static_cast<std::ptrdiff_t>(index), std::move(row));
        doc.reindex_from(index);
    }

    static AlignmentRow remove_row(AlignmentDocument& doc, std::size_t index) {
        AlignmentRow removed = std::move(doc.rows_[index]);
        doc.rows_.erase(doc.rows_.begin() + static_cast<std::ptrdiff_t>(index));
        doc.index_by_id_.erase(removed.id);
        doc.reindex_from(index);
        return removed;
    }

    static void swap_rows(AlignmentDocument& doc, std::size_t a, std::size_t b) {
        std::swap(doc.rows_[a], doc.rows_[b]);
        doc.index_by_id_[doc.rows_[a].id] = a;
        doc.index_by_id_[doc.rows_[b].id] = b;
    }

    static RowId allocate_id(AlignmentDocument& doc) {
        return doc.next_id_++;
    }

    static void mark_dirty(AlignmentDocument& doc) {
        doc.dirty_ = true;
    }
};

namespace {

bool fail(OperationError& error, OperationErrorCode code, RowId row_id, std::string message) {
    error.code = code;
    error.row_id = row_id;
    error.message = std::move(message);
    return false;
}

bool locate(const AlignmentDocument& doc, RowId row_id, std::size_t& index, OperationError& error) {
    const auto found = doc.index_of(row_id);
    if (!found) {
        return fail(error, OperationErrorCode::NotFound, row_id, "Row " + std::to_string(row_id) + " not found");
    }
    index = *found;
    return true;
}

std::string join_separator(const std::string& left, const std::string& right) {
    if (left.empty() || right.empty()) {
        return {};
    }
    if (is_space_byte(left.back()) || is_space_byte(right.front())) {
        return {};
    }
    return " ";
}

struct OperationApplier {
    AlignmentDocument& doc;
    OperationError& error;

    bool operator()(const SplitRow& op) const {
        std::size_t index = 0;
        if (!locate(doc, op.row_id, index, error)) {
            return false;
        }
        if (doc.find_row(op.new_row_id) != nullptr) {
            return fail(
                error,
                OperationErrorCode::DuplicateRowId,
                op.new_row_id,
                "Row id " + std::to_string(op.new_row_id) + " is already in use"
            );
        }

        const std::string& text = doc.row_at(index).text(op.column);
        const std::size_t length = utf8_length(text);
        if (op.offset + op.drop > length) {
            return fail(
                error,
                OperationErrorCode::InvalidSplitPoint,
                op.row_id,
                "Split offset " + std::to_string(op.offset) + " outside " + column_name(op.column) +
                    " text of row " + std::to_string(op.row_id) + " (length " + std::to_string(length) + ")"
            );
        }

        const std::size_t cut = utf8_byte_offset(text, op.offset);
        const std::size_t resume = utf8_byte_offset(text, op.offset + op.drop);

        AlignmentRow inserted;
        inserted.id = op.new_row_id;
        std::string after = text.substr(resume);
        if (op.column == Column::Source) {
            inserted.source_text = std::move(after);
            inserted.target_text = op.new_row_other_text;
        } else {
            inserted.source_text = op.new_row_other_text;
            inserted.target_text = std::move(after);
        }

        DocumentMutator::text(doc, index, op.column).resize(cut);
        DocumentMutator::insert_row(doc, index + 1, std::move(inserted));
        DocumentMutator::mark_dirty(doc);
        return true;
    }

    bool operator()(const JoinRows& op) const {
        std::size_t index = 0;
        if (!locate(doc, op.row_id, index, error)) {
            return false;
        }
        if (index + 1 >= doc.row_count()) {
            return fail(
                error,
                OperationErrorCode::NoRowBelow,
                op.row_id,
                "Row " + std::to_string(op.row_id) + " is the last row; nothing to merge with"
            );
        }
        if (doc.row_at(index + 1).id != op.next_row_id) {
            return fail(
                error,
                OperationErrorCode::NotFound,
                op.next_row_id,
                "Row " + std::to_string(op.next_row_id) + " is not directly below row " + std::to_string(op.row_id)
            );
        }

        std::string tail = op.separator + doc.row_at(index + 1).text(op.column);
        DocumentMutator::text(doc, index, op.column) += tail;
        DocumentMutator::remove_row(doc, index + 1);
        DocumentMutator::mark_dirty(doc);
        return true;
    }

    bool operator()(const SwapRows& op) const {
        std::size_t index = 0;
        if (!locate(doc, op.row_id, index, error)) {
            return false;
        }
        const bool at_boundary = op.direction == Direction::Up ? index == 0 : index + 1 >= doc.row_count();
        if (at_boundary) {
            return fail(
                error,
                OperationErrorCode::AtBoundary,
                op.row_id,
                "Row " + std::to_string(op.row_id) + " cannot move " + direction_name(op.direction)
            );
        }

        const std::size_t neighbor = op.direction == Direction::Up ? index - 1 : index + 1;
        DocumentMutator::swap_rows(doc, index, neighbor);
        DocumentMutator::mark_dirty(doc);
        return true;
    }

    bool operator()(const SetText& op) const {
        std::size_t index = 0;
        if (!locate(doc, op.row_id, index, error)) {
            return false;
        }
        DocumentMutator::text(doc, index, op.column) = sanitize_cell_text(op.text);
        DocumentMutator::mark_dirty(doc);
        return true;
    }

    bool operator()(const ReplaceTexts& op) const {
        std::vector<std::size_t> indices;
        indices.reserve(op.cells.size());
        for (const auto& cell : op.cells) {
            std::size_t index = 0;
            if (!locate(doc, cell.row_id, index, error)) {
                return false;
            }
            indices.push_back(index);
        }

        for (std::size_t i = 0; i < op.cells.size(); ++i) {
            DocumentMutator::text(doc, indices[i], op.cells[i].column) = sanitize_cell_text(op.cells[i].text);
        }
        DocumentMutator::mark_dirty(doc);
        return true;
    }

    bool operator()(const RemoveRow& op) const {
        std::size_t index = 0;
        if (!locate(doc, op.row_id, index, error)) {
            return false;
        }
        DocumentMutator::remove_row(doc, index);
        DocumentMutator::mark_dirty(doc);
        return true;
    }

    bool operator()(const InsertRow& op) const {
        if (op.index > doc.row_count()) {
            return fail(
                error,
                OperationErrorCode::AtBoundary,
                op.row.id,
                "Insert position " + std::to_string(op.index) + " past end (rows=" +
                    std::to_string(doc.row_count()) + ")"
            );
        }
        if (doc.find_row(op.row.id) != nullptr) {
            return fail(
                error,
                OperationErrorCode::DuplicateRowId,
                op.row.id,
                "Row id " + std::to_string(op.row.id) + " is already in use"
            );
        }

        AlignmentRow row = op.row;
        row.source_text = sanitize_cell_text(std::move(row.source_text));
        row.target_text = sanitize_cell_text(std::move(row.target_text));
        DocumentMutator::insert_row(doc, op.index, std::move(row));
        DocumentMutator::mark_dirty(doc);
        return true;
    }
};

}  // namespace

const char* direction_name(Direction direction) {
    return direction == Direction::Up ? "up" : "down";
}

Direction opposite(Direction direction) {
    return direction == Direction::Up ? Direction::Down : Direction::Up;
}

const char* operation_error_name(OperationErrorCode code) {
    switch (code) {
        case OperationErrorCode::InvalidSplitPoint:
            return "InvalidSplitPoint";
        case OperationErrorCode::NoRowBelow:
            return "NoRowBelow";
        case OperationErrorCode::AtBoundary:
            return "AtBoundary";
        case OperationErrorCode::NotFound:
            return "NotFound";
        case OperationErrorCode::RowNotEmpty:
            return "RowNotEmpty";
        case OperationErrorCode::InvalidEditToken:
            return "InvalidEditToken";
        case OperationErrorCode::SaveInProgress:
            return "SaveInProgress";
        case OperationErrorCode::NoDocument:
            return "NoDocument";
        case OperationErrorCode::DuplicateRowId:
            return "DuplicateRowId";
        case OperationErrorCode::InvalidLanguagePair:
            return "InvalidLanguagePair";
    }
    return "Unknown";
}

bool apply_operation(AlignmentDocument& doc, const Operation& op, OperationError& error) {
    return std::visit(OperationApplier{doc, error}, op);
}

bool split_row(
    AlignmentDocument& doc,
    RowId row_id,
    Column column,
    std::size_t split_offset,
    Command& out,
    OperationError& error
) {
    std::size_t index = 0;
    if (!locate(doc, row_id, index, error)) {
        return false;
    }

    const std::size_t length = utf8_length(doc.row_at(index).text(column));
    if (split_offset == 0 || split_offset >= length) {
        return fail(
            error,
            OperationErrorCode::InvalidSplitPoint,
            row_id,
            "Offset " + std::to_string(split_offset) + " is not inside the " + column_name(column) +
                " text of row " + std::to_string(row_id) + " (length " + std::to_string(length) + ")"
        );
    }

    SplitRow forward;
    forward.row_id = row_id;
    forward.column = column;
    forward.offset = split_offset;
    forward.new_row_id = DocumentMutator::allocate_id(doc);

    JoinRows inverse;
    inverse.row_id = row_id;
    inverse.next_row_id = forward.new_row_id;
    inverse.column = column;

    if (!apply_operation(doc, forward, error)) {
        return false;
    }

    out.label = "Split";
    out.affected_row_ids = {row_id, forward.new_row_id};
    out.forward = std::move(forward);
    out.inverse = std::move(inverse);
    return true;
}

bool merge_rows(AlignmentDocument& doc, RowId row_id, Column column, Command& out, OperationError& error) {
    std::size_t index = 0;
    if (!locate(doc, row_id, index, error)) {
        return false;
    }
    if (index + 1 >= doc.row_count()) {
        return fail(
            error,
            OperationErrorCode::NoRowBelow,
            row_id,
            "Row " + std::to_string(row_id) + " is the last row; nothing to merge with"
        );
    }

    const AlignmentRow& current = doc.row_at(index);
    const AlignmentRow& next = doc.row_at(index + 1);

    JoinRows forward;
    forward.row_id = row_id;
    forward.next_row_id = next.id;
    forward.column = column;
    forward.separator = join_separator(current.text(column), next.text(column));

    // The inverse rebuilds the removed row in full, including its other column.
    SplitRow inverse;
    inverse.row_id = row_id;
    inverse.column = column;
    inverse.offset = utf8_length(current.text(column));
    inverse.drop = utf8_length(forward.separator);
    inverse.new_row_id = next.id;
    inverse.new_row_other_text = next.text(other_column(column));

    std::vector<RowId> affected = {row_id, next.id};

    if (!apply_operation(doc, forward, error)) {
        return false;
    }

    out.label = "Merge";
    out.affected_row_ids = std::move(affected);
    out.forward = std::move(forward);
    out.inverse = std::move(inverse);
    return true;
}

bool move_row(AlignmentDocument& doc, RowId row_id, Direction direction, Command& out, OperationError& error) {
    std::size_t index = 0;
    if (!locate(doc, row_id, index, error)) {
        return false;
    }

    const SwapRows forward{row_id, direction};
    if (!apply_operation(doc, forward, error)) {
        return false;
    }

    // The neighbour now sits where the moved row was.
    out.label = direction == Direction::Up ? "Move up" : "Move down";
    out.affected_row_ids = {row_id, doc.row_at(index).id};
    out.forward = forward;
    out.inverse = SwapRows{row_id, opposite(direction)};
    return true;
}

bool set_text(
    AlignmentDocument& doc,
    RowId row_id,
    Column column,
    std::string new_text,
    Command& out,
    OperationError& error
) {
    std::size_t index = 0;
    if (!locate(doc, row_id, index, error)) {
        return false;
    }

    SetText inverse{row_id, column, doc.row_at(index).text(column)};
    SetText forward{row_id, column, sanitize_cell_text(std::move(new_text))};

    if (!apply_operation(doc, forward, error)) {
        return false;
    }

    out.label = "Edit cell";
    out.affected_row_ids = {row_id};
    out.forward = std::move(forward);
    out.inverse = std::move(inverse);
    return true;
}

bool delete_empty_row(AlignmentDocument& doc, RowId row_id, Command& out, OperationError& error) {
    std::size_t index = 0;
    if (!locate(doc, row_id, index, error)) {
        return false;
    }

    const AlignmentRow& row = doc.row_at(index);
    if (!row.source_text.empty() || !row.target_text.empty()) {
        return fail(
            error,
            OperationErrorCode::RowNotEmpty,
            row_id,
            "Row " + std::to_string(row_id) + " is not empty; both source and target must be blank to delete"
        );
    }

    InsertRow inverse{index, row};
    const RemoveRow forward{row_id};
    if (!apply_operation(doc, forward, error)) {
        return false;
    }

    out.label = "Delete empty row";
    out.affected_row_ids = {row_id};
    out.forward = forward;
    out.inverse = std::move(inverse);
    return true;
}

bool replace_texts(AlignmentDocument& doc, std::vector<SetText> cells, Command& out, OperationError& error) {
    ReplaceTexts inverse;
    inverse.cells.reserve(cells.size());
    std::vector<RowId> affected;
    affected.reserve(cells.size());

    for (const auto& cell : cells) {
        std::size_t index = 0;
        if (!locate(doc, cell.row_id, index, error)) {
            return false;
        }
        inverse.cells.push_back(SetText{cell.row_id, cell.column, doc.row_at(index).text(cell.column)});
        if (affected.empty() || affected.back() != cell.row_id) {
            affected.push_back(cell.row_id);
        }
    }

    ReplaceTexts forward{std::move(cells)};
    if (!apply_operation(doc, forward, error)) {
        return false;
    }

    out.label = "Replace all";
    out.affected_row_ids = std::move(affected);
    out.forward = std::move(forward);
    out.inverse = std::move(inverse);
    return true;
}

}  // namespace tmx_align
