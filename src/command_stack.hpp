#pragma once

#include "alignment_document.hpp"
#include "edit_operations.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tmx_align {

enum class HistoryErrorCode {
    NothingToUndo,
    NothingToRedo,
    SaveInProgress,
    // The recorded inverse no longer applies; history and document disagree.
    Inconsistent
};

const char* history_error_name(HistoryErrorCode code);

struct HistoryError {
    HistoryErrorCode code = HistoryErrorCode::NothingToUndo;
    std::string message;
};

// Linear undo history: commands [0, cursor) are applied, [cursor, size) are undone.
class CommandStack {
public:
    // Records an already-applied command. Drops every undone command first.
    void push(Command command);

    bool undo(AlignmentDocument& doc, HistoryError& error);
    bool redo(AlignmentDocument& doc, HistoryError& error);

    bool can_undo() const { return cursor_ > 0; }
    bool can_redo() const { return cursor_ < commands_.size(); }

    // Empty when there is nothing to undo/redo.
    std::string undo_label() const;
    std::string redo_label() const;

    std::size_t size() const { return commands_.size(); }
    std::size_t cursor() const { return cursor_; }
    const Command& command_at(std::size_t index) const { return commands_.at(index); }

    // Remembers the current position as the saved state.
    void set_clean();
    bool is_clean() const;

    void clear();

private:
    std::vector<Command> commands_;
    std::size_t cursor_ = 0;
    std::optional<std::size_t> clean_index_ = 0;
};

}  // namespace tmx_align
