#include "command_stack.hpp"

#include <utility>

namespace tmx_align {

const char* history_error_name(HistoryErrorCode code) {
    switch (code) {
        case HistoryErrorCode::NothingToUndo:
            return "NothingToUndo";
        case HistoryErrorCode::NothingToRedo:
            return "NothingToRedo";
        case HistoryErrorCode::SaveInProgress:
            return "SaveInProgress";
        case HistoryErrorCode::Inconsistent:
            return "Inconsistent";
    }
    return "Unknown";
}

void CommandStack::push(Command command) {
    if (cursor_ < commands_.size()) {
        commands_.erase(commands_.begin() + static_cast<std::ptrdiff_t>(cursor_), commands_.end());
        if (clean_index_ && *clean_index_ > cursor_) {
            // The saved state lived on the discarded branch and is now unreachable.
            clean_index_.reset();
        }
    }
    commands_.push_back(std::move(command));
    ++cursor_;
}

bool CommandStack::undo(AlignmentDocument& doc, HistoryError& error) {
    if (!can_undo()) {
        error.code = HistoryErrorCode::NothingToUndo;
        error.message = "Nothing to undo";
        return false;
    }

    const Command& command = commands_[cursor_ - 1];
    OperationError op_error;
    if (!apply_operation(doc, command.inverse, op_error)) {
        error.code = HistoryErrorCode::Inconsistent;
        error.message = "Undo of '" + command.label + "' failed: " + op_error.message;
        return false;
    }

    --cursor_;
    if (is_clean()) {
        doc.mark_clean();
    }
    return true;
}

bool CommandStack::redo(AlignmentDocument& doc, HistoryError& error) {
    if (!can_redo()) {
        error.code = HistoryErrorCode::NothingToRedo;
        error.message = "Nothing to redo";
        return false;
    }

    const Command& command = commands_[cursor_];
    OperationError op_error;
    if (!apply_operation(doc, command.forward, op_error)) {
        error.code = HistoryErrorCode::Inconsistent;
        error.message = "Redo of '" + command.label + "' failed: " + op_error.message;
        return false;
    }

    ++cursor_;
    if (is_clean()) {
        doc.mark_clean();
    }
    return true;
}

std::string CommandStack::undo_label() const {
    return can_undo() ? commands_[cursor_ - 1].label : std::string{};
}

std::string CommandStack::redo_label() const {
    return can_redo() ? commands_[cursor_].label : std::string{};
}

void CommandStack::set_clean() {
    clean_index_ = cursor_;
}

bool CommandStack::is_clean() const {
    return clean_index_ && *clean_index_ == cursor_;
}

void CommandStack::clear() {
    commands_.clear();
    cursor_ = 0;
    clean_index_ = 0;
}

}  // namespace tmx_align
