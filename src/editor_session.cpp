#include "editor_session.hpp"

#include "text_utils.hpp"

#include <utility>

namespace tmx_align {

EditToken::EditToken(std::uint64_t generation, RowId row_id, Column column, std::string original_text)
    : generation_(generation),
      row_id_(row_id),
      column_(column),
      original_text_(std::move(original_text)),
      valid_(true) {}

EditToken::EditToken(EditToken&& other) noexcept
    : generation_(other.generation_),
      row_id_(other.row_id_),
      column_(other.column_),
      original_text_(std::move(other.original_text_)),
      valid_(other.valid_) {
    other.valid_ = false;
}

EditToken& EditToken::operator=(EditToken&& other) noexcept {
    if (this != &other) {
        generation_ = other.generation_;
        row_id_ = other.row_id_;
        column_ = other.column_;
        original_text_ = std::move(other.original_text_);
        valid_ = other.valid_;
        other.valid_ = false;
    }
    return *this;
}

bool EditorSession::open(const std::filesystem::path& path, ParseError& error, TmxLoadReport* report) {
    AlignmentDocument doc;
    if (!read_tmx_file(path, doc, error, report)) {
        return false;
    }
    replace_document(std::move(doc));
    return true;
}

bool EditorSession::new_document(std::string_view source_lang, std::string_view target_lang, OperationError& error) {
    std::string source = normalize_lang(source_lang);
    std::string target = normalize_lang(target_lang);
    if (source.empty() || target.empty() || source == target) {
        error.code = OperationErrorCode::InvalidLanguagePair;
        error.row_id = 0;
        error.message = "Need two distinct language codes, got '" + source + "' and '" + target + "'";
        return false;
    }
    replace_document(AlignmentDocument(std::move(source), std::move(target)));
    return true;
}

void EditorSession::close() {
    doc_.reset();
    history_.clear();
    ++generation_;
}

bool EditorSession::split(RowId row_id, Column column, std::size_t offset, OperationError& error) {
    if (!ready_for_edit(error)) {
        return false;
    }
    Command command;
    if (!split_row(*doc_, row_id, column, offset, command, error)) {
        return false;
    }
    commit(std::move(command));
    return true;
}

bool EditorSession::merge(RowId row_id, Column column, OperationError& error) {
    if (!ready_for_edit(error)) {
        return false;
    }
    Command command;
    if (!merge_rows(*doc_, row_id, column, command, error)) {
        return false;
    }
    commit(std::move(command));
    return true;
}

bool EditorSession::move(RowId row_id, Direction direction, OperationError& error) {
    if (!ready_for_edit(error)) {
        return false;
    }
    Command command;
    if (!move_row(*doc_, row_id, direction, command, error)) {
        return false;
    }
    commit(std::move(command));
    return true;
}

bool EditorSession::delete_empty_row(RowId row_id, OperationError& error) {
    if (!ready_for_edit(error)) {
        return false;
    }
    Command command;
    if (!tmx_align::delete_empty_row(*doc_, row_id, command, error)) {
        return false;
    }
    commit(std::move(command));
    return true;
}

bool EditorSession::replace_all(
    std::string_view query,
    std::string_view replacement,
    bool case_sensitive,
    std::size_t& replaced_cells,
    OperationError& error
) {
    replaced_cells = 0;
    if (!ready_for_edit(error)) {
        return false;
    }
    Command command;
    if (!tmx_align::replace_all(*doc_, query, replacement, case_sensitive, command, replaced_cells, error)) {
        return false;
    }
    if (replaced_cells > 0) {
        commit(std::move(command));
    }
    return true;
}

bool EditorSession::replace_one(
    const CellRef& cell,
    std::string_view query,
    std::string_view replacement,
    bool case_sensitive,
    bool& replaced,
    std::optional<CellRef>& next,
    OperationError& error
) {
    replaced = false;
    if (!ready_for_edit(error)) {
        return false;
    }
    const CellRef at = cell;
    Command command;
    if (!tmx_align::replace_one(*doc_, at, query, replacement, case_sensitive, command, replaced, error)) {
        return false;
    }
    if (replaced) {
        commit(std::move(command));
    }

    FindOptions options;
    options.case_sensitive = case_sensitive;
    next = find_next(*doc_, query, at, options);
    return true;
}

std::optional<CellRef> EditorSession::find(
    std::string_view query,
    const std::optional<CellRef>& from,
    const FindOptions& options
) const {
    if (!doc_) {
        return std::nullopt;
    }
    return find_next(*doc_, query, from, options);
}

bool EditorSession::begin_edit(RowId row_id, Column column, EditToken& out, OperationError& error) {
    if (!ready_for_edit(error)) {
        return false;
    }
    const AlignmentRow* row = doc_->find_row(row_id);
    if (row == nullptr) {
        error.code = OperationErrorCode::NotFound;
        error.row_id = row_id;
        error.message = "Row " + std::to_string(row_id) + " not found";
        return false;
    }
    out = EditToken(generation_, row_id, column, row->text(column));
    return true;
}

bool EditorSession::commit_edit(EditToken&& token, std::string new_text, OperationError& error) {
    EditToken spent = std::move(token);
    if (!spent.valid() || spent.generation_ != generation_) {
        error.code = OperationErrorCode::InvalidEditToken;
        error.row_id = spent.row_id();
        error.message = "Edit of row " + std::to_string(spent.row_id()) + " was not started on this document";
        return false;
    }
    if (!ready_for_edit(error)) {
        return false;
    }

    new_text = sanitize_cell_text(std::move(new_text));
    const AlignmentRow* row = doc_->find_row(spent.row_id());
    if (row != nullptr && row->text(spent.column()) == new_text) {
        return true;
    }

    Command command;
    if (!set_text(*doc_, spent.row_id(), spent.column(), std::move(new_text), command, error)) {
        return false;
    }
    commit(std::move(command));
    return true;
}

void EditorSession::cancel_edit(EditToken&& token) {
    EditToken spent = std::move(token);
}

bool EditorSession::undo(HistoryError& error) {
    if (is_saving()) {
        error.code = HistoryErrorCode::SaveInProgress;
        error.message = "Cannot undo while a save is in progress";
        return false;
    }
    if (!doc_) {
        error.code = HistoryErrorCode::NothingToUndo;
        error.message = "No document open";
        return false;
    }
    return history_.undo(*doc_, error);
}

bool EditorSession::redo(HistoryError& error) {
    if (is_saving()) {
        error.code = HistoryErrorCode::SaveInProgress;
        error.message = "Cannot redo while a save is in progress";
        return false;
    }
    if (!doc_) {
        error.code = HistoryErrorCode::NothingToRedo;
        error.message = "No document open";
        return false;
    }
    return history_.redo(*doc_, error);
}

bool EditorSession::save(PersistenceError& error, const SaveOptions& options) {
    if (!doc_ || !doc_->origin_path()) {
        error.code = PersistenceErrorCode::WriteFailed;
        error.path.clear();
        error.message = doc_ ? "Document has no file path; use save as" : "No document open";
        return false;
    }
    return save_as(*doc_->origin_path(), error, options);
}

bool EditorSession::save_as(const std::filesystem::path& path, PersistenceError& error, const SaveOptions& options) {
    if (!doc_) {
        error.code = PersistenceErrorCode::WriteFailed;
        error.path = path;
        error.message = "No document open";
        return false;
    }
    if (is_saving()) {
        error.code = PersistenceErrorCode::Busy;
        error.path = path;
        error.message = "A save is already in progress";
        return false;
    }
    if (!save_document(*doc_, path, error, options)) {
        return false;
    }
    history_.set_clean();
    return true;
}

bool EditorSession::save_in_background(
    const std::filesystem::path& path,
    PersistenceError& error,
    const SaveOptions& options
) {
    if (!doc_) {
        error.code = PersistenceErrorCode::WriteFailed;
        error.path = path;
        error.message = "No document open";
        return false;
    }
    if (!saver_.start(serialize_tmx(*doc_), path, options)) {
        error.code = PersistenceErrorCode::Busy;
        error.path = path;
        error.message = "A save is already in progress";
        return false;
    }
    save_generation_ = generation_;
    return true;
}

std::vector<SaveEvent> EditorSession::poll_save() {
    auto events = saver_.poll_events();
    for (const auto& e : events) {
        if (e.type != SaveEventType::Finished || !e.success) {
            continue;
        }
        // A document opened since the save started is not the one on disk.
        if (doc_ && save_generation_ == generation_) {
            doc_->mark_saved(e.path);
            history_.set_clean();
        }
    }
    return events;
}

void EditorSession::cancel_save() {
    saver_.cancel();
}

void EditorSession::wait_for_save() {
    saver_.wait();
}

bool EditorSession::ready_for_edit(OperationError& error) const {
    if (!doc_) {
        error.code = OperationErrorCode::NoDocument;
        error.row_id = 0;
        error.message = "No document open";
        return false;
    }
    if (is_saving()) {
        error.code = OperationErrorCode::SaveInProgress;
        error.row_id = 0;
        error.message = "Document is read-only while a save is in progress";
        return false;
    }
    return true;
}

void EditorSession::commit(Command command) {
    history_.push(std::move(command));
}

void EditorSession::replace_document(AlignmentDocument doc) {
    doc_ = std::move(doc);
    history_.clear();
    ++generation_;
}

}  // namespace tmx_align
