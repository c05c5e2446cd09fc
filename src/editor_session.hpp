#pragma once

#include "alignment_document.hpp"
#include "command_stack.hpp"
#include "edit_operations.hpp"
#include "persistence.hpp"
#include "save_controller.hpp"
#include "search.hpp"
#include "tmx_codec.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tmx_align {

// Permission to replace one cell's text, handed out by begin_edit() and
// spent by commit_edit() or cancel_edit(). Move-only.
class EditToken {
public:
    EditToken() = default;
    EditToken(EditToken&& other) noexcept;
    EditToken& operator=(EditToken&& other) noexcept;
    EditToken(const EditToken&) = delete;
    EditToken& operator=(const EditToken&) = delete;

    bool valid() const { return valid_; }
    RowId row_id() const { return row_id_; }
    Column column() const { return column_; }
    const std::string& original_text() const { return original_text_; }

private:
    friend class EditorSession;

    EditToken(std::uint64_t generation, RowId row_id, Column column, std::string original_text);

    std::uint64_t generation_ = 0;
    RowId row_id_ = 0;
    Column column_ = Column::Source;
    std::string original_text_;
    bool valid_ = false;
};

// Owns the open document together with its history. Every mutation goes
// through here so the two never drift apart.
class EditorSession {
public:
    bool open(const std::filesystem::path& path, ParseError& error, TmxLoadReport* report = nullptr);
    // Codes are normalized; they must be non-empty and differ.
    bool new_document(std::string_view source_lang, std::string_view target_lang, OperationError& error);
    void close();

    bool has_document() const { return doc_.has_value(); }
    // Precondition: has_document().
    const AlignmentDocument& document() const { return *doc_; }
    const CommandStack& history() const { return history_; }
    bool is_dirty() const { return doc_ && doc_->is_dirty(); }

    bool split(RowId row_id, Column column, std::size_t offset, OperationError& error);
    bool merge(RowId row_id, Column column, OperationError& error);
    bool move(RowId row_id, Direction direction, OperationError& error);
    bool delete_empty_row(RowId row_id, OperationError& error);
    bool replace_all(
        std::string_view query,
        std::string_view replacement,
        bool case_sensitive,
        std::size_t& replaced_cells,
        OperationError& error
    );

    // Replaces the first match in `cell`, then looks for the next match after
    // it. `next` is empty when the query no longer occurs anywhere.
    bool replace_one(
        const CellRef& cell,
        std::string_view query,
        std::string_view replacement,
        bool case_sensitive,
        bool& replaced,
        std::optional<CellRef>& next,
        OperationError& error
    );

    std::optional<CellRef> find(
        std::string_view query,
        const std::optional<CellRef>& from,
        const FindOptions& options = {}
    ) const;

    bool begin_edit(RowId row_id, Column column, EditToken& out, OperationError& error);
    bool commit_edit(EditToken&& token, std::string new_text, OperationError& error);
    void cancel_edit(EditToken&& token);

    bool undo(HistoryError& error);
    bool redo(HistoryError& error);
    bool can_undo() const { return history_.can_undo(); }
    bool can_redo() const { return history_.can_redo(); }

    bool save(PersistenceError& error, const SaveOptions& options = {});
    bool save_as(const std::filesystem::path& path, PersistenceError& error, const SaveOptions& options = {});

    // Serializes now, writes on a worker thread. Edits are refused until the
    // Finished event has been collected through poll_save().
    bool save_in_background(const std::filesystem::path& path, PersistenceError& error, const SaveOptions& options = {});
    std::vector<SaveEvent> poll_save();
    void cancel_save();
    void wait_for_save();
    bool is_saving() const { return saver_.is_running(); }

private:
    bool ready_for_edit(OperationError& error) const;
    void commit(Command command);
    void replace_document(AlignmentDocument doc);

    std::optional<AlignmentDocument> doc_;
    CommandStack history_;
    SaveController saver_;
    std::uint64_t generation_ = 0;
    std::uint64_t save_generation_ = 0;
};

}  // namespace tmx_align
