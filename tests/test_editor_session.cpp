#include <gtest/gtest.h>

#include "editor_session.hpp"
#include "test_support.hpp"

#include <algorithm>

using namespace tmx_align;
using namespace tmx_align::test;

namespace {

class EditorSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = dir_ / "small.tmx";
        write_file(path_, kSmallTmx);
        ParseError error;
        ASSERT_TRUE(session_.open(path_, error)) << error.message;
    }

    RowId id_at(std::size_t index) const { return session_.document().row_at(index).id; }

    TempDir dir_;
    std::filesystem::path path_;
    EditorSession session_;
};

}  // namespace

TEST_F(EditorSessionTest, OpenLoadsRowsCleanWithPath) {
    EXPECT_TRUE(session_.has_document());
    EXPECT_EQ(session_.document().row_count(), 5u);
    EXPECT_EQ(session_.document().source_lang(), "en");
    EXPECT_EQ(session_.document().target_lang(), "th");
    EXPECT_FALSE(session_.is_dirty());
    EXPECT_FALSE(session_.can_undo());
}

TEST_F(EditorSessionTest, OpenMissingFileKeepsCurrentDocument) {
    ParseError error;
    EXPECT_FALSE(session_.open(dir_ / "missing.tmx", error));
    EXPECT_EQ(error.code, ParseErrorCode::ReadFailed);
    EXPECT_EQ(session_.document().row_count(), 5u);
}

TEST_F(EditorSessionTest, DirtyFollowsHistoryAcrossSave) {
    OperationError op_error;
    ASSERT_TRUE(session_.split(id_at(0), Column::Source, 6, op_error));
    EXPECT_TRUE(session_.is_dirty());
    EXPECT_EQ(session_.document().row_count(), 6u);

    HistoryError history_error;
    ASSERT_TRUE(session_.undo(history_error));
    EXPECT_FALSE(session_.is_dirty());

    ASSERT_TRUE(session_.redo(history_error));
    EXPECT_TRUE(session_.is_dirty());

    PersistenceError save_error;
    ASSERT_TRUE(session_.save(save_error)) << save_error.message;
    EXPECT_FALSE(session_.is_dirty());

    ASSERT_TRUE(session_.undo(history_error));
    EXPECT_TRUE(session_.is_dirty());
    ASSERT_TRUE(session_.redo(history_error));
    EXPECT_FALSE(session_.is_dirty());
}

TEST_F(EditorSessionTest, SavedStateOnDiscardedBranchStaysDirty) {
    OperationError op_error;
    ASSERT_TRUE(session_.move(id_at(1), Direction::Up, op_error));
    PersistenceError save_error;
    ASSERT_TRUE(session_.save(save_error));

    HistoryError history_error;
    ASSERT_TRUE(session_.undo(history_error));
    ASSERT_TRUE(session_.move(id_at(3), Direction::Down, op_error));
    EXPECT_FALSE(session_.can_redo());
    EXPECT_TRUE(session_.is_dirty());
}

TEST_F(EditorSessionTest, EditTokenCommitRecordsOneCommand) {
    EditToken token;
    OperationError error;
    ASSERT_TRUE(session_.begin_edit(id_at(4), Column::Target, token, error));
    EXPECT_EQ(token.original_text(), "คุณชื่ออะไร");

    ASSERT_TRUE(session_.commit_edit(std::move(token), "ชื่ออะไร", error));
    EXPECT_EQ(session_.document().row_at(4).target_text, "ชื่ออะไร");
    EXPECT_EQ(session_.history().size(), 1u);
    EXPECT_TRUE(session_.is_dirty());
}

TEST_F(EditorSessionTest, CommitOfUnchangedTextRecordsNothing) {
    EditToken token;
    OperationError error;
    ASSERT_TRUE(session_.begin_edit(id_at(0), Column::Source, token, error));
    ASSERT_TRUE(session_.commit_edit(std::move(token), "Hello world", error));
    EXPECT_EQ(session_.history().size(), 0u);
    EXPECT_FALSE(session_.is_dirty());
}

TEST_F(EditorSessionTest, CommitComparesSanitizedText) {
    EditToken token;
    OperationError error;
    ASSERT_TRUE(session_.begin_edit(id_at(0), Column::Source, token, error));
    ASSERT_TRUE(session_.commit_edit(std::move(token), "Hello\tworld", error));
    EXPECT_EQ(session_.history().size(), 0u);
    EXPECT_FALSE(session_.is_dirty());
}

TEST_F(EditorSessionTest, ReplaceOneThenNextMatch) {
    bool replaced = false;
    std::optional<CellRef> next;
    OperationError error;
    ASSERT_TRUE(session_.replace_one(
        CellRef{id_at(2), Column::Source}, "27°c", "0°C", false, replaced, next, error
    ));
    EXPECT_TRUE(replaced);
    EXPECT_EQ(session_.document().row_at(2).source_text, "It is 0°C today");
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, (CellRef{id_at(2), Column::Target}));
    EXPECT_TRUE(session_.is_dirty());

    // A cell without a match only advances.
    ASSERT_TRUE(session_.replace_one(
        CellRef{id_at(0), Column::Source}, "27°C", "0°C", false, replaced, next, error
    ));
    EXPECT_FALSE(replaced);
    EXPECT_EQ(session_.history().size(), 1u);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, (CellRef{id_at(2), Column::Target}));
}

TEST_F(EditorSessionTest, SpentTokenIsRejected) {
    EditToken token;
    OperationError error;
    ASSERT_TRUE(session_.begin_edit(id_at(0), Column::Source, token, error));
    EditToken moved = std::move(token);
    EXPECT_FALSE(token.valid());

    EXPECT_FALSE(session_.commit_edit(std::move(token), "changed", error));
    EXPECT_EQ(error.code, OperationErrorCode::InvalidEditToken);

    session_.cancel_edit(std::move(moved));
    EXPECT_EQ(session_.history().size(), 0u);
    EXPECT_EQ(session_.document().row_at(0).source_text, "Hello world");
}

TEST_F(EditorSessionTest, TokenFromReplacedDocumentIsRejected) {
    EditToken token;
    OperationError error;
    ASSERT_TRUE(session_.begin_edit(id_at(0), Column::Source, token, error));

    ASSERT_TRUE(session_.new_document("en", "de", error));
    EXPECT_FALSE(session_.commit_edit(std::move(token), "changed", error));
    EXPECT_EQ(error.code, OperationErrorCode::InvalidEditToken);
}

TEST_F(EditorSessionTest, BeginEditOnUnknownRowFails) {
    EditToken token;
    OperationError error;
    EXPECT_FALSE(session_.begin_edit(999, Column::Source, token, error));
    EXPECT_EQ(error.code, OperationErrorCode::NotFound);
    EXPECT_FALSE(token.valid());
}

TEST_F(EditorSessionTest, FailedOperationLeavesHistoryUntouched) {
    OperationError error;
    EXPECT_FALSE(session_.merge(id_at(4), Column::Source, error));
    EXPECT_EQ(error.code, OperationErrorCode::NoRowBelow);
    EXPECT_FALSE(session_.move(id_at(0), Direction::Up, error));
    EXPECT_EQ(error.code, OperationErrorCode::AtBoundary);
    EXPECT_FALSE(session_.delete_empty_row(id_at(0), error));
    EXPECT_EQ(error.code, OperationErrorCode::RowNotEmpty);
    EXPECT_EQ(session_.history().size(), 0u);
    EXPECT_FALSE(session_.is_dirty());
}

TEST_F(EditorSessionTest, ReplaceAllThroughSession) {
    std::size_t replaced = 0;
    OperationError error;
    ASSERT_TRUE(session_.replace_all("27°C", "28°C", false, replaced, error));
    EXPECT_EQ(replaced, 2u);
    EXPECT_EQ(session_.history().undo_label(), "Replace all");

    const auto hit = session_.find("28°c", std::nullopt);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->row_id, id_at(2));
    EXPECT_EQ(hit->column, Column::Source);
}

TEST_F(EditorSessionTest, NoDocumentRefusesEdits) {
    session_.close();
    OperationError error;
    EXPECT_FALSE(session_.split(0, Column::Source, 1, error));
    EXPECT_EQ(error.code, OperationErrorCode::NoDocument);

    PersistenceError save_error;
    EXPECT_FALSE(session_.save(save_error));
    EXPECT_FALSE(session_.find("Hello", std::nullopt).has_value());
}

TEST_F(EditorSessionTest, NewDocumentNeedsSaveAs) {
    OperationError op_error;
    ASSERT_TRUE(session_.new_document("EN", " de ", op_error));
    EXPECT_TRUE(session_.document().empty());
    EXPECT_EQ(session_.document().source_lang(), "en");
    EXPECT_EQ(session_.document().target_lang(), "de");

    PersistenceError error;
    EXPECT_FALSE(session_.save(error));

    const auto out = dir_ / "new.tmx";
    ASSERT_TRUE(session_.save_as(out, error)) << error.message;
    EXPECT_TRUE(std::filesystem::exists(out));
    ASSERT_TRUE(session_.document().origin_path().has_value());
    EXPECT_EQ(*session_.document().origin_path(), out);
}

TEST_F(EditorSessionTest, EmptiedDocumentReopensWithItsLanguages) {
    const auto single = dir_ / "single.tmx";
    write_file(
        single,
        "<tmx version=\"1.4\"><header srclang=\"en\"/><body><tu>"
        "<tuv xml:lang=\"en\"><seg>a</seg></tuv><tuv xml:lang=\"de\"><seg>b</seg></tuv>"
        "</tu></body></tmx>"
    );
    ParseError open_error;
    ASSERT_TRUE(session_.open(single, open_error)) << open_error.message;

    OperationError op_error;
    for (const Column column : {Column::Source, Column::Target}) {
        EditToken token;
        ASSERT_TRUE(session_.begin_edit(id_at(0), column, token, op_error));
        ASSERT_TRUE(session_.commit_edit(std::move(token), "", op_error));
    }
    ASSERT_TRUE(session_.delete_empty_row(id_at(0), op_error)) << op_error.message;
    ASSERT_TRUE(session_.document().empty());

    const auto out = dir_ / "empty.tmx";
    PersistenceError save_error;
    ASSERT_TRUE(session_.save_as(out, save_error)) << save_error.message;

    EditorSession reopened;
    ParseError parse_error;
    ASSERT_TRUE(reopened.open(out, parse_error)) << parse_error.message;
    EXPECT_TRUE(reopened.document().empty());
    EXPECT_EQ(reopened.document().source_lang(), "en");
    EXPECT_EQ(reopened.document().target_lang(), "de");
}

TEST_F(EditorSessionTest, NewDocumentRejectsBadLanguagePair) {
    OperationError error;
    EXPECT_FALSE(session_.new_document("en", "EN", error));
    EXPECT_EQ(error.code, OperationErrorCode::InvalidLanguagePair);
    EXPECT_FALSE(session_.new_document("", "fr", error));
    EXPECT_EQ(error.code, OperationErrorCode::InvalidLanguagePair);

    // The open document is kept.
    EXPECT_EQ(session_.document().row_count(), 5u);
    EXPECT_EQ(session_.document().target_lang(), "th");
}

TEST_F(EditorSessionTest, BackgroundSaveBlocksEditsUntilPolled) {
    OperationError op_error;
    ASSERT_TRUE(session_.split(id_at(0), Column::Source, 6, op_error));

    const auto out = dir_ / "background.tmx";
    PersistenceError save_error;
    ASSERT_TRUE(session_.save_in_background(out, save_error)) << save_error.message;
    EXPECT_TRUE(session_.is_saving());

    EXPECT_FALSE(session_.merge(id_at(0), Column::Source, op_error));
    EXPECT_EQ(op_error.code, OperationErrorCode::SaveInProgress);

    HistoryError history_error;
    EXPECT_FALSE(session_.undo(history_error));
    EXPECT_EQ(history_error.code, HistoryErrorCode::SaveInProgress);

    EXPECT_FALSE(session_.save_in_background(out, save_error));
    EXPECT_EQ(save_error.code, PersistenceErrorCode::Busy);

    session_.wait_for_save();
    const auto events = session_.poll_save();
    const auto finished = std::find_if(events.begin(), events.end(), [](const SaveEvent& e) {
        return e.type == SaveEventType::Finished;
    });
    ASSERT_NE(finished, events.end());
    EXPECT_TRUE(finished->success) << finished->error.message;

    EXPECT_FALSE(session_.is_saving());
    EXPECT_FALSE(session_.is_dirty());
    EXPECT_EQ(session_.document().row_count(), 6u);

    ASSERT_TRUE(session_.merge(id_at(0), Column::Source, op_error));
    EXPECT_EQ(session_.document().row_at(0).source_text, "Hello world");
}

TEST_F(EditorSessionTest, BackgroundSaveOfReplacedDocumentDoesNotMarkItClean) {
    OperationError op_error;
    ASSERT_TRUE(session_.split(id_at(0), Column::Source, 6, op_error));

    PersistenceError save_error;
    ASSERT_TRUE(session_.save_in_background(dir_ / "old.tmx", save_error));
    session_.wait_for_save();

    ASSERT_TRUE(session_.new_document("en", "de", op_error));

    const auto events = session_.poll_save();
    EXPECT_FALSE(events.empty());
    EXPECT_FALSE(session_.is_saving());
    EXPECT_FALSE(session_.document().origin_path().has_value());
}
