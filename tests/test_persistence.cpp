#include <gtest/gtest.h>

#include "edit_operations.hpp"
#include "persistence.hpp"
#include "test_support.hpp"
#include "tmx_codec.hpp"

#include <stop_token>
#include <vector>

using namespace tmx_align;
using namespace tmx_align::test;

namespace {

AlignmentDocument edited_doc() {
    auto doc = make_doc({{"Hello", "Bonjour"}, {"world", "monde"}});
    Command command;
    OperationError error;
    EXPECT_TRUE(set_text(doc, 1, Column::Target, "le monde", command, error));
    return doc;
}

}  // namespace

TEST(Persistence, SaveToNewPathWritesWithoutBackup) {
    TempDir dir;
    const auto path = dir / "tm.tmx";
    auto doc = edited_doc();
    PersistenceError error;

    ASSERT_TRUE(save_document(doc, path, error)) << error.message;

    EXPECT_EQ(read_file(path), serialize_tmx(doc));
    EXPECT_FALSE(std::filesystem::exists(backup_path_for(path)));
    EXPECT_FALSE(std::filesystem::exists(temp_path_for(path)));
    EXPECT_FALSE(doc.is_dirty());
    ASSERT_TRUE(doc.origin_path().has_value());
    EXPECT_EQ(*doc.origin_path(), path);
}

TEST(Persistence, OverwriteKeepsBackupOfPreviousFile) {
    TempDir dir;
    const auto path = dir / "tm.tmx";
    write_file(path, "previous contents");
    write_file(backup_path_for(path), "stale backup");
    auto doc = edited_doc();
    PersistenceError error;

    ASSERT_TRUE(save_document(doc, path, error)) << error.message;

    EXPECT_EQ(read_file(backup_path_for(path)), "previous contents");
    EXPECT_EQ(read_file(path), serialize_tmx(doc));
    EXPECT_EQ(backup_path_for(path).filename(), "tm.tmx.bak");
}

TEST(Persistence, BackupCanBeDisabled) {
    TempDir dir;
    const auto path = dir / "tm.tmx";
    write_file(path, "previous contents");
    auto doc = edited_doc();
    PersistenceError error;
    SaveOptions options;
    options.backup = false;

    ASSERT_TRUE(save_document(doc, path, error, options));
    EXPECT_FALSE(std::filesystem::exists(backup_path_for(path)));
}

TEST(Persistence, SaveDoesNotTouchRows) {
    TempDir dir;
    auto doc = edited_doc();
    const auto texts = texts_of(doc);
    const auto ids = ids_of(doc);
    PersistenceError error;

    ASSERT_TRUE(save_document(doc, dir / "a.tmx", error));
    EXPECT_EQ(texts_of(doc), texts);
    EXPECT_EQ(ids_of(doc), ids);
}

TEST(Persistence, CancelBeforeRenameLeavesOriginalIntact) {
    TempDir dir;
    const auto path = dir / "tm.tmx";
    write_file(path, "original bytes");
    std::stop_source stop;
    std::vector<SaveStage> stages;
    PersistenceError error;

    const bool ok = write_atomically(
        "new bytes",
        path,
        SaveOptions{},
        error,
        stop.get_token(),
        [&](SaveStage stage) {
            stages.push_back(stage);
            if (stage == SaveStage::TempWritten) {
                stop.request_stop();
            }
        }
    );

    EXPECT_FALSE(ok);
    EXPECT_EQ(error.code, PersistenceErrorCode::Cancelled);
    EXPECT_EQ(read_file(path), "original bytes");
    EXPECT_FALSE(std::filesystem::exists(temp_path_for(path)));
    EXPECT_EQ(stages, (std::vector<SaveStage>{SaveStage::BackupWritten, SaveStage::TempWritten}));
}

TEST(Persistence, CancelledBeforeStartWritesNothing) {
    TempDir dir;
    const auto path = dir / "tm.tmx";
    std::stop_source stop;
    stop.request_stop();
    PersistenceError error;

    EXPECT_FALSE(write_atomically("bytes", path, SaveOptions{}, error, stop.get_token()));
    EXPECT_EQ(error.code, PersistenceErrorCode::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(Persistence, BackupFailureIsReported) {
    TempDir dir;
    const auto path = dir / "tm.tmx";
    std::filesystem::create_directories(path / "child");
    auto doc = edited_doc();
    PersistenceError error;

    EXPECT_FALSE(save_document(doc, path, error));
    EXPECT_EQ(error.code, PersistenceErrorCode::BackupFailed);
    EXPECT_TRUE(doc.is_dirty());
    EXPECT_FALSE(doc.origin_path().has_value());
    EXPECT_TRUE(std::filesystem::is_directory(path / "child"));
}

TEST(Persistence, RenameFailureCleansUpTemp) {
    TempDir dir;
    const auto path = dir / "tm.tmx";
    std::filesystem::create_directories(path / "child");
    PersistenceError error;
    SaveOptions options;
    options.backup = false;

    EXPECT_FALSE(write_atomically("bytes", path, options, error));
    EXPECT_EQ(error.code, PersistenceErrorCode::RenameFailed);
    EXPECT_FALSE(std::filesystem::exists(temp_path_for(path)));
    EXPECT_TRUE(std::filesystem::is_directory(path / "child"));
}

TEST(Persistence, SavedFileParsesBackToSameRows) {
    TempDir dir;
    const auto path = dir / "tm.tmx";
    auto doc = edited_doc();
    PersistenceError error;
    ASSERT_TRUE(save_document(doc, path, error));

    AlignmentDocument reread;
    ParseError parse_error;
    ASSERT_TRUE(read_tmx_file(path, reread, parse_error)) << parse_error.message;
    EXPECT_EQ(texts_of(reread), texts_of(doc));
}
