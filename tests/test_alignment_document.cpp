#include <gtest/gtest.h>

#include "alignment_document.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace tmx_align;
using namespace tmx_align::test;

TEST(AlignmentDocument, EmptyDocumentKeepsLanguages) {
    const AlignmentDocument doc("en", "de");
    EXPECT_TRUE(doc.empty());
    EXPECT_EQ(doc.row_count(), 0u);
    EXPECT_EQ(doc.lang(Column::Source), "en");
    EXPECT_EQ(doc.lang(Column::Target), "de");
    EXPECT_FALSE(doc.is_dirty());
    EXPECT_FALSE(doc.origin_path().has_value());
}

TEST(AlignmentDocument, FindRowByStableId) {
    const auto doc = make_doc({{"a", "1"}, {"b", "2"}, {"c", "3"}});

    const AlignmentRow* row = doc.find_row(1);
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->source_text, "b");
    EXPECT_EQ(row->text(Column::Target), "2");
    EXPECT_EQ(doc.index_of(2), 2u);
    EXPECT_EQ(doc.find_row(3), nullptr);
    EXPECT_FALSE(doc.index_of(3).has_value());
}

TEST(AlignmentDocument, RowAtOutOfRangeThrows) {
    const auto doc = make_doc({{"a", "1"}});
    EXPECT_THROW(doc.row_at(1), std::out_of_range);
}

TEST(AlignmentDocument, LoadedTextNeverContainsDelimiter) {
    const auto doc = make_doc({{"a\tb", "\t"}});
    EXPECT_EQ(doc.row_at(0).source_text, "a b");
    EXPECT_EQ(doc.row_at(0).target_text, " ");
}

TEST(AlignmentDocument, MarkSavedClearsDirtyAndSetsPath) {
    auto doc = make_doc({{"a", "1"}});
    doc.mark_saved("out.tmx");
    EXPECT_FALSE(doc.is_dirty());
    ASSERT_TRUE(doc.origin_path().has_value());
    EXPECT_EQ(doc.origin_path()->string(), "out.tmx");
}

TEST(ColumnHelpers, NamesAndOpposites) {
    EXPECT_STREQ(column_name(Column::Source), "source");
    EXPECT_STREQ(column_name(Column::Target), "target");
    EXPECT_EQ(other_column(Column::Source), Column::Target);
    EXPECT_EQ(other_column(Column::Target), Column::Source);
}
