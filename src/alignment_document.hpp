#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tmx_align {

using RowId = std::uint64_t;

enum class Column {
    Source,
    Target
};

const char* column_name(Column column);
Column other_column(Column column);

struct AlignmentRow {
    RowId id = 0;
    std::string source_text;
    std::string target_text;

    const std::string& text(Column column) const;

    bool operator==(const AlignmentRow&) const = default;
};

// Row text as it comes off disk, before ids are assigned.
struct RowText {
    std::string source_text;
    std::string target_text;
};

class AlignmentDocument {
public:
    AlignmentDocument() = default;
    AlignmentDocument(std::string source_lang, std::string target_lang);
    AlignmentDocument(std::string source_lang, std::string target_lang, std::vector<RowText> rows);

    std::size_t row_count() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    // Throws std::out_of_range for index >= row_count().
    const AlignmentRow& row_at(std::size_t index) const;

    // nullptr when the id no longer exists.
    const AlignmentRow* find_row(RowId id) const;
    std::optional<std::size_t> index_of(RowId id) const;

    const std::vector<AlignmentRow>& rows() const { return rows_; }

    const std::string& source_lang() const { return source_lang_; }
    const std::string& target_lang() const { return target_lang_; }
    const std::string& lang(Column column) const;

    const std::optional<std::filesystem::path>& origin_path() const { return origin_path_; }
    void set_origin_path(std::filesystem::path path) { origin_path_ = std::move(path); }

    bool is_dirty() const { return dirty_; }

    // Called by persistence once the new file is in place.
    void mark_saved(const std::filesystem::path& path);

    // History walked back to the state that was last saved.
    void mark_clean() { dirty_ = false; }

private:
    // Edit operations are the only writers of rows.
    friend class DocumentMutator;

    void reindex_from(std::size_t first);

    std::vector<AlignmentRow> rows_;
    std::unordered_map<RowId, std::size_t> index_by_id_;
    std::string source_lang_;
    std::string target_lang_;
    std::optional<std::filesystem::path> origin_path_;
    RowId next_id_ = 0;
    bool dirty_ = false;
};

}  // namespace tmx_align
