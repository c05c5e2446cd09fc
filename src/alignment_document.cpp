#include "alignment_document.hpp"

#include "text_utils.hpp"

#include <stdexcept>

namespace tmx_align {

const char* column_name(Column column) {
    return column == Column::Source ? "source" : "target";
}

Column other_column(Column column) {
    return column == Column::Source ? Column::Target : Column::Source;
}

const std::string& AlignmentRow::text(Column column) const {
    return column == Column::Source ? source_text : target_text;
}

AlignmentDocument::AlignmentDocument(std::string source_lang, std::string target_lang)
    : source_lang_(std::move(source_lang)), target_lang_(std::move(target_lang)) {}

AlignmentDocument::AlignmentDocument(std::string source_lang, std::string target_lang, std::vector<RowText> rows)
    : source_lang_(std::move(source_lang)), target_lang_(std::move(target_lang)) {
    rows_.reserve(rows.size());
    index_by_id_.reserve(rows.size());
    for (auto& text : rows) {
        AlignmentRow row;
        row.id = next_id_++;
        row.source_text = sanitize_cell_text(std::move(text.source_text));
        row.target_text = sanitize_cell_text(std::move(text.target_text));
        index_by_id_.emplace(row.id, rows_.size());
        rows_.push_back(std::move(row));
    }
}

const AlignmentRow& AlignmentDocument::row_at(std::size_t index) const {
    if (index >= rows_.size()) {
        throw std::out_of_range(
            "row index " + std::to_string(index) + " out of range (rows=" + std::to_string(rows_.size()) + ")"
        );
    }
    return rows_[index];
}

const AlignmentRow* AlignmentDocument::find_row(RowId id) const {
    const auto index = index_of(id);
    if (!index) {
        return nullptr;
    }
    return &rows_[*index];
}

std::optional<std::size_t> AlignmentDocument::index_of(RowId id) const {
    const auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& AlignmentDocument::lang(Column column) const {
    return column == Column::Source ? source_lang_ : target_lang_;
}

void AlignmentDocument::mark_saved(const std::filesystem::path& path) {
    origin_path_ = path;
    dirty_ = false;
}

void AlignmentDocument::reindex_from(std::size_t first) {
    for (std::size_t i = first; i < rows_.size(); ++i) {
        index_by_id_[rows_[i].id] = i;
    }
}

}  // namespace tmx_align
