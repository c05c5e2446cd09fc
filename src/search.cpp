#include "search.hpp"

#include "text_utils.hpp"

#include <utility>
#include <vector>

namespace tmx_align {

std::size_t find_in_text(std::string_view text, std::string_view query, bool case_sensitive, std::size_t from) {
    if (query.empty() || from > text.size()) {
        return std::string_view::npos;
    }
    if (case_sensitive) {
        return text.find(query, from);
    }
    const std::string lowered_text = ascii_lower(text);
    const std::string lowered_query = ascii_lower(query);
    const auto pos = lowered_text.find(lowered_query, from);
    return pos == std::string::npos ? std::string_view::npos : pos;
}

std::optional<CellRef> find_next(
    const AlignmentDocument& doc,
    std::string_view query,
    const std::optional<CellRef>& from,
    const FindOptions& options
) {
    const std::size_t cells = doc.row_count() * 2;
    if (query.empty() || cells == 0) {
        return std::nullopt;
    }

    // Linear cell index: row * 2 + column.
    std::size_t start = options.forward ? cells - 1 : 0;
    if (from) {
        if (const auto index = doc.index_of(from->row_id)) {
            start = *index * 2 + (from->column == Column::Source ? 0 : 1);
        }
    }

    for (std::size_t step = 1; step <= cells; ++step) {
        const std::size_t cell = options.forward ? (start + step) % cells : (start + cells - step % cells) % cells;
        const auto& row = doc.row_at(cell / 2);
        const Column column = cell % 2 == 0 ? Column::Source : Column::Target;
        if (find_in_text(row.text(column), query, options.case_sensitive) != std::string_view::npos) {
            return CellRef{row.id, column};
        }
    }
    return std::nullopt;
}

std::string replace_in_text(
    std::string_view text,
    std::string_view query,
    std::string_view replacement,
    bool case_sensitive
) {
    if (query.empty()) {
        return std::string(text);
    }

    // ASCII folding keeps byte offsets, so one lowered copy serves every match.
    std::string lowered_text;
    std::string lowered_query;
    std::string_view haystack = text;
    std::string_view needle = query;
    if (!case_sensitive) {
        lowered_text = ascii_lower(text);
        lowered_query = ascii_lower(query);
        haystack = lowered_text;
        needle = lowered_query;
    }

    std::string out;
    std::size_t cursor = 0;
    while (true) {
        const std::size_t match = haystack.find(needle, cursor);
        if (match == std::string_view::npos) {
            break;
        }
        out.append(text.substr(cursor, match - cursor));
        out.append(replacement);
        cursor = match + query.size();
    }
    out.append(text.substr(cursor));
    return out;
}

bool replace_one(
    AlignmentDocument& doc,
    const CellRef& cell,
    std::string_view query,
    std::string_view replacement,
    bool case_sensitive,
    Command& out,
    bool& replaced,
    OperationError& error
) {
    replaced = false;
    const AlignmentRow* row = doc.find_row(cell.row_id);
    if (row == nullptr) {
        error.code = OperationErrorCode::NotFound;
        error.row_id = cell.row_id;
        error.message = "Row " + std::to_string(cell.row_id) + " not found";
        return false;
    }

    const std::string& text = row->text(cell.column);
    const std::size_t match = find_in_text(text, query, case_sensitive);
    if (match == std::string_view::npos) {
        return true;
    }

    std::string new_text = text.substr(0, match);
    new_text.append(replacement);
    new_text.append(text, match + query.size(), std::string::npos);

    if (!set_text(doc, cell.row_id, cell.column, std::move(new_text), out, error)) {
        return false;
    }
    out.label = "Replace";
    replaced = true;
    return true;
}

bool replace_all(
    AlignmentDocument& doc,
    std::string_view query,
    std::string_view replacement,
    bool case_sensitive,
    Command& out,
    std::size_t& replaced_cells,
    OperationError& error
) {
    replaced_cells = 0;
    if (query.empty()) {
        return true;
    }

    std::vector<SetText> cells;
    for (const auto& row : doc.rows()) {
        for (const Column column : {Column::Source, Column::Target}) {
            const std::string& text = row.text(column);
            if (find_in_text(text, query, case_sensitive) == std::string_view::npos) {
                continue;
            }
            cells.push_back(SetText{row.id, column, replace_in_text(text, query, replacement, case_sensitive)});
        }
    }

    if (cells.empty()) {
        return true;
    }

    const std::size_t count = cells.size();
    if (!replace_texts(doc, std::move(cells), out, error)) {
        return false;
    }
    replaced_cells = count;
    return true;
}

}  // namespace tmx_align
