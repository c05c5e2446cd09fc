#include "script_runner.hpp"

#include "text_utils.hpp"

#include <sstream>
#include <stdexcept>

namespace tmx_align {

namespace {

bool parse_index(const std::string& token, std::size_t& out) {
    if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = static_cast<std::size_t>(std::stoull(token));
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_column(const std::string& token, Column& out) {
    const std::string lowered = ascii_lower(token);
    if (lowered == "source" || lowered == "src") {
        out = Column::Source;
        return true;
    }
    if (lowered == "target" || lowered == "tgt") {
        out = Column::Target;
        return true;
    }
    return false;
}

bool parse_direction(const std::string& token, Direction& out) {
    const std::string lowered = ascii_lower(token);
    if (lowered == "up") {
        out = Direction::Up;
        return true;
    }
    if (lowered == "down") {
        out = Direction::Down;
        return true;
    }
    return false;
}

std::string join_tokens(const std::vector<std::string>& tokens, std::size_t first) {
    std::string out;
    for (std::size_t i = first; i < tokens.size(); ++i) {
        if (i > first) {
            out.push_back(' ');
        }
        out += tokens[i];
    }
    return out;
}

std::string describe(const ScriptCommand& command) {
    std::ostringstream oss;
    switch (command.verb) {
        case ScriptVerb::Split:
            oss << "split row=" << command.row << " " << column_name(command.column) << " offset=" << command.offset;
            break;
        case ScriptVerb::Merge:
            oss << "merge row=" << command.row << " " << column_name(command.column);
            break;
        case ScriptVerb::Move:
            oss << "move row=" << command.row << " " << direction_name(command.direction);
            break;
        case ScriptVerb::Set:
            oss << "set row=" << command.row << " " << column_name(command.column);
            break;
        case ScriptVerb::Delete:
            oss << "delete row=" << command.row;
            break;
        case ScriptVerb::Replace:
            oss << "replace '" << command.text << "' -> '" << command.replacement << "'";
            break;
        case ScriptVerb::ReplaceOne:
            oss << "replace-one '" << command.text << "' -> '" << command.replacement << "'";
            break;
        case ScriptVerb::Find:
            oss << "find '" << command.text << "'";
            break;
        case ScriptVerb::Undo:
            oss << "undo";
            break;
        case ScriptVerb::Redo:
            oss << "redo";
            break;
        case ScriptVerb::Save:
            oss << "save";
            break;
    }
    return oss.str();
}

bool resolve_row(const EditorSession& session, std::size_t index, RowId& out, std::string& error) {
    if (!session.has_document() || index >= session.document().row_count()) {
        error = "row index " + std::to_string(index) + " out of range";
        return false;
    }
    out = session.document().row_at(index).id;
    return true;
}

std::string describe_cell(const EditorSession& session, const std::optional<CellRef>& cell) {
    if (!cell) {
        return "not found";
    }
    const auto index = session.document().index_of(cell->row_id);
    return "row=" + std::to_string(index.value_or(0)) + " " + column_name(cell->column);
}

std::string format_error(const OperationError& error) {
    return std::string(operation_error_name(error.code)) + ": " + error.message;
}

}  // namespace

bool tokenize_script_line(const std::string& line, std::vector<std::string>& out, std::string& error) {
    out.clear();
    std::string current;
    bool in_token = false;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '\\' && i + 1 < line.size()) {
            current.push_back(line[++i]);
            in_token = true;
        } else if (ch == '"') {
            in_quotes = !in_quotes;
            in_token = true;
        } else if (!in_quotes && is_space_byte(ch)) {
            if (in_token) {
                out.push_back(current);
                current.clear();
                in_token = false;
            }
        } else {
            current.push_back(ch);
            in_token = true;
        }
    }

    if (in_quotes) {
        error = "Unterminated quote";
        return false;
    }
    if (in_token) {
        out.push_back(current);
    }
    return true;
}

bool parse_script_line(
    const std::string& line,
    std::size_t line_number,
    std::optional<ScriptCommand>& out,
    std::string& error
) {
    out.reset();

    std::vector<std::string> tokens;
    if (!tokenize_script_line(line, tokens, error)) {
        error = "line " + std::to_string(line_number) + ": " + error;
        return false;
    }
    if (tokens.empty() || tokens[0].rfind('#', 0) == 0) {
        return true;
    }

    auto bad = [&](const std::string& usage) {
        error = "line " + std::to_string(line_number) + ": expected '" + usage + "'";
        return false;
    };

    ScriptCommand command;
    command.line = line_number;
    const std::string verb = ascii_lower(tokens[0]);

    if (verb == "split") {
        command.verb = ScriptVerb::Split;
        if (tokens.size() != 4 || !parse_index(tokens[1], command.row) || !parse_column(tokens[2], command.column) ||
            !parse_index(tokens[3], command.offset)) {
            return bad("split <row> <source|target> <offset>");
        }
    } else if (verb == "merge") {
        command.verb = ScriptVerb::Merge;
        if (tokens.size() != 3 || !parse_index(tokens[1], command.row) || !parse_column(tokens[2], command.column)) {
            return bad("merge <row> <source|target>");
        }
    } else if (verb == "move") {
        command.verb = ScriptVerb::Move;
        if (tokens.size() != 3 || !parse_index(tokens[1], command.row) ||
            !parse_direction(tokens[2], command.direction)) {
            return bad("move <row> <up|down>");
        }
    } else if (verb == "set") {
        command.verb = ScriptVerb::Set;
        if (tokens.size() < 3 || !parse_index(tokens[1], command.row) || !parse_column(tokens[2], command.column)) {
            return bad("set <row> <source|target> <text...>");
        }
        command.text = join_tokens(tokens, 3);
    } else if (verb == "delete") {
        command.verb = ScriptVerb::Delete;
        if (tokens.size() != 2 || !parse_index(tokens[1], command.row)) {
            return bad("delete <row>");
        }
    } else if (verb == "replace" || verb == "replace-one") {
        command.verb = verb == "replace" ? ScriptVerb::Replace : ScriptVerb::ReplaceOne;
        if (tokens.size() < 3 || tokens.size() > 4 || (tokens.size() == 4 && ascii_lower(tokens[3]) != "case")) {
            return bad(verb + " <query> <replacement> [case]");
        }
        command.text = tokens[1];
        command.replacement = tokens[2];
        command.case_sensitive = tokens.size() == 4;
    } else if (verb == "find") {
        command.verb = ScriptVerb::Find;
        if (tokens.size() < 2) {
            return bad("find <query>");
        }
        command.text = join_tokens(tokens, 1);
    } else if (verb == "undo" || verb == "redo" || verb == "save") {
        if (tokens.size() != 1) {
            return bad(verb);
        }
        command.verb = verb == "undo" ? ScriptVerb::Undo : verb == "redo" ? ScriptVerb::Redo : ScriptVerb::Save;
    } else {
        error = "line " + std::to_string(line_number) + ": unknown command '" + tokens[0] + "'";
        return false;
    }

    out = std::move(command);
    return true;
}

bool parse_script(std::istream& in, std::vector<ScriptCommand>& out, std::string& error) {
    out.clear();
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        std::optional<ScriptCommand> command;
        if (!parse_script_line(line, line_number, command, error)) {
            return false;
        }
        if (command) {
            out.push_back(std::move(*command));
        }
    }
    return true;
}

ScriptStats run_script(
    EditorSession& session,
    const std::vector<ScriptCommand>& commands,
    const std::filesystem::path& save_path,
    const SaveOptions& save_options,
    bool dry_run,
    const ScriptLogger& log
) {
    ScriptStats stats;
    std::optional<CellRef> last_found;

    for (const auto& command : commands) {
        const std::string what = "line " + std::to_string(command.line) + ": " + describe(command);
        std::string detail;
        bool ok = false;

        OperationError op_error;
        HistoryError history_error;
        PersistenceError save_error;
        RowId row_id = 0;

        switch (command.verb) {
            case ScriptVerb::Split:
                ok = resolve_row(session, command.row, row_id, detail) &&
                    session.split(row_id, command.column, command.offset, op_error);
                break;
            case ScriptVerb::Merge:
                ok = resolve_row(session, command.row, row_id, detail) &&
                    session.merge(row_id, command.column, op_error);
                break;
            case ScriptVerb::Move:
                ok = resolve_row(session, command.row, row_id, detail) &&
                    session.move(row_id, command.direction, op_error);
                break;
            case ScriptVerb::Set: {
                EditToken token;
                ok = resolve_row(session, command.row, row_id, detail) &&
                    session.begin_edit(row_id, command.column, token, op_error) &&
                    session.commit_edit(std::move(token), command.text, op_error);
                break;
            }
            case ScriptVerb::Delete:
                ok = resolve_row(session, command.row, row_id, detail) &&
                    session.delete_empty_row(row_id, op_error);
                break;
            case ScriptVerb::Replace: {
                std::size_t replaced = 0;
                ok = session.replace_all(command.text, command.replacement, command.case_sensitive, replaced, op_error);
                if (ok) {
                    detail = "cells=" + std::to_string(replaced);
                }
                break;
            }
            case ScriptVerb::ReplaceOne: {
                // Acts on the cell the last find or replace-one landed on.
                bool replaced = false;
                if (last_found) {
                    ok = session.replace_one(
                        *last_found,
                        command.text,
                        command.replacement,
                        command.case_sensitive,
                        replaced,
                        last_found,
                        op_error
                    );
                } else {
                    FindOptions options;
                    options.case_sensitive = command.case_sensitive;
                    last_found = session.find(command.text, std::nullopt, options);
                    ok = true;
                }
                if (ok) {
                    detail = std::string(replaced ? "replaced" : "no match in cell") + "; next " +
                        describe_cell(session, last_found);
                }
                break;
            }
            case ScriptVerb::Find:
                last_found = session.find(command.text, last_found);
                ok = true;
                detail = describe_cell(session, last_found);
                break;
            case ScriptVerb::Undo:
                ok = session.undo(history_error);
                if (!ok) {
                    detail = std::string(history_error_name(history_error.code)) + ": " + history_error.message;
                }
                break;
            case ScriptVerb::Redo:
                ok = session.redo(history_error);
                if (!ok) {
                    detail = std::string(history_error_name(history_error.code)) + ": " + history_error.message;
                }
                break;
            case ScriptVerb::Save:
                if (dry_run) {
                    ok = true;
                    detail = "skipped (dry run)";
                    break;
                }
                ok = session.save_as(save_path, save_error, save_options);
                if (ok) {
                    ++stats.saves;
                } else {
                    detail = std::string(persistence_error_name(save_error.code)) + ": " + save_error.message;
                }
                break;
        }

        if (!ok && detail.empty()) {
            detail = format_error(op_error);
        }

        if (ok) {
            ++stats.applied;
        } else {
            ++stats.failed;
        }
        if (log) {
            log(detail.empty() ? what : what + " " + detail, ok);
        }
    }

    return stats;
}

}  // namespace tmx_align
