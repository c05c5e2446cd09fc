#pragma once

#include "editor_session.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace tmx_align {

enum class ScriptVerb {
    Split,
    Merge,
    Move,
    Set,
    Delete,
    Replace,
    ReplaceOne,
    Find,
    Undo,
    Redo,
    Save
};

struct ScriptCommand {
    ScriptVerb verb = ScriptVerb::Undo;
    std::size_t line = 0;
    std::size_t row = 0;
    Column column = Column::Source;
    std::size_t offset = 0;
    Direction direction = Direction::Up;
    std::string text;
    std::string replacement;
    bool case_sensitive = false;
};

// Whitespace-separated words; double quotes group words, backslash escapes.
bool tokenize_script_line(const std::string& line, std::vector<std::string>& out, std::string& error);

// Leaves `out` empty for blank lines and '#' comments.
bool parse_script_line(
    const std::string& line,
    std::size_t line_number,
    std::optional<ScriptCommand>& out,
    std::string& error
);

bool parse_script(std::istream& in, std::vector<ScriptCommand>& out, std::string& error);

struct ScriptStats {
    std::size_t applied = 0;
    std::size_t failed = 0;
    std::size_t saves = 0;
};

using ScriptLogger = std::function<void(const std::string& message, bool ok)>;

// Runs every command against `session`. A failing command is reported
// through `log` and the run continues with the next one. With `dry_run`
// set, `save` lines are logged but nothing is written.
ScriptStats run_script(
    EditorSession& session,
    const std::vector<ScriptCommand>& commands,
    const std::filesystem::path& save_path,
    const SaveOptions& save_options,
    bool dry_run,
    const ScriptLogger& log
);

}  // namespace tmx_align
