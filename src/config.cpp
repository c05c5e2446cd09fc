#include "config.hpp"

#include <iostream>

namespace tmx_align {

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " --input <tmx-file> [--output <tmx-file>] [--script <file>|-] [options]\n\n"
        << "Options:\n"
        << "  --output <path>       Where to save (default: overwrite the input file)\n"
        << "  --script <path>       Edit commands, one per line; '-' reads stdin\n"
        << "  --no-backup           Do not keep <output>.bak when overwriting\n"
        << "  --background-save     Write the file from a background worker\n"
        << "  --dry-run             Apply the script but write nothing, 'save' lines included\n"
        << "  --quiet               Only print errors and the summary\n"
        << "  -h, --help            Show this help\n\n"
        << "Script commands (<row> is a 0-based row index):\n"
        << "  split <row> <source|target> <offset>\n"
        << "  merge <row> <source|target>\n"
        << "  move <row> <up|down>\n"
        << "  set <row> <source|target> <text...>\n"
        << "  delete <row>\n"
        << "  replace <query> <replacement> [case]\n"
        << "  replace-one <query> <replacement> [case]   (in the cell last found, then find next)\n"
        << "  find <query>\n"
        << "  undo | redo | save\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            config.input_path = require_value(arg);
        } else if (arg == "--output") {
            config.output_path = require_value(arg);
        } else if (arg == "--script") {
            config.script_path = require_value(arg);
        } else if (arg == "--no-backup") {
            config.backup = false;
        } else if (arg == "--background-save") {
            config.background_save = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.input_path.empty()) {
        error = "--input is required";
        return false;
    }
    if (config.output_path.empty()) {
        config.output_path = config.input_path;
    }

    return true;
}

}  // namespace tmx_align
