#include "config.hpp"
#include "editor_session.hpp"
#include "script_runner.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace tmx_align;

namespace {

bool load_script(const std::string& script_path, std::vector<ScriptCommand>& out, std::string& error) {
    out.clear();
    if (script_path.empty()) {
        return true;
    }
    if (script_path == "-") {
        return parse_script(std::cin, out, error);
    }

    std::ifstream in(script_path);
    if (!in) {
        error = "Failed to open script: " + script_path;
        return false;
    }
    if (!parse_script(in, out, error)) {
        error = script_path + ": " + error;
        return false;
    }
    return true;
}

bool save_in_background(EditorSession& session, const AppConfig& config, std::string& error) {
    PersistenceError save_error;
    SaveOptions options;
    options.backup = config.backup;
    if (!session.save_in_background(config.output_path, save_error, options)) {
        error = save_error.message;
        return false;
    }

    while (true) {
        for (const auto& e : session.poll_save()) {
            switch (e.type) {
                case SaveEventType::Started:
                case SaveEventType::BackupWritten:
                case SaveEventType::TempWritten:
                    if (!config.quiet) {
                        std::cerr << "[save] " << e.path.string() << " stage="
                                  << (e.type == SaveEventType::Started ? "started"
                                      : e.type == SaveEventType::BackupWritten ? "backup"
                                      : "temp")
                                  << "\n";
                    }
                    break;
                case SaveEventType::Finished:
                    if (!e.success) {
                        error = std::string(persistence_error_name(e.error.code)) + ": " + e.error.message;
                        return false;
                    }
                    return true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    std::vector<ScriptCommand> commands;
    if (!load_script(config.script_path, commands, error)) {
        std::cerr << "[fatal] " << error << "\n";
        return 1;
    }

    try {
        EditorSession session;
        ParseError parse_error;
        TmxLoadReport report;
        if (!session.open(config.input_path, parse_error, &report)) {
            std::cerr << "[fatal] " << parse_error_name(parse_error.code) << ": " << parse_error.message << "\n";
            return 1;
        }

        const auto& doc = session.document();
        if (!config.quiet) {
            std::cout
                << "[ok] " << config.input_path.filename().string()
                << " rows=" << doc.row_count()
                << " source=" << doc.source_lang()
                << " target=" << doc.target_lang()
                << "\n";
        }
        if (report.units_skipped > 0 || !report.dropped_langs.empty()) {
            std::cerr << "[skip] " << report.units_skipped << " unit(s) without "
                      << doc.source_lang() << "/" << doc.target_lang() << "; dropped languages:";
            for (const auto& lang : report.dropped_langs) {
                std::cerr << " " << lang;
            }
            std::cerr << "\n";
        }

        SaveOptions save_options;
        save_options.backup = config.backup;

        const auto log = [&](const std::string& message, bool ok) {
            if (!ok) {
                std::cerr << "[error] " << message << "\n";
            } else if (!config.quiet) {
                std::cout << "[ok] " << message << "\n";
            }
        };
        const ScriptStats stats =
            run_script(session, commands, config.output_path, save_options, config.dry_run, log);

        bool saved = stats.saves > 0;
        bool final_save_failed = false;
        if (!config.dry_run && session.is_dirty()) {
            if (config.background_save) {
                saved = save_in_background(session, config, error);
            } else {
                PersistenceError save_error;
                saved = session.save_as(config.output_path, save_error, save_options);
                if (!saved) {
                    error = std::string(persistence_error_name(save_error.code)) + ": " + save_error.message;
                }
            }
            if (!saved) {
                final_save_failed = true;
                std::cerr << "[error] save failed for " << config.output_path << ": " << error << "\n";
            }
        }

        std::cout
            << "[summary] commands=" << commands.size()
            << " ok=" << stats.applied
            << " failed=" << stats.failed
            << " rows=" << session.document().row_count()
            << " history=" << session.history().cursor()
            << " saved=" << (saved ? "yes" : "no")
            << "\n";

        return stats.failed > 0 || final_save_failed ? 1 : 0;
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }
}
