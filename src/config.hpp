#pragma once

#include <filesystem>
#include <string>

namespace tmx_align {

struct AppConfig {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    std::string script_path;
    bool backup = true;
    bool background_save = false;
    bool dry_run = false;
    bool quiet = false;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

}  // namespace tmx_align
