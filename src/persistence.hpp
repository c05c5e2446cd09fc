#pragma once

#include "alignment_document.hpp"

#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>

namespace tmx_align {

enum class PersistenceErrorCode {
    BackupFailed,
    WriteFailed,
    RenameFailed,
    Cancelled,
    Busy
};

const char* persistence_error_name(PersistenceErrorCode code);

struct PersistenceError {
    PersistenceErrorCode code = PersistenceErrorCode::WriteFailed;
    std::filesystem::path path;
    std::string message;
};

enum class SaveStage {
    BackupWritten,
    TempWritten,
    Renamed
};

const char* save_stage_name(SaveStage stage);

using SaveStageCallback = std::function<void(SaveStage)>;

struct SaveOptions {
    bool backup = true;
};

std::filesystem::path backup_path_for(const std::filesystem::path& path);
std::filesystem::path temp_path_for(const std::filesystem::path& path);

// Copies an existing `path` to `path.bak`, writes `bytes` to a temporary file
// beside it and renames that over `path`. Until the rename, `path` is left as
// it was; a stop request is honoured at every step before the rename.
bool write_atomically(
    const std::string& bytes,
    const std::filesystem::path& path,
    const SaveOptions& options,
    PersistenceError& error,
    std::stop_token stop = {},
    const SaveStageCallback& on_stage = {}
);

// Serializes `doc` and writes it with write_atomically. The document is only
// marked saved once the new file is in place.
bool save_document(
    AlignmentDocument& doc,
    const std::filesystem::path& path,
    PersistenceError& error,
    const SaveOptions& options = {}
);

}  // namespace tmx_align
