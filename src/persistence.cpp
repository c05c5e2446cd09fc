#include "persistence.hpp"

#include "tmx_codec.hpp"

#include <fstream>
#include <system_error>

namespace tmx_align {

namespace {

bool fail(
    PersistenceError& error,
    PersistenceErrorCode code,
    const std::filesystem::path& path,
    std::string message
) {
    error.code = code;
    error.path = path;
    error.message = std::move(message);
    return false;
}

void discard_temp(const std::filesystem::path& temp) {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
}

bool cancelled(const std::stop_token& stop, const std::filesystem::path& path, PersistenceError& error) {
    if (!stop.stop_requested()) {
        return false;
    }
    fail(error, PersistenceErrorCode::Cancelled, path, "Save of " + path.string() + " was cancelled");
    return true;
}

}  // namespace

const char* persistence_error_name(PersistenceErrorCode code) {
    switch (code) {
        case PersistenceErrorCode::BackupFailed:
            return "BackupFailed";
        case PersistenceErrorCode::WriteFailed:
            return "WriteFailed";
        case PersistenceErrorCode::RenameFailed:
            return "RenameFailed";
        case PersistenceErrorCode::Cancelled:
            return "Cancelled";
        case PersistenceErrorCode::Busy:
            return "Busy";
    }
    return "Unknown";
}

const char* save_stage_name(SaveStage stage) {
    switch (stage) {
        case SaveStage::BackupWritten:
            return "backup";
        case SaveStage::TempWritten:
            return "temp";
        case SaveStage::Renamed:
            return "renamed";
    }
    return "unknown";
}

std::filesystem::path backup_path_for(const std::filesystem::path& path) {
    return std::filesystem::path(path.string() + ".bak");
}

std::filesystem::path temp_path_for(const std::filesystem::path& path) {
    return std::filesystem::path(path.string() + ".tmp");
}

bool write_atomically(
    const std::string& bytes,
    const std::filesystem::path& path,
    const SaveOptions& options,
    PersistenceError& error,
    std::stop_token stop,
    const SaveStageCallback& on_stage
) {
    if (cancelled(stop, path, error)) {
        return false;
    }

    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return fail(
                error,
                PersistenceErrorCode::WriteFailed,
                path,
                "Failed to create directory " + parent.string() + ": " + ec.message()
            );
        }
    }

    if (options.backup && std::filesystem::exists(path, ec)) {
        const auto backup = backup_path_for(path);
        std::filesystem::copy_file(path, backup, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return fail(
                error,
                PersistenceErrorCode::BackupFailed,
                backup,
                "Failed to back up " + path.string() + " to " + backup.string() + ": " + ec.message()
            );
        }
        if (on_stage) {
            on_stage(SaveStage::BackupWritten);
        }
    }

    if (cancelled(stop, path, error)) {
        return false;
    }

    const auto temp = temp_path_for(path);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fail(error, PersistenceErrorCode::WriteFailed, temp, "Failed to open " + temp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            discard_temp(temp);
            return fail(error, PersistenceErrorCode::WriteFailed, temp, "Failed to write " + temp.string());
        }
    }
    if (on_stage) {
        on_stage(SaveStage::TempWritten);
    }

    // Last exit before the original file is replaced.
    if (cancelled(stop, path, error)) {
        discard_temp(temp);
        return false;
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        discard_temp(temp);
        return fail(
            error,
            PersistenceErrorCode::RenameFailed,
            path,
            "Failed to move " + temp.string() + " over " + path.string() + ": " + ec.message()
        );
    }
    if (on_stage) {
        on_stage(SaveStage::Renamed);
    }

    return true;
}

bool save_document(
    AlignmentDocument& doc,
    const std::filesystem::path& path,
    PersistenceError& error,
    const SaveOptions& options
) {
    const std::string bytes = serialize_tmx(doc);
    if (!write_atomically(bytes, path, options, error)) {
        return false;
    }
    doc.mark_saved(path);
    return true;
}

}  // namespace tmx_align
