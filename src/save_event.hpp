#pragma once

#include "persistence.hpp"

#include <filesystem>

namespace tmx_align {

enum class SaveEventType {
    Started,
    BackupWritten,
    TempWritten,
    Finished
};

struct SaveEvent {
    SaveEventType type = SaveEventType::Started;
    std::filesystem::path path;
    bool success = false;
    PersistenceError error;
};

}  // namespace tmx_align
