#include "save_controller.hpp"

#include <utility>

namespace tmx_align {

SaveController::SaveController() = default;

SaveController::~SaveController() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SaveController::start(std::string bytes, std::filesystem::path path, SaveOptions options) {
    if (running_.load(std::memory_order_relaxed)) {
        return false;
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    events_.reset();
    stop_source_ = std::stop_source{};
    running_.store(true, std::memory_order_relaxed);

    worker_ = std::thread(
        &SaveController::run_worker,
        this,
        std::move(bytes),
        std::move(path),
        options,
        stop_source_.get_token()
    );
    return true;
}

void SaveController::cancel() {
    stop_source_.request_stop();
}

bool SaveController::is_running() const {
    return running_.load(std::memory_order_relaxed);
}

std::vector<SaveEvent> SaveController::poll_events() {
    bool finished = false;
    auto events = events_.take(finished);
    if (finished) {
        if (worker_.joinable()) {
            worker_.join();
        }
        running_.store(false, std::memory_order_relaxed);
    }

    return events;
}

void SaveController::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SaveController::run_worker(
    std::string bytes,
    std::filesystem::path path,
    SaveOptions options,
    std::stop_token stop
) {
    SaveEvent started;
    started.type = SaveEventType::Started;
    started.path = path;
    events_.push(std::move(started));

    auto on_stage = [&](SaveStage stage) {
        if (stage == SaveStage::Renamed) {
            return;
        }
        SaveEvent e;
        e.type = stage == SaveStage::BackupWritten ? SaveEventType::BackupWritten : SaveEventType::TempWritten;
        e.path = path;
        events_.push(std::move(e));
    };

    SaveEvent finished;
    finished.type = SaveEventType::Finished;
    finished.path = path;
    finished.success = write_atomically(bytes, path, options, finished.error, stop, on_stage);
    events_.push(std::move(finished));
}

}  // namespace tmx_align
