#pragma once

#include "event_queue.hpp"
#include "persistence.hpp"

#include <atomic>
#include <filesystem>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace tmx_align {

// Runs write_atomically on a worker thread. The caller hands over an
// already-serialized snapshot, so the worker never touches the document.
class SaveController {
public:
    SaveController();
    ~SaveController();

    SaveController(const SaveController&) = delete;
    SaveController& operator=(const SaveController&) = delete;

    bool start(std::string bytes, std::filesystem::path path, SaveOptions options);

    // Abandons the save unless the rename has already begun.
    void cancel();

    // True from start() until the Finished event has been polled.
    bool is_running() const;

    std::vector<SaveEvent> poll_events();

    // Blocks until the worker has posted its Finished event.
    void wait();

private:
    void run_worker(std::string bytes, std::filesystem::path path, SaveOptions options, std::stop_token stop);

    EventQueue events_;
    std::stop_source stop_source_;
    std::thread worker_;
    std::atomic<bool> running_{false};
};

}  // namespace tmx_align
