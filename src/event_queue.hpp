#pragma once

#include "save_event.hpp"

#include <mutex>
#include <vector>

namespace tmx_align {

// Handoff from the save worker to the thread that owns the session.
class EventQueue {
public:
    void push(SaveEvent event);

    // Takes everything queued so far. `finished` tells whether the batch
    // holds the worker's final event.
    std::vector<SaveEvent> take(bool& finished);

    void reset();

private:
    std::mutex mutex_;
    std::vector<SaveEvent> events_;
    bool finished_ = false;
};

}  // namespace tmx_align
