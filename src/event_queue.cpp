#include "event_queue.hpp"

#include <utility>

namespace tmx_align {

void EventQueue::push(SaveEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (event.type == SaveEventType::Finished) {
        finished_ = true;
    }
    events_.push_back(std::move(event));
}

std::vector<SaveEvent> EventQueue::take(bool& finished) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished = finished_;
    finished_ = false;
    std::vector<SaveEvent> out;
    out.swap(events_);
    return out;
}

void EventQueue::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
    finished_ = false;
}

}  // namespace tmx_align
