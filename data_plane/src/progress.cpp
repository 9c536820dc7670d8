#include "mpt/progress.hpp"

#include "mpt/log.hpp"

#include <exception>

namespace mpt {

ProgressDispatcher::ProgressDispatcher(ProgressSink *sink) : sink_(sink) {
    if (sink_ != nullptr) {
        thread_ = std::thread(&ProgressDispatcher::worker_thread, this);
    }
}

ProgressDispatcher::~ProgressDispatcher() { close(); }

void ProgressDispatcher::post(std::uint32_t part_number, std::uint64_t bytes) {
    if (sink_ == nullptr) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        events_.push(Event{part_number, bytes});
    }
    cv_.notify_one();
}

void ProgressDispatcher::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressDispatcher::worker_thread() {
    while (true) {
        Event event{};
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return stop_ || !events_.empty(); });
            if (stop_ && events_.empty()) {
                break;
            }
            event = events_.front();
            events_.pop();
        }
        try {
            sink_->on_part_complete(event.part_number, event.bytes);
        } catch (const std::exception &e) {
            MPT_LOG(kWarning) << "progress sink failed for part " << event.part_number << ": " << e.what();
        }
    }
}

} // namespace mpt
