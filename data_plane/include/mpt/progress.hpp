#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>

namespace mpt {

class ProgressSink {
  public:
    virtual ~ProgressSink() = default;

    virtual void on_part_complete(std::uint32_t part_number, std::uint64_t bytes) = 0;
};

// Delivers progress events to a sink on its own thread so a slow sink never
// stalls the part workers. close() (or destruction) drains queued events.
class ProgressDispatcher {
  public:
    explicit ProgressDispatcher(ProgressSink *sink);
    ~ProgressDispatcher();

    ProgressDispatcher(const ProgressDispatcher &) = delete;
    ProgressDispatcher &operator=(const ProgressDispatcher &) = delete;

    void post(std::uint32_t part_number, std::uint64_t bytes);

    void close();

  private:
    struct Event {
        std::uint32_t part_number;
        std::uint64_t bytes;
    };

    void worker_thread();

    ProgressSink *sink_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Event> events_;
    bool stop_{false};
    std::thread thread_;
};

} // namespace mpt
