#pragma once

#include "io/i_event_sink.h"
#include "core/records.h"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <vector>

namespace flowbench {

/// In-memory event sink for tests. Appends may come from the flow thread
/// while the test thread reads a snapshot.
class InMemorySink : public IEventSink {
public:
    void append(const EventRecord&) override;
    void flush() override { ++flushes_; }
    void close() override { closed_ = true; }

    std::vector<EventRecord> events() const;
    size_t size() const;
    size_t flushCount() const { return flushes_.load(); }
    bool closed() const { return closed_.load(); }

private:
    mutable std::mutex mu_;
    std::vector<EventRecord> events_;
    std::atomic<size_t> flushes_{0};
    std::atomic<bool> closed_{false};
};

}  // namespace flowbench
