#pragma once

#include "io/i_event_sink.h"
#include "util/log.h"

#include <exception>
#include <vector>

namespace flowbench {

/// Best-effort fan-out over non-owned sinks. A sink that throws is counted
/// and logged; the others still see the call.
class MultiplexSink : public IEventSink {
public:
    void addSink(IEventSink* sink) { sinks_.push_back(sink); }

    void append(const EventRecord& rec) override {
        each("append", [&rec](IEventSink& s) { s.append(rec); });
    }
    void flush() override {
        each("flush", [](IEventSink& s) { s.flush(); });
    }
    void close() override {
        each("close", [](IEventSink& s) { s.close(); });
    }

    size_t sinkCount() const { return sinks_.size(); }
    uint64_t errorCount() const { return errors_; }

private:
    template <typename Op>
    void each(const char* what, Op op) {
        for (size_t i = 0; i < sinks_.size(); ++i) {
            try {
                op(*sinks_[i]);
            } catch (const std::exception& e) {
                ++errors_;
                logf(LogLevel::ERROR, "MultiplexSink: %s failed on sink %zu: %s", what, i, e.what());
            }
        }
    }

    std::vector<IEventSink*> sinks_;
    uint64_t errors_ = 0;
};

}  // namespace flowbench
