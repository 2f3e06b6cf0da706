#pragma once

#include "io/i_event_sink.h"
#include "io/multiplex_sink.h"
#include "core/records.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace flowbench {

struct FlowSinkOptions {
    std::string csv_path;        // required
    std::string binary_path;     // empty = no binary log
    uint32_t    flush_every = 200;
    std::string kafka_brokers;   // empty = no Kafka export
    std::string kafka_topic;
};

/// Every event sink of one flow. The CSV log is the flow's record of truth:
/// its write errors propagate to the caller. The binary log, Kafka export
/// and any added sinks sit behind a best-effort MultiplexSink.
/// Opened at flow start; flushed and closed on destruction, whatever path
/// ends the flow.
class FlowSinks : public IEventSink {
public:
    /// Throws ConfigError when a log file cannot be created.
    FlowSinks(const FlowMeta& meta, const FlowSinkOptions& opts);
    ~FlowSinks() override;

    FlowSinks(const FlowSinks&) = delete;
    FlowSinks& operator=(const FlowSinks&) = delete;

    /// Adds a sink the caller owns (must outlive this object).
    void addSink(IEventSink* sink) { mux_.addSink(sink); }

    void append(const EventRecord& rec) override;
    void flush() override;
    /// Idempotent. Throws if the CSV log cannot be completed.
    void close() override;

    IEventSink& sink() { return *this; }
    uint64_t secondaryErrors() const { return mux_.errorCount(); }

private:
    std::unique_ptr<IEventSink> primary_;
    std::vector<std::unique_ptr<IEventSink>> owned_;
    MultiplexSink mux_;
    bool closed_ = false;
};

}  // namespace flowbench
