#pragma once

#include "clock/iclock.h"
#include "core/errors.h"
#include "io/i_event_sink.h"
#include "runner/run_config.h"
#include "transport/i_transport.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace flowbench {

class ChunkSource;
class IUnitSender;
class RatePacer;

enum class StopReason : uint8_t {
    NONE = 0,
    END_OF_INPUT,
    CHUNK_LIMIT,
    DURATION_LIMIT,
    SHUTDOWN,
    FAILED
};

const char* stopReasonName(StopReason r);

struct RunResult {
    int         exit_code = kExitOk;
    StopReason  stop_reason = StopReason::NONE;
    std::string error;
    uint64_t    flow_id = 0;
    uint32_t    connect_attempts = 0;
    uint64_t    chunks_sent = 0;       // status ok
    uint64_t    chunks_dropped = 0;    // status dropped
    uint64_t    bytes_sent = 0;        // payload bytes of ok chunks
    uint64_t    max_lag_ns = 0;        // max(actual - scheduled)
    double      elapsed_s = 0.0;
};

/// Drives one client flow from configuration to teardown:
/// validate, connect with bounded retry, open the flow's sinks, pace every
/// chunk through the mode's sender, then finish the sender and release the
/// connection and sinks on every exit path. Errors never escape run(); they
/// come back as the result's exit code.
class FlowRunner {
public:
    FlowRunner(IConnector& connector, IClock& clock);

    /// Raised flag ends the flow after the current unit (exit 130).
    void setStopFlag(const std::atomic<bool>* stop) { stop_ = stop; }

    /// Extra sink receiving every send event (not owned).
    void addSink(IEventSink* sink) { extra_sinks_.push_back(sink); }

    RunResult run(const ClientConfig& cfg);

    /// Throws ConfigError for a configuration that cannot run.
    static void validate(const ClientConfig& cfg);

private:
    std::unique_ptr<IConnection> connectWithRetry(const ClientConfig& cfg, RunResult& result);
    void streamChunks(const ClientConfig& cfg, ChunkSource& source, RatePacer& pacer,
                      IUnitSender& sender, IEventSink& sink, RunResult& result);
    bool stopRequested() const;

    IConnector& connector_;
    IClock& clock_;
    const std::atomic<bool>* stop_ = nullptr;
    std::vector<IEventSink*> extra_sinks_;
};

}  // namespace flowbench
