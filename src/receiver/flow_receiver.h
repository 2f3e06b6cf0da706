#pragma once

#include "core/event_types.h"
#include "io/i_event_sink.h"
#include "transport/i_transport.h"
#include "wire/stream_reassembler.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace flowbench {

/// Lifecycle of one inbound flow.
///   AWAITING_CONNECTION -> RECEIVING -> DRAINED -> CLOSED
/// A fatal transport error goes from RECEIVING straight to CLOSED.
enum class FlowState : uint8_t {
    AWAITING_CONNECTION = 0,
    RECEIVING,
    DRAINED,
    CLOSED
};

const char* flowStateName(FlowState s);

struct ReceiverOptions {
    uint32_t idle_timeout_ms = 5000;   // no arrivals for this long drains the flow
    uint32_t drain_linger_ms = 500;    // after stream end, wait this long for late datagrams
    uint32_t poll_interval_ms = 100;
    const std::atomic<bool>* stop = nullptr;
};

struct FlowSummary {
    uint64_t      flow_id = 0;
    std::string   peer;
    TransportMode mode = TransportMode::DATAGRAM;
    FlowState     final_state = FlowState::AWAITING_CONNECTION;
    uint64_t      units = 0;
    uint64_t      bytes = 0;
    uint64_t      stream_units = 0;
    uint64_t      datagram_units = 0;
    uint64_t      out_of_order = 0;    // datagrams below the highest seq seen
    uint64_t      parse_errors = 0;
    uint64_t      truncations = 0;
    uint64_t      truncated_bytes = 0;
    int64_t       highest_seq = -1;
    bool          stream_ended = false;
    bool          idle_timeout = false;
    bool          interrupted = false;
    std::string   error;               // set when the transport failed
};

/// Records every unit arriving on one inbound connection into a sink.
///
/// Stream bytes go through a StreamReassembler and yield one event per
/// complete frame, in stream order. Datagrams are decoded and recorded the
/// moment they arrive, duplicates and reordering included. Malformed units
/// are counted and logged without ending the flow.
class FlowReceiver {
public:
    FlowReceiver(IInboundConnection& conn, IEventSink& sink, const ReceiverOptions& opts);

    FlowReceiver(const FlowReceiver&) = delete;
    FlowReceiver& operator=(const FlowReceiver&) = delete;

    /// Runs the flow to CLOSED: the sink is flushed and closed and the
    /// connection released on every path. Sink errors propagate.
    FlowSummary run();

    FlowState state() const { return state_.load(); }

private:
    void onStreamData(const Arrival& a);
    void onDatagram(const Arrival& a);
    void checkTruncation();
    void record(uint64_t seq, TransportMode mode, uint32_t len, uint64_t recv_ns,
                uint64_t send_ts_ns);
    void closeFlow();

    IInboundConnection& conn_;
    IEventSink& sink_;
    ReceiverOptions opts_;
    wire::StreamReassembler reassembler_;
    std::atomic<FlowState> state_{FlowState::AWAITING_CONNECTION};
    FlowSummary summary_;
    uint64_t current_recv_ns_ = 0;
};

}  // namespace flowbench
