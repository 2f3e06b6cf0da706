#include "receiver/flow_receiver.h"
#include "core/records.h"
#include "util/log.h"
#include "wire/wire_format.h"

namespace flowbench {

const char* flowStateName(FlowState s) {
    switch (s) {
        case FlowState::AWAITING_CONNECTION: return "awaiting-connection";
        case FlowState::RECEIVING:           return "receiving";
        case FlowState::DRAINED:             return "drained";
        case FlowState::CLOSED:              return "closed";
    }
    return "unknown";
}

FlowReceiver::FlowReceiver(IInboundConnection& conn, IEventSink& sink,
                           const ReceiverOptions& opts)
    : conn_(conn), sink_(sink), opts_(opts)
{
    if (opts_.poll_interval_ms == 0)
        opts_.poll_interval_ms = 1;
    summary_.flow_id = conn.id();
    summary_.peer = conn.peer();
    summary_.mode = conn.hello().mode;
}

FlowSummary FlowReceiver::run() {
    state_ = FlowState::RECEIVING;

    uint64_t idle_ms = 0;
    uint64_t quiet_ms = 0;
    bool lingering = false;
    Arrival arrival;

    try {
        while (state_ == FlowState::RECEIVING) {
            if (opts_.stop && opts_.stop->load(std::memory_order_relaxed)) {
                summary_.interrupted = true;
                logf(LogLevel::INFO, "FlowReceiver: flow %llu interrupted by shutdown",
                     static_cast<unsigned long long>(summary_.flow_id));
                break;
            }

            const uint32_t wait = opts_.poll_interval_ms;
            switch (conn_.poll(wait, arrival)) {
                case ArrivalKind::STREAM_DATA:
                    idle_ms = 0;
                    onStreamData(arrival);
                    break;

                case ArrivalKind::DATAGRAM:
                    idle_ms = 0;
                    quiet_ms = 0;
                    onDatagram(arrival);
                    break;

                case ArrivalKind::STREAM_FIN:
                    idle_ms = 0;
                    summary_.stream_ended = true;
                    checkTruncation();
                    // Datagrams may still trail the FIN even when none arrived yet.
                    if (summary_.mode != TransportMode::DATAGRAM || opts_.drain_linger_ms == 0) {
                        state_ = FlowState::DRAINED;
                    } else {
                        lingering = true;
                        quiet_ms = 0;
                    }
                    break;

                case ArrivalKind::TIMEOUT:
                    idle_ms += wait;
                    if (lingering) {
                        quiet_ms += wait;
                        if (quiet_ms >= opts_.drain_linger_ms)
                            state_ = FlowState::DRAINED;
                    } else if (idle_ms >= opts_.idle_timeout_ms) {
                        summary_.idle_timeout = true;
                        logf(LogLevel::INFO, "FlowReceiver: flow %llu idle for %llu ms, draining",
                             static_cast<unsigned long long>(summary_.flow_id),
                             static_cast<unsigned long long>(idle_ms));
                        checkTruncation();
                        state_ = FlowState::DRAINED;
                    }
                    break;

                case ArrivalKind::CLOSED:
                    if (!summary_.stream_ended)
                        checkTruncation();
                    state_ = FlowState::DRAINED;
                    break;

                case ArrivalKind::ERROR:
                    summary_.error = arrival.error.empty() ? "transport error" : arrival.error;
                    logf(LogLevel::ERROR, "FlowReceiver: flow %llu transport failure: %s",
                         static_cast<unsigned long long>(summary_.flow_id), summary_.error.c_str());
                    if (!summary_.stream_ended)
                        checkTruncation();
                    state_ = FlowState::CLOSED;
                    break;
            }
        }
    } catch (...) {
        conn_.close();
        state_ = FlowState::CLOSED;
        summary_.final_state = FlowState::CLOSED;
        throw;
    }

    closeFlow();
    return summary_;
}

void FlowReceiver::onStreamData(const Arrival& a) {
    current_recv_ns_ = a.recv_ns;
    reassembler_.feed(
        a.data.data(), a.data.size(),
        [this](uint64_t seq, const uint8_t* /*payload*/, uint32_t len) {
            ++summary_.stream_units;
            record(seq, TransportMode::STREAM, len, current_recv_ns_, 0);
        },
        [this](wire::ParseError err, uint64_t offset) {
            ++summary_.parse_errors;
            logf(LogLevel::WARN, "FlowReceiver: flow %llu stream parse error at offset %llu: %s",
                 static_cast<unsigned long long>(summary_.flow_id),
                 static_cast<unsigned long long>(offset), wire::parseErrorName(err));
        });
}

void FlowReceiver::onDatagram(const Arrival& a) {
    wire::DatagramUnit unit;
    const wire::ParseError err = wire::decodeDatagram(a.data.data(), a.data.size(), unit);
    if (err != wire::ParseError::NONE) {
        ++summary_.parse_errors;
        logf(LogLevel::WARN, "FlowReceiver: flow %llu discarded %zu-byte datagram: %s",
             static_cast<unsigned long long>(summary_.flow_id), a.data.size(),
             wire::parseErrorName(err));
        return;
    }

    if (summary_.highest_seq >= 0 && unit.seq < static_cast<uint64_t>(summary_.highest_seq))
        ++summary_.out_of_order;
    ++summary_.datagram_units;
    record(unit.seq, TransportMode::DATAGRAM, unit.len, a.recv_ns, unit.send_ts_ns);
}

void FlowReceiver::checkTruncation() {
    const size_t pending = reassembler_.pendingBytes();
    if (pending == 0)
        return;
    ++summary_.truncations;
    summary_.truncated_bytes += pending;
    logf(LogLevel::WARN, "FlowReceiver: flow %llu stream ended inside a frame, %zu bytes truncated",
         static_cast<unsigned long long>(summary_.flow_id), pending);
}

void FlowReceiver::record(uint64_t seq, TransportMode mode, uint32_t len, uint64_t recv_ns,
                          uint64_t send_ts_ns) {
    sink_.append(makeRecvRecord(summary_.flow_id, seq, mode, len, recv_ns, send_ts_ns));
    ++summary_.units;
    summary_.bytes += len;
    if (static_cast<int64_t>(seq) > summary_.highest_seq)
        summary_.highest_seq = static_cast<int64_t>(seq);
}

void FlowReceiver::closeFlow() {
    sink_.flush();
    sink_.close();
    conn_.close();
    state_ = FlowState::CLOSED;
    summary_.final_state = FlowState::CLOSED;

    logf(LogLevel::INFO,
         "FlowReceiver: flow %llu closed: %llu units (%llu stream, %llu datagram), %llu bytes, "
         "%llu out of order, %llu parse errors, %llu truncated, highest seq %lld",
         static_cast<unsigned long long>(summary_.flow_id),
         static_cast<unsigned long long>(summary_.units),
         static_cast<unsigned long long>(summary_.stream_units),
         static_cast<unsigned long long>(summary_.datagram_units),
         static_cast<unsigned long long>(summary_.bytes),
         static_cast<unsigned long long>(summary_.out_of_order),
         static_cast<unsigned long long>(summary_.parse_errors),
         static_cast<unsigned long long>(summary_.truncations),
         static_cast<long long>(summary_.highest_seq));
}

}  // namespace flowbench
