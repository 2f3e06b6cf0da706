#pragma once

#include "clock/iclock.h"
#include "transport/i_transport.h"
#include "transport/loss_model.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>

namespace flowbench {

/// In-process transport: the connector and the listener of one emulated
/// network. Every connect() creates a flow whose server end is handed out by
/// accept(). Arrivals are stamped with the shared clock at the instant the
/// client end pushes them, so a ManualClock gives fully deterministic runs.
///
/// Impairments:
///  - datagram loss with a seeded Bernoulli model
///  - a one-off stall before stream write #stall_at_write
///  - a per-write link cost (a bottleneck at a fixed rate)
///  - an injected failure at stream write #fail_stream_write_at
///  - a bound on queued datagrams (WOULD_BLOCK once reached)
///  - refusing the first N connect attempts
class LoopbackNetwork : public IConnector, public IListener {
public:
    struct Options {
        double   loss_probability = 0.0;
        uint64_t seed = 1;
        uint32_t max_datagram_size = 65535;
        int64_t  stall_at_write = -1;       // stream write index, -1 = never
        uint64_t stall_ns = 0;
        uint64_t write_cost_ns = 0;         // charged to every stream write
        int64_t  fail_stream_write_at = -1; // stream write index, -1 = never
        size_t   stream_segment_bytes = 0;  // split writes into segments, 0 = whole
        size_t   datagram_queue_limit = 0;  // 0 = unbounded
        uint32_t refuse_connects = 0;       // refuse this many attempts first
    };

    explicit LoopbackNetwork(IClock& clock);
    LoopbackNetwork(IClock& clock, const Options& opts);
    ~LoopbackNetwork() override;

    LoopbackNetwork(const LoopbackNetwork&) = delete;
    LoopbackNetwork& operator=(const LoopbackNetwork&) = delete;

    std::unique_ptr<IConnection> connect(const ConnectParams& params) override;
    std::unique_ptr<IInboundConnection> accept(uint32_t timeout_ms) override;
    /// Wakes every pending accept() and poll(); open flows report CLOSED once
    /// their queues are empty.
    void close() override;

    uint64_t connectAttempts() const { return connect_attempts_.load(); }
    uint64_t datagramsLost() const { return datagrams_lost_.load(); }
    uint64_t datagramsDelivered() const { return datagrams_delivered_.load(); }

    struct Flow;

private:
    friend class LoopbackConnection;

    bool lose();

    IClock& clock_;
    Options opts_;
    BernoulliLoss loss_;
    std::mutex loss_mu_;

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<IInboundConnection>> pending_;
    std::deque<std::shared_ptr<Flow>> flows_;
    bool closed_ = false;
    uint64_t next_flow_id_ = 1;

    std::atomic<uint64_t> connect_attempts_{0};
    std::atomic<uint64_t> datagrams_lost_{0};
    std::atomic<uint64_t> datagrams_delivered_{0};
};

}  // namespace flowbench
