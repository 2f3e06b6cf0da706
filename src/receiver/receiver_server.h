#pragma once

#include "receiver/flow_receiver.h"
#include "runner/run_config.h"
#include "transport/i_transport.h"

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <string>
#include <vector>

namespace flowbench {

/// Accepts inbound flows and runs each on its own thread with its own
/// reassembly state and sinks. Logs are named by flow id under out_dir:
/// recv_flow<id>.csv, plus recv_flow<id>.fblog with binary_log set.
/// A failing flow is logged and never disturbs the others.
class ReceiverServer {
public:
    ReceiverServer(IListener& listener, const ServerConfig& cfg);
    ~ReceiverServer();

    ReceiverServer(const ReceiverServer&) = delete;
    ReceiverServer& operator=(const ReceiverServer&) = delete;

    /// Flag that stops accepting and closes every open flow.
    void setStopFlag(const std::atomic<bool>* stop) { stop_ = stop; }

    /// Accepts until the stop flag is raised or max_flows flows were
    /// accepted, then waits for every flow to close. Throws ConfigError when
    /// out_dir cannot be created. Returns kExitOk or kExitInterrupted.
    int run();

    /// Summaries of the most recently closed flows, oldest first; at most
    /// ServerConfig::max_kept_summaries.
    std::vector<FlowSummary> summaries() const;
    uint64_t flowsAccepted() const { return accepted_.load(); }
    uint64_t flowsClosed() const { return closed_.load(); }
    uint64_t flowsFailed() const { return failed_.load(); }
    /// Flow threads started and not yet joined.
    size_t unjoinedThreads() const { return unjoined_.load(); }

    std::string csvPathFor(uint64_t flow_id) const;
    std::string binaryPathFor(uint64_t flow_id) const;

private:
    void serveFlow(uint64_t slot, std::unique_ptr<IInboundConnection> conn);
    /// Joins the threads of flows that have finished.
    void reapFinished();
    void joinAll();
    bool stopRequested() const;

    IListener& listener_;
    ServerConfig cfg_;
    const std::atomic<bool>* stop_ = nullptr;
    std::atomic<bool> flows_stop_{false};   // relayed to every FlowReceiver

    std::map<uint64_t, std::thread> threads_;   // accept-loop thread only
    uint64_t next_slot_ = 0;

    mutable std::mutex mu_;
    std::deque<FlowSummary> summaries_;
    std::vector<uint64_t> finished_;            // slots ready to join
    std::atomic<size_t> unjoined_{0};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> closed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> active_{0};
};

}  // namespace flowbench
