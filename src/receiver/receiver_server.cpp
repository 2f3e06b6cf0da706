#include "receiver/receiver_server.h"
#include "core/errors.h"
#include "io/flow_sinks.h"
#include "transport/handshake.h"
#include "util/log.h"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace flowbench {

static constexpr uint32_t kAcceptPollMs = 200;

ReceiverServer::ReceiverServer(IListener& listener, const ServerConfig& cfg)
    : listener_(listener), cfg_(cfg) {}

ReceiverServer::~ReceiverServer() {
    flows_stop_ = true;
    joinAll();
}

void ReceiverServer::reapFinished() {
    std::vector<uint64_t> done;
    {
        std::lock_guard<std::mutex> lk(mu_);
        done.swap(finished_);
    }
    for (uint64_t slot : done) {
        auto it = threads_.find(slot);
        if (it == threads_.end())
            continue;
        if (it->second.joinable())
            it->second.join();
        threads_.erase(it);
        --unjoined_;
    }
}

void ReceiverServer::joinAll() {
    for (auto& kv : threads_) {
        if (kv.second.joinable())
            kv.second.join();
    }
    threads_.clear();
    unjoined_ = 0;
    std::lock_guard<std::mutex> lk(mu_);
    finished_.clear();
}

bool ReceiverServer::stopRequested() const {
    return stop_ && stop_->load(std::memory_order_relaxed);
}

std::string ReceiverServer::csvPathFor(uint64_t flow_id) const {
    return (fs::path(cfg_.out_dir) / ("recv_flow" + std::to_string(flow_id) + ".csv")).string();
}

std::string ReceiverServer::binaryPathFor(uint64_t flow_id) const {
    return (fs::path(cfg_.out_dir) / ("recv_flow" + std::to_string(flow_id) + ".fblog")).string();
}

std::vector<FlowSummary> ReceiverServer::summaries() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<FlowSummary>(summaries_.begin(), summaries_.end());
}

int ReceiverServer::run() {
    if (cfg_.cca.size() > kCcaLabelMax)
        throw ConfigError("ReceiverServer: cca label '" + cfg_.cca + "' is longer than " +
                          std::to_string(kCcaLabelMax) + " bytes");

    std::error_code ec;
    fs::create_directories(cfg_.out_dir, ec);
    if (ec)
        throw ConfigError("ReceiverServer: cannot create " + cfg_.out_dir + ": " + ec.message());

    logf(LogLevel::INFO, "ReceiverServer: writing flow logs to %s", cfg_.out_dir.c_str());

    while (!stopRequested()) {
        reapFinished();
        if (cfg_.max_flows > 0 && accepted_.load() >= cfg_.max_flows)
            break;

        std::unique_ptr<IInboundConnection> conn;
        try {
            conn = listener_.accept(kAcceptPollMs);
        } catch (const std::exception& e) {
            logf(LogLevel::ERROR, "ReceiverServer: accept failed: %s", e.what());
            continue;
        }
        if (!conn)
            continue;

        ++accepted_;
        ++active_;
        const uint64_t slot = next_slot_++;
        ++unjoined_;
        threads_.emplace(slot, std::thread([this, slot, c = std::move(conn)]() mutable {
            serveFlow(slot, std::move(c));
        }));
    }

    if (cfg_.max_flows > 0 && !stopRequested())
        logf(LogLevel::INFO, "ReceiverServer: %u flows accepted, waiting for them to close",
             cfg_.max_flows);

    while (active_.load() > 0) {
        if (stopRequested())
            flows_stop_ = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    joinAll();

    return stopRequested() ? kExitInterrupted : kExitOk;
}

void ReceiverServer::serveFlow(uint64_t slot, std::unique_ptr<IInboundConnection> conn) {
    const uint64_t id = conn->id();
    FlowSummary summary;
    summary.flow_id = id;
    summary.peer = conn->peer();
    summary.mode = conn->hello().mode;

    try {
        FlowMeta meta;
        meta.flow_id = id;
        meta.role = LogRole::RECEIVER;
        meta.mode = conn->hello().mode;
        meta.cca = conn->hello().cca.empty() ? cfg_.cca : conn->hello().cca;

        FlowSinkOptions so;
        so.csv_path = csvPathFor(id);
        so.binary_path = cfg_.binary_log ? binaryPathFor(id) : std::string();
        so.flush_every = cfg_.flush_every;
        so.kafka_brokers = cfg_.kafka_brokers;
        so.kafka_topic = cfg_.kafka_topic;
        FlowSinks sinks(meta, so);

        ReceiverOptions ro;
        ro.idle_timeout_ms = cfg_.idle_timeout_ms;
        ro.drain_linger_ms = cfg_.drain_linger_ms;
        ro.stop = &flows_stop_;

        FlowReceiver receiver(*conn, sinks.sink(), ro);
        summary = receiver.run();
        if (!summary.error.empty())
            ++failed_;
    } catch (const std::exception& e) {
        ++failed_;
        summary.final_state = FlowState::CLOSED;
        summary.error = e.what();
        logf(LogLevel::ERROR, "ReceiverServer: flow %llu failed: %s",
             static_cast<unsigned long long>(id), e.what());
        conn->close();
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        summaries_.push_back(summary);
        while (summaries_.size() > cfg_.max_kept_summaries)
            summaries_.pop_front();
        finished_.push_back(slot);
    }
    ++closed_;
    --active_;
}

}  // namespace flowbench
