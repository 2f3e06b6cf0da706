#include "transport/loopback_transport.h"
#include "core/errors.h"
#include "util/log.h"

#include <algorithm>
#include <chrono>
#include <string>

namespace flowbench {

struct LoopbackNetwork::Flow {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<Arrival> arrivals;
    size_t queued_datagrams = 0;
    bool network_closed = false;

    void push(Arrival&& a) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (a.kind == ArrivalKind::DATAGRAM)
                ++queued_datagrams;
            arrivals.push_back(std::move(a));
        }
        cv.notify_one();
    }
};

// ---------------------------------------------------------------------------
// Client end
// ---------------------------------------------------------------------------

class LoopbackConnection : public IConnection {
public:
    LoopbackConnection(LoopbackNetwork& net, std::shared_ptr<LoopbackNetwork::Flow> flow,
                       uint64_t id, size_t max_datagram)
        : net_(net), flow_(std::move(flow)), id_(id), max_datagram_(max_datagram) {}

    ~LoopbackConnection() override { close(); }

    uint64_t id() const override { return id_; }
    std::string peer() const override { return "loopback"; }
    size_t maxDatagramSize() const override { return max_datagram_; }

    void streamWrite(const uint8_t* data, size_t len) override {
        if (closed_ || finished_)
            throw TransportError("LoopbackConnection: stream write after finish");

        const int64_t index = writes_++;
        const LoopbackNetwork::Options& opts = net_.opts_;
        if (index == opts.fail_stream_write_at)
            throw TransportError("LoopbackConnection: injected failure at stream write " +
                                 std::to_string(index));

        uint64_t cost = opts.write_cost_ns;
        if (index == opts.stall_at_write)
            cost += opts.stall_ns;
        if (cost > 0)
            net_.clock_.sleepUntilNs(net_.clock_.nowNs() + cost);

        const size_t seg = opts.stream_segment_bytes > 0 ? opts.stream_segment_bytes : len;
        size_t off = 0;
        while (off < len) {
            const size_t n = std::min(seg, len - off);
            Arrival a;
            a.kind = ArrivalKind::STREAM_DATA;
            a.recv_ns = net_.clock_.nowNs();
            a.data.assign(data + off, data + off + n);
            flow_->push(std::move(a));
            off += n;
        }
    }

    DatagramResult sendDatagram(const uint8_t* data, size_t len) override {
        if (closed_)
            return DatagramResult::FAILED;
        if (len > max_datagram_)
            return DatagramResult::TOO_LARGE;

        const size_t limit = net_.opts_.datagram_queue_limit;
        if (limit > 0) {
            std::lock_guard<std::mutex> lk(flow_->mu);
            if (flow_->queued_datagrams >= limit)
                return DatagramResult::WOULD_BLOCK;
        }

        if (net_.lose()) {
            net_.datagrams_lost_.fetch_add(1);
            return DatagramResult::SENT;
        }

        Arrival a;
        a.kind = ArrivalKind::DATAGRAM;
        a.recv_ns = net_.clock_.nowNs();
        a.data.assign(data, data + len);
        flow_->push(std::move(a));
        net_.datagrams_delivered_.fetch_add(1);
        return DatagramResult::SENT;
    }

    void finish() override {
        if (finished_ || closed_)
            return;
        Arrival a;
        a.kind = ArrivalKind::STREAM_FIN;
        a.recv_ns = net_.clock_.nowNs();
        flow_->push(std::move(a));
        finished_ = true;
    }

    // Closing without finish() looks like an orderly close to the peer, as a
    // TCP close() would.
    void close() override {
        if (closed_)
            return;
        finish();
        closed_ = true;
    }

private:
    LoopbackNetwork& net_;
    std::shared_ptr<LoopbackNetwork::Flow> flow_;
    uint64_t id_;
    size_t   max_datagram_;
    int64_t  writes_ = 0;
    bool     finished_ = false;
    bool     closed_ = false;
};

// ---------------------------------------------------------------------------
// Server end
// ---------------------------------------------------------------------------

namespace {

class LoopbackInbound : public IInboundConnection {
public:
    LoopbackInbound(std::shared_ptr<LoopbackNetwork::Flow> flow, uint64_t id, ClientHello hello)
        : flow_(std::move(flow)), id_(id), hello_(std::move(hello)) {}

    uint64_t id() const override { return id_; }
    std::string peer() const override { return "loopback"; }
    const ClientHello& hello() const override { return hello_; }

    ArrivalKind poll(uint32_t timeout_ms, Arrival& out) override {
        std::unique_lock<std::mutex> lk(flow_->mu);
        flow_->cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this] {
            return !flow_->arrivals.empty() || flow_->network_closed;
        });

        if (!flow_->arrivals.empty()) {
            out = std::move(flow_->arrivals.front());
            flow_->arrivals.pop_front();
            if (out.kind == ArrivalKind::DATAGRAM)
                --flow_->queued_datagrams;
            return out.kind;
        }

        out.data.clear();
        out.error.clear();
        out.kind = flow_->network_closed ? ArrivalKind::CLOSED : ArrivalKind::TIMEOUT;
        return out.kind;
    }

    void close() override {}

private:
    std::shared_ptr<LoopbackNetwork::Flow> flow_;
    uint64_t id_;
    ClientHello hello_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Network
// ---------------------------------------------------------------------------

LoopbackNetwork::LoopbackNetwork(IClock& clock)
    : LoopbackNetwork(clock, Options()) {}

LoopbackNetwork::LoopbackNetwork(IClock& clock, const Options& opts)
    : clock_(clock), opts_(opts), loss_(opts.loss_probability, opts.seed) {}

LoopbackNetwork::~LoopbackNetwork() {
    close();
}

bool LoopbackNetwork::lose() {
    std::lock_guard<std::mutex> lk(loss_mu_);
    return loss_.drop();
}

std::unique_ptr<IConnection> LoopbackNetwork::connect(const ConnectParams& params) {
    const uint64_t attempt = connect_attempts_.fetch_add(1) + 1;
    if (attempt <= opts_.refuse_connects)
        throw ConnectError("LoopbackNetwork: connection refused (attempt " +
                           std::to_string(attempt) + ")");

    std::lock_guard<std::mutex> lk(mu_);
    if (closed_)
        throw ConnectError("LoopbackNetwork: network closed");

    auto flow = std::make_shared<Flow>();
    const uint64_t id = next_flow_id_++;
    const size_t max_dg = std::min(params.max_datagram_size, opts_.max_datagram_size);

    ClientHello hello;
    hello.mode = params.mode;
    hello.cca = params.cca;
    hello.max_datagram_size = params.max_datagram_size;

    flows_.push_back(flow);
    pending_.push_back(std::make_unique<LoopbackInbound>(flow, id, hello));
    cv_.notify_all();

    logf(LogLevel::DEBUG, "LoopbackNetwork: flow %llu connected (%s)",
         static_cast<unsigned long long>(id), modeName(params.mode));
    return std::make_unique<LoopbackConnection>(*this, flow, id, max_dg);
}

std::unique_ptr<IInboundConnection> LoopbackNetwork::accept(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                 [this] { return !pending_.empty() || closed_; });
    if (pending_.empty())
        return nullptr;
    auto conn = std::move(pending_.front());
    pending_.pop_front();
    return conn;
}

void LoopbackNetwork::close() {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_)
        return;
    closed_ = true;
    for (auto& flow : flows_) {
        {
            std::lock_guard<std::mutex> flk(flow->mu);
            flow->network_closed = true;
        }
        flow->cv.notify_all();
    }
    cv_.notify_all();
}

}  // namespace flowbench
