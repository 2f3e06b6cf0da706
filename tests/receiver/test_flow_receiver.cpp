#include <gtest/gtest.h>
#include "receiver/flow_receiver.h"
#include "io/in_memory_sink.h"
#include "wire/wire_format.h"

#include <algorithm>
#include <atomic>
#include <deque>
#include <stdexcept>
#include <vector>

namespace flowbench {
namespace test {

/// Inbound connection that replays a fixed list of arrivals, then reports
/// TIMEOUT forever. poll() never blocks.
class ScriptedInbound : public IInboundConnection {
public:
    explicit ScriptedInbound(TransportMode mode) {
        hello_.mode = mode;
        hello_.cca = "cubic";
    }

    void push(ArrivalKind kind, uint64_t recv_ns, std::vector<uint8_t> data = {}) {
        Arrival a;
        a.kind = kind;
        a.recv_ns = recv_ns;
        a.data = std::move(data);
        script_.push_back(std::move(a));
    }

    void pushError(const std::string& msg) {
        Arrival a;
        a.kind = ArrivalKind::ERROR;
        a.error = msg;
        script_.push_back(std::move(a));
    }

    uint64_t id() const override { return 9; }
    std::string peer() const override { return "scripted"; }
    const ClientHello& hello() const override { return hello_; }

    ArrivalKind poll(uint32_t, Arrival& out) override {
        ++polls_;
        if (script_.empty()) {
            out = Arrival();
            return ArrivalKind::TIMEOUT;
        }
        out = std::move(script_.front());
        script_.pop_front();
        return out.kind;
    }

    void close() override { closed_ = true; }

    bool closed() const { return closed_; }
    uint64_t polls() const { return polls_; }

private:
    ClientHello hello_;
    std::deque<Arrival> script_;
    bool closed_ = false;
    uint64_t polls_ = 0;
};

static std::vector<uint8_t> datagram(uint64_t seq, size_t len, uint64_t send_ts) {
    Chunk c;
    c.seq = seq;
    c.bytes.assign(len, 0xAB);
    return wire::encodeDatagram(c, send_ts);
}

static std::vector<uint8_t> streamFrame(uint64_t seq, size_t len) {
    Chunk c;
    c.seq = seq;
    c.bytes.assign(len, 0xCD);
    return wire::encodeStreamFrame(c);
}

static ReceiverOptions fastOptions() {
    ReceiverOptions o;
    o.idle_timeout_ms = 1000;
    o.drain_linger_ms = 300;
    o.poll_interval_ms = 100;
    return o;
}

TEST(FlowReceiver, DatagramsRecordedInArrivalOrderWithDuplicates) {
    ScriptedInbound conn(TransportMode::DATAGRAM);
    conn.push(ArrivalKind::DATAGRAM, 100, datagram(0, 64, 10));
    conn.push(ArrivalKind::DATAGRAM, 200, datagram(2, 64, 30));
    conn.push(ArrivalKind::DATAGRAM, 300, datagram(1, 64, 20));
    conn.push(ArrivalKind::DATAGRAM, 400, datagram(1, 64, 20));
    conn.push(ArrivalKind::CLOSED, 500);

    InMemorySink sink;
    FlowReceiver receiver(conn, sink, fastOptions());
    const FlowSummary s = receiver.run();

    auto ev = sink.events();
    ASSERT_EQ(ev.size(), 4u);
    EXPECT_EQ(ev[0].seq, 0u);
    EXPECT_EQ(ev[1].seq, 2u);
    EXPECT_EQ(ev[2].seq, 1u);
    EXPECT_EQ(ev[3].seq, 1u);
    EXPECT_EQ(ev[1].ts_ns, 200u);
    EXPECT_EQ(ev[1].send_ts_ns, 30u);
    EXPECT_EQ(ev[1].flow_id, 9u);
    EXPECT_EQ(ev[1].kind, static_cast<uint8_t>(EventKind::RECV));
    EXPECT_EQ(ev[1].mode, static_cast<uint8_t>(TransportMode::DATAGRAM));

    EXPECT_EQ(s.units, 4u);
    EXPECT_EQ(s.datagram_units, 4u);
    EXPECT_EQ(s.out_of_order, 2u);
    EXPECT_EQ(s.highest_seq, 2);
    EXPECT_EQ(s.final_state, FlowState::CLOSED);
    EXPECT_EQ(receiver.state(), FlowState::CLOSED);
    EXPECT_TRUE(sink.closed());
    EXPECT_GE(sink.flushCount(), 1u);
    EXPECT_TRUE(conn.closed());
}

TEST(FlowReceiver, MalformedDatagramsAreDiscardedAndCounted) {
    ScriptedInbound conn(TransportMode::DATAGRAM);
    auto good = datagram(0, 32, 1);
    auto truncated = datagram(1, 32, 2);
    truncated.pop_back();
    auto garbage = std::vector<uint8_t>(40, 0x00);

    conn.push(ArrivalKind::DATAGRAM, 10, good);
    conn.push(ArrivalKind::DATAGRAM, 20, truncated);
    conn.push(ArrivalKind::DATAGRAM, 30, garbage);
    conn.push(ArrivalKind::DATAGRAM, 40, std::vector<uint8_t>(5, 1));
    conn.push(ArrivalKind::DATAGRAM, 50, datagram(2, 32, 3));
    conn.push(ArrivalKind::CLOSED, 60);

    InMemorySink sink;
    FlowReceiver receiver(conn, sink, fastOptions());
    const FlowSummary s = receiver.run();

    EXPECT_EQ(sink.size(), 2u);
    EXPECT_EQ(s.parse_errors, 3u);
    EXPECT_TRUE(s.error.empty());
}

TEST(FlowReceiver, StreamFramesAcrossArbitrarySegments) {
    ScriptedInbound conn(TransportMode::STREAM);
    std::vector<uint8_t> all;
    for (uint64_t s = 0; s < 5; ++s) {
        auto f = streamFrame(s, 100);
        all.insert(all.end(), f.begin(), f.end());
    }
    // Segments of 45 bytes, each stamped with its own arrival time.
    uint64_t t = 1000;
    for (size_t off = 0; off < all.size(); off += 45) {
        const size_t n = std::min<size_t>(45, all.size() - off);
        conn.push(ArrivalKind::STREAM_DATA, t,
                  std::vector<uint8_t>(all.begin() + off, all.begin() + off + n));
        t += 10;
    }
    conn.push(ArrivalKind::STREAM_FIN, t);

    InMemorySink sink;
    FlowReceiver receiver(conn, sink, fastOptions());
    const FlowSummary s = receiver.run();

    auto ev = sink.events();
    ASSERT_EQ(ev.size(), 5u);
    for (uint64_t i = 0; i < 5; ++i) {
        EXPECT_EQ(ev[i].seq, i);
        EXPECT_EQ(ev[i].bytes, 100u);
        EXPECT_EQ(ev[i].send_ts_ns, 0u);
        EXPECT_EQ(ev[i].mode, static_cast<uint8_t>(TransportMode::STREAM));
        if (i > 0)
            EXPECT_GE(ev[i].ts_ns, ev[i - 1].ts_ns);
    }
    // Frame 0 ends in the third segment (bytes 90..134).
    EXPECT_EQ(ev[0].ts_ns, 1020u);
    EXPECT_TRUE(s.stream_ended);
    EXPECT_EQ(s.truncations, 0u);
    EXPECT_EQ(s.stream_units, 5u);
}

TEST(FlowReceiver, StreamEndingInsideAFrameIsTruncation) {
    ScriptedInbound conn(TransportMode::STREAM);
    auto f0 = streamFrame(0, 50);
    auto f1 = streamFrame(1, 50);
    std::vector<uint8_t> bytes(f0.begin(), f0.end());
    bytes.insert(bytes.end(), f1.begin(), f1.begin() + 20);
    conn.push(ArrivalKind::STREAM_DATA, 10, bytes);
    conn.push(ArrivalKind::STREAM_FIN, 20);

    InMemorySink sink;
    FlowReceiver receiver(conn, sink, fastOptions());
    const FlowSummary s = receiver.run();

    EXPECT_EQ(sink.size(), 1u);
    EXPECT_EQ(s.truncations, 1u);
    EXPECT_EQ(s.truncated_bytes, 20u);
}

TEST(FlowReceiver, IdleTimeoutDrainsTheFlow) {
    ScriptedInbound conn(TransportMode::DATAGRAM);
    conn.push(ArrivalKind::DATAGRAM, 10, datagram(0, 8, 1));

    InMemorySink sink;
    ReceiverOptions o = fastOptions();
    FlowReceiver receiver(conn, sink, o);
    const FlowSummary s = receiver.run();

    EXPECT_TRUE(s.idle_timeout);
    EXPECT_EQ(s.units, 1u);
    EXPECT_EQ(s.final_state, FlowState::CLOSED);
    // one arrival + idle_timeout / poll_interval timeouts
    EXPECT_EQ(conn.polls(), 1u + o.idle_timeout_ms / o.poll_interval_ms);
}

TEST(FlowReceiver, LateDatagramsAfterStreamEndAreKeptDuringLinger) {
    ScriptedInbound conn(TransportMode::DATAGRAM);
    conn.push(ArrivalKind::DATAGRAM, 10, datagram(0, 8, 1));
    conn.push(ArrivalKind::STREAM_FIN, 20);
    conn.push(ArrivalKind::TIMEOUT, 0);
    conn.push(ArrivalKind::DATAGRAM, 30, datagram(1, 8, 2));

    InMemorySink sink;
    ReceiverOptions o = fastOptions();
    FlowReceiver receiver(conn, sink, o);
    const FlowSummary s = receiver.run();

    EXPECT_EQ(sink.size(), 2u);
    EXPECT_TRUE(s.stream_ended);
    EXPECT_FALSE(s.idle_timeout);
}

TEST(FlowReceiver, DatagramFlowLingersEvenWhenFinArrivesFirst) {
    ScriptedInbound conn(TransportMode::DATAGRAM);
    conn.push(ArrivalKind::STREAM_FIN, 5);
    conn.push(ArrivalKind::TIMEOUT, 0);
    conn.push(ArrivalKind::DATAGRAM, 40, datagram(0, 8, 1));
    conn.push(ArrivalKind::DATAGRAM, 50, datagram(1, 8, 2));

    InMemorySink sink;
    ReceiverOptions o = fastOptions();
    FlowReceiver receiver(conn, sink, o);
    const FlowSummary s = receiver.run();

    ASSERT_EQ(sink.size(), 2u);
    EXPECT_EQ(sink.events()[0].seq, 0u);
    EXPECT_EQ(sink.events()[1].seq, 1u);
    EXPECT_TRUE(s.stream_ended);
    // FIN, TIMEOUT, two datagrams, then a quiet linger of 300 ms.
    EXPECT_EQ(conn.polls(), 4u + o.drain_linger_ms / o.poll_interval_ms);
}

TEST(FlowReceiver, NoLingerOnStreamFlows) {
    ScriptedInbound conn(TransportMode::STREAM);
    conn.push(ArrivalKind::STREAM_DATA, 10, streamFrame(0, 8));
    conn.push(ArrivalKind::STREAM_FIN, 20);

    InMemorySink sink;
    FlowReceiver receiver(conn, sink, fastOptions());
    receiver.run();
    // STREAM_DATA, STREAM_FIN and nothing after.
    EXPECT_EQ(conn.polls(), 2u);
}

TEST(FlowReceiver, TransportErrorClosesWithError) {
    ScriptedInbound conn(TransportMode::STREAM);
    conn.push(ArrivalKind::STREAM_DATA, 10, streamFrame(0, 8));
    conn.pushError("connection reset");

    InMemorySink sink;
    FlowReceiver receiver(conn, sink, fastOptions());
    const FlowSummary s = receiver.run();

    EXPECT_EQ(s.error, "connection reset");
    EXPECT_EQ(s.final_state, FlowState::CLOSED);
    EXPECT_EQ(sink.size(), 1u);
    EXPECT_TRUE(sink.closed());
}

TEST(FlowReceiver, StopFlagInterrupts) {
    ScriptedInbound conn(TransportMode::DATAGRAM);
    std::atomic<bool> stop{true};
    ReceiverOptions o = fastOptions();
    o.stop = &stop;

    InMemorySink sink;
    FlowReceiver receiver(conn, sink, o);
    const FlowSummary s = receiver.run();

    EXPECT_TRUE(s.interrupted);
    EXPECT_TRUE(sink.closed());
    EXPECT_EQ(conn.polls(), 0u);
}

class FailingSink : public IEventSink {
public:
    void append(const EventRecord&) override {
        throw std::runtime_error("disk full");
    }
};

TEST(FlowReceiver, SinkFailurePropagatesAndReleasesConnection) {
    ScriptedInbound conn(TransportMode::DATAGRAM);
    conn.push(ArrivalKind::DATAGRAM, 10, datagram(0, 8, 1));

    FailingSink sink;
    FlowReceiver receiver(conn, sink, fastOptions());
    EXPECT_THROW(receiver.run(), std::runtime_error);
    EXPECT_TRUE(conn.closed());
    EXPECT_EQ(receiver.state(), FlowState::CLOSED);
}

}  // namespace test
}  // namespace flowbench
