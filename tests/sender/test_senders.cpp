#include <gtest/gtest.h>
#include "sender/datagram_sender.h"
#include "sender/stream_sender.h"
#include "clock/manual_clock.h"
#include "core/errors.h"
#include "transport/loopback_transport.h"
#include "wire/stream_reassembler.h"
#include "wire/wire_format.h"

#include <memory>
#include <vector>

namespace flowbench {
namespace test {

static Chunk makeChunk(uint64_t seq, size_t len) {
    Chunk c;
    c.seq = seq;
    c.bytes.assign(len, static_cast<uint8_t>(seq));
    return c;
}

class SenderTest : public ::testing::Test {
protected:
    void open(const LoopbackNetwork::Options& opts, TransportMode mode = TransportMode::DATAGRAM) {
        net_ = std::make_unique<LoopbackNetwork>(clock_, opts);
        ConnectParams p;
        p.host = "loopback";
        p.port = 1;
        p.mode = mode;
        conn_ = net_->connect(p);
        in_ = net_->accept(100);
    }

    ManualClock clock_{1000000};
    std::unique_ptr<LoopbackNetwork> net_;
    std::unique_ptr<IConnection> conn_;
    std::unique_ptr<IInboundConnection> in_;
};

TEST_F(SenderTest, FactorySelectsByMode) {
    open(LoopbackNetwork::Options());
    auto s = makeUnitSender(TransportMode::STREAM, *conn_, clock_, 1200);
    EXPECT_EQ(s->mode(), TransportMode::STREAM);
    EXPECT_EQ(s->policy(), PacingPolicy::BACKPRESSURE_AWARE);

    auto d = makeUnitSender(TransportMode::DATAGRAM, *conn_, clock_, 1200);
    EXPECT_EQ(d->mode(), TransportMode::DATAGRAM);
    EXPECT_EQ(d->policy(), PacingPolicy::UNBLOCKABLE);
}

TEST_F(SenderTest, DatagramCarriesSeqAndSendTime) {
    open(LoopbackNetwork::Options());
    DatagramSender sender(*conn_, clock_, 1200);

    const SendOutcome out = sender.emit(makeChunk(4, 1200), 999000);
    EXPECT_EQ(out.status, SendStatus::OK);
    EXPECT_EQ(out.actual_ns, 1000000u);
    EXPECT_EQ(out.wire_bytes, wire::kDatagramHeaderSize + 1200);

    Arrival a;
    ASSERT_EQ(in_->poll(10, a), ArrivalKind::DATAGRAM);
    wire::DatagramUnit unit;
    ASSERT_EQ(wire::decodeDatagram(a.data.data(), a.data.size(), unit), wire::ParseError::NONE);
    EXPECT_EQ(unit.seq, 4u);
    EXPECT_EQ(unit.send_ts_ns, out.actual_ns);
}

TEST_F(SenderTest, OversizedChunkIsConfigError) {
    LoopbackNetwork::Options opts;
    opts.max_datagram_size = 1232;
    open(opts);
    EXPECT_NO_THROW(DatagramSender(*conn_, clock_, 1200));
    EXPECT_THROW(DatagramSender(*conn_, clock_, 1201), ConfigError);
    EXPECT_THROW(makeUnitSender(TransportMode::DATAGRAM, *conn_, clock_, 1201), ConfigError);
}

TEST_F(SenderTest, RefusedDatagramsAreDroppedAndSequenceContinues) {
    LoopbackNetwork::Options opts;
    opts.datagram_queue_limit = 3;
    open(opts);
    DatagramSender sender(*conn_, clock_, 100);

    std::vector<SendStatus> statuses;
    for (uint64_t s = 0; s < 5; ++s)
        statuses.push_back(sender.emit(makeChunk(s, 100), 0).status);

    EXPECT_EQ(statuses[0], SendStatus::OK);
    EXPECT_EQ(statuses[2], SendStatus::OK);
    EXPECT_EQ(statuses[3], SendStatus::DROPPED);
    EXPECT_EQ(statuses[4], SendStatus::DROPPED);
    EXPECT_EQ(sender.dropped(), 2u);

    // Drain the queue; the next chunk goes out with its own sequence number.
    Arrival a;
    while (in_->poll(1, a) == ArrivalKind::DATAGRAM) {}
    EXPECT_EQ(sender.emit(makeChunk(5, 100), 0).status, SendStatus::OK);
    ASSERT_EQ(in_->poll(1, a), ArrivalKind::DATAGRAM);
    wire::DatagramUnit unit;
    ASSERT_EQ(wire::decodeDatagram(a.data.data(), a.data.size(), unit), wire::ParseError::NONE);
    EXPECT_EQ(unit.seq, 5u);
}

TEST_F(SenderTest, StreamFramesReassembleInOrder) {
    LoopbackNetwork::Options opts;
    opts.stream_segment_bytes = 7;
    open(opts, TransportMode::STREAM);
    StreamSender sender(*conn_, clock_);

    for (uint64_t s = 0; s < 4; ++s) {
        const SendOutcome out = sender.emit(makeChunk(s, 50), 0);
        EXPECT_EQ(out.status, SendStatus::OK);
        EXPECT_EQ(out.wire_bytes, wire::kStreamHeaderSize + 50);
    }
    sender.finish();

    wire::StreamReassembler r;
    std::vector<uint64_t> seqs;
    Arrival a;
    ArrivalKind k;
    while ((k = in_->poll(1, a)) == ArrivalKind::STREAM_DATA) {
        r.feed(a.data.data(), a.data.size(),
               [&](uint64_t seq, const uint8_t*, uint32_t len) {
                   EXPECT_EQ(len, 50u);
                   seqs.push_back(seq);
               },
               nullptr);
    }
    EXPECT_EQ(k, ArrivalKind::STREAM_FIN);
    EXPECT_EQ(seqs, std::vector<uint64_t>({0, 1, 2, 3}));
}

TEST_F(SenderTest, StreamActualTimeTrailsUnderBackpressure) {
    LoopbackNetwork::Options opts;
    opts.write_cost_ns = 5000000;   // 5 ms per write
    open(opts, TransportMode::STREAM);
    StreamSender sender(*conn_, clock_);

    const SendOutcome out = sender.emit(makeChunk(0, 10), clock_.nowNs());
    EXPECT_EQ(out.actual_ns, 1000000u + 5000000u);
}

TEST_F(SenderTest, StreamWriteFailurePropagates) {
    LoopbackNetwork::Options opts;
    opts.fail_stream_write_at = 2;
    open(opts, TransportMode::STREAM);
    StreamSender sender(*conn_, clock_);

    EXPECT_NO_THROW(sender.emit(makeChunk(0, 10), 0));
    EXPECT_NO_THROW(sender.emit(makeChunk(1, 10), 0));
    EXPECT_THROW(sender.emit(makeChunk(2, 10), 0), TransportError);
}

}  // namespace test
}  // namespace flowbench
