#include <gtest/gtest.h>
#include "io/multiplex_sink.h"
#include "io/in_memory_sink.h"
#include "core/records.h"

#include <stdexcept>

namespace flowbench {
namespace test {

class ThrowingSink : public IEventSink {
public:
    void append(const EventRecord&) override { throw std::runtime_error("append refused"); }
    void close() override { throw std::runtime_error("close refused"); }
};

TEST(MultiplexSink, EverySinkSeesEveryEventInOrder) {
    InMemorySink csv_like, binary_like;
    MultiplexSink mux;
    mux.addSink(&csv_like);
    mux.addSink(&binary_like);
    ASSERT_EQ(mux.sinkCount(), 2u);

    mux.append(makeSendRecord(4, 0, TransportMode::STREAM, 512, 100, 130, SendStatus::OK));
    mux.append(makeSendRecord(4, 1, TransportMode::STREAM, 512, 200, 260, SendStatus::OK));
    mux.append(makeSendRecord(4, 2, TransportMode::STREAM, 17, 300, 300, SendStatus::OK));

    for (const InMemorySink* s : {&csv_like, &binary_like}) {
        auto ev = s->events();
        ASSERT_EQ(ev.size(), 3u);
        EXPECT_EQ(ev[0].ts_ns, 130u);
        EXPECT_EQ(ev[1].seq, 1u);
        EXPECT_EQ(ev[2].bytes, 17u);
    }
}

TEST(MultiplexSink, NoSinksIsHarmless) {
    MultiplexSink mux;
    mux.append(makeRecvRecord(1, 0, TransportMode::DATAGRAM, 10, 5, 4));
    mux.flush();
    mux.close();
    EXPECT_EQ(mux.errorCount(), 0u);
}

TEST(MultiplexSink, FlushAndCloseReachEverySink) {
    InMemorySink a, b;
    MultiplexSink mux;
    mux.addSink(&a);
    mux.addSink(&b);

    mux.flush();
    mux.close();
    EXPECT_EQ(a.flushCount(), 1u);
    EXPECT_EQ(b.flushCount(), 1u);
    EXPECT_TRUE(a.closed());
    EXPECT_TRUE(b.closed());
}

TEST(MultiplexSink, FailingSinkIsCountedAndSkipped) {
    ThrowingSink bad;
    InMemorySink good;
    MultiplexSink mux;
    mux.addSink(&bad);
    mux.addSink(&good);

    mux.append(makeRecvRecord(2, 7, TransportMode::DATAGRAM, 64, 900, 850));
    mux.append(makeRecvRecord(2, 8, TransportMode::DATAGRAM, 64, 910, 860));
    mux.close();

    EXPECT_EQ(good.size(), 2u);
    EXPECT_TRUE(good.closed());
    EXPECT_EQ(mux.errorCount(), 3u);
}

}  // namespace test
}  // namespace flowbench
