#include <gtest/gtest.h>
#include "core/event_types.h"
#include "core/records.h"

namespace flowbench {
namespace test {

TEST(EventTypes, ParseModeAcceptsLongAndShortNames) {
    TransportMode m = TransportMode::DATAGRAM;
    ASSERT_TRUE(parseMode("stream", m));
    EXPECT_EQ(m, TransportMode::STREAM);
    ASSERT_TRUE(parseMode("dg", m));
    EXPECT_EQ(m, TransportMode::DATAGRAM);
    ASSERT_TRUE(parseMode("STR", m));
    EXPECT_EQ(m, TransportMode::STREAM);
    ASSERT_TRUE(parseMode("Datagram", m));
    EXPECT_EQ(m, TransportMode::DATAGRAM);
}

TEST(EventTypes, ParseModeRejectsUnknown) {
    TransportMode m = TransportMode::STREAM;
    EXPECT_FALSE(parseMode("udp", m));
    EXPECT_FALSE(parseMode("", m));
    EXPECT_EQ(m, TransportMode::STREAM);
}

TEST(EventTypes, Names) {
    EXPECT_STREQ(modeName(TransportMode::STREAM), "stream");
    EXPECT_STREQ(modeName(TransportMode::DATAGRAM), "datagram");
    EXPECT_STREQ(kindName(EventKind::SEND), "send");
    EXPECT_STREQ(kindName(EventKind::RECV), "recv");
    EXPECT_STREQ(statusName(SendStatus::OK), "ok");
    EXPECT_STREQ(statusName(SendStatus::DROPPED), "dropped");
}

TEST(Records, EventRecordIsFixedWidth) {
    EXPECT_EQ(sizeof(EventRecord), 48u);
}

TEST(Records, SendRecordCarriesScheduleAndStatus) {
    auto r = makeSendRecord(7, 3, TransportMode::DATAGRAM, 1200, 1000, 1500, SendStatus::DROPPED);
    EXPECT_EQ(r.flow_id, 7u);
    EXPECT_EQ(r.seq, 3u);
    EXPECT_EQ(r.bytes, 1200u);
    EXPECT_EQ(r.scheduled_ns, 1000u);
    EXPECT_EQ(r.ts_ns, 1500u);
    EXPECT_EQ(r.send_ts_ns, 0u);
    EXPECT_EQ(r.kind, static_cast<uint8_t>(EventKind::SEND));
    EXPECT_EQ(r.mode, static_cast<uint8_t>(TransportMode::DATAGRAM));
    EXPECT_EQ(r.status, static_cast<uint8_t>(SendStatus::DROPPED));
}

TEST(Records, RecvRecordCarriesEmbeddedSendTime) {
    auto r = makeRecvRecord(2, 9, TransportMode::DATAGRAM, 64, 5000, 4000);
    EXPECT_EQ(r.kind, static_cast<uint8_t>(EventKind::RECV));
    EXPECT_EQ(r.ts_ns, 5000u);
    EXPECT_EQ(r.send_ts_ns, 4000u);
    EXPECT_EQ(r.scheduled_ns, 0u);
    EXPECT_EQ(r.status, static_cast<uint8_t>(SendStatus::OK));
}

}  // namespace test
}  // namespace flowbench
