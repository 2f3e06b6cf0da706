#pragma once

#ifdef FLOWBENCH_KAFKA_ENABLED

#include "io/i_event_sink.h"
#include "core/records.h"

#include <librdkafka/rdkafkacpp.h>

#include <memory>
#include <string>

namespace flowbench {

/// Kafka event sink: publishes each EventRecord as a 48-byte binary message
/// keyed by the decimal flow id, so one flow stays on one partition.
/// Delivery failures are logged but do not block the flow.
class KafkaSink : public IEventSink {
public:
    KafkaSink(const std::string& brokers,
              const std::string& topic,
              uint64_t flow_id);

    ~KafkaSink() override;

    KafkaSink(const KafkaSink&) = delete;
    KafkaSink& operator=(const KafkaSink&) = delete;

    void append(const EventRecord& rec) override;
    void flush() override;
    void close() override;

private:
    RdKafka::ErrorCode produce(const EventRecord& rec);

    std::string key_;
    std::unique_ptr<RdKafka::Producer> producer_;
    RdKafka::Topic* topic_ = nullptr;  // owned by producer_ lifetime

    class DeliveryReportCb : public RdKafka::DeliveryReportCb {
    public:
        void dr_cb(RdKafka::Message& message) override;
    };

    DeliveryReportCb dr_cb_;
};

}  // namespace flowbench

#endif  // FLOWBENCH_KAFKA_ENABLED
