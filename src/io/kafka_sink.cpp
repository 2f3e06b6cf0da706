#ifdef FLOWBENCH_KAFKA_ENABLED

#include "io/kafka_sink.h"
#include "util/log.h"

#include <stdexcept>

namespace flowbench {

void KafkaSink::DeliveryReportCb::dr_cb(RdKafka::Message& message) {
    if (message.err())
        logf(LogLevel::WARN, "KafkaSink: delivery failed: %s", message.errstr().c_str());
}

KafkaSink::KafkaSink(const std::string& brokers,
                     const std::string& topic_name,
                     uint64_t flow_id)
    : key_(std::to_string(flow_id))
{
    std::string errstr;

    auto conf = std::unique_ptr<RdKafka::Conf>(
        RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));

    if (conf->set("bootstrap.servers", brokers, errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaSink: " + errstr);
    if (conf->set("enable.idempotence", "true", errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaSink: " + errstr);
    if (conf->set("linger.ms", "5", errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaSink: " + errstr);
    if (conf->set("compression.type", "lz4", errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaSink: " + errstr);
    if (conf->set("dr_cb", &dr_cb_, errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaSink: " + errstr);

    producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
    if (!producer_)
        throw std::runtime_error("KafkaSink: failed to create producer: " + errstr);

    auto tconf = std::unique_ptr<RdKafka::Conf>(
        RdKafka::Conf::create(RdKafka::Conf::CONF_TOPIC));

    topic_ = RdKafka::Topic::create(producer_.get(), topic_name, tconf.get(), errstr);
    if (!topic_)
        throw std::runtime_error("KafkaSink: failed to create topic: " + errstr);
}

KafkaSink::~KafkaSink() {
    close();
    delete topic_;
}

RdKafka::ErrorCode KafkaSink::produce(const EventRecord& rec) {
    return producer_->produce(
        topic_,
        RdKafka::Topic::PARTITION_UA,
        RdKafka::Producer::RK_MSG_COPY,
        const_cast<EventRecord*>(&rec), sizeof(rec),
        key_.data(), key_.size(),
        nullptr);
}

void KafkaSink::append(const EventRecord& rec) {
    RdKafka::ErrorCode err = produce(rec);

    if (err == RdKafka::ERR__QUEUE_FULL) {
        producer_->poll(100);
        err = produce(rec);
    }
    if (err != RdKafka::ERR_NO_ERROR)
        logf(LogLevel::WARN, "KafkaSink: produce failed for seq %llu: %s",
             static_cast<unsigned long long>(rec.seq), RdKafka::err2str(err).c_str());

    producer_->poll(0);
}

void KafkaSink::flush() {
    if (producer_ && producer_->flush(5000) != RdKafka::ERR_NO_ERROR)
        logf(LogLevel::WARN, "KafkaSink: flush timed out, %d messages queued",
             producer_->outq_len());
}

void KafkaSink::close() {
    if (!producer_)
        return;
    if (producer_->flush(10000) != RdKafka::ERR_NO_ERROR)
        logf(LogLevel::WARN, "KafkaSink: %d messages undelivered at close",
             producer_->outq_len());
}

}  // namespace flowbench

#endif  // FLOWBENCH_KAFKA_ENABLED
