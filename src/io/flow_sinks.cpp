#include "io/flow_sinks.h"
#include "core/errors.h"
#include "io/binary_file_sink.h"
#include "io/csv_event_sink.h"
#include "util/log.h"

#ifdef FLOWBENCH_KAFKA_ENABLED
#include "io/kafka_sink.h"
#endif

#include <stdexcept>

namespace flowbench {

FlowSinks::FlowSinks(const FlowMeta& meta, const FlowSinkOptions& opts) {
    try {
        primary_ = std::make_unique<CsvEventSink>(opts.csv_path, meta, opts.flush_every);
        if (!opts.binary_path.empty())
            owned_.push_back(std::make_unique<BinaryFileSink>(opts.binary_path, meta));

        if (!opts.kafka_brokers.empty()) {
#ifdef FLOWBENCH_KAFKA_ENABLED
            owned_.push_back(std::make_unique<KafkaSink>(opts.kafka_brokers, opts.kafka_topic,
                                                         meta.flow_id));
#else
            logf(LogLevel::WARN, "FlowSinks: built without Kafka support, ignoring brokers %s",
                 opts.kafka_brokers.c_str());
#endif
        }
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }

    for (auto& s : owned_)
        mux_.addSink(s.get());
}

FlowSinks::~FlowSinks() {
    try {
        close();
    } catch (const std::exception& e) {
        logf(LogLevel::ERROR, "FlowSinks: %s", e.what());
    }
}

void FlowSinks::append(const EventRecord& rec) {
    primary_->append(rec);
    mux_.append(rec);
}

void FlowSinks::flush() {
    if (closed_)
        return;
    mux_.flush();
    primary_->flush();
}

void FlowSinks::close() {
    if (closed_)
        return;
    closed_ = true;
    mux_.flush();
    mux_.close();
    primary_->close();
}

}  // namespace flowbench
