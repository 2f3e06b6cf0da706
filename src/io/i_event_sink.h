#pragma once

#include "core/records.h"

namespace flowbench {

/// Abstract event output interface. A sink belongs to exactly one flow.
/// Implementations: CsvEventSink, BinaryFileSink, InMemorySink, KafkaSink,
/// MultiplexSink.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void append(const EventRecord&) = 0;
    virtual void flush() {}
    virtual void close() {}
};

}  // namespace flowbench
