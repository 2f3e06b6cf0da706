#pragma once

#include "io/i_event_sink.h"
#include "core/records.h"

#include <cstdint>
#include <cstdio>
#include <string>

namespace flowbench {

constexpr uint32_t kDefaultFlushEvery = 200;

/// Event log as comma-separated text, one row per event, header row first.
///
///   sender:   event,flow_id,seq,mode,bytes,scheduled_ns,actual_ns,lag_ns,status,cca
///   receiver: event,flow_id,seq,mode,bytes,recv_ns,send_ts_ns,cca
///
/// The role (and so the column set) is fixed by the FlowMeta given at
/// open. send_ts_ns is empty for stream units. The file is flushed every
/// flush_every rows and at close.
class CsvEventSink : public IEventSink {
public:
    /// Creates (truncates) the file and writes the header row.
    /// Throws std::runtime_error when the file cannot be created.
    CsvEventSink(const std::string& path, const FlowMeta& meta,
                 uint32_t flush_every = kDefaultFlushEvery);
    ~CsvEventSink() override;

    CsvEventSink(const CsvEventSink&) = delete;
    CsvEventSink& operator=(const CsvEventSink&) = delete;

    void append(const EventRecord& rec) override;
    void flush() override;
    void close() override;

    static const char* headerRow(LogRole role);
    /// One data row without the trailing newline.
    static std::string formatRow(const EventRecord& rec, const std::string& cca);

    uint64_t rowsWritten() const { return rows_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::string cca_;
    std::FILE*  file_ = nullptr;
    uint32_t    flush_every_;
    uint32_t    since_flush_ = 0;
    uint64_t    rows_ = 0;
};

}  // namespace flowbench
