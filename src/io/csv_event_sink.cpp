#include "io/csv_event_sink.h"
#include "util/log.h"

#include <cinttypes>
#include <stdexcept>

namespace flowbench {

namespace {

// Quotes a field holding a comma, quote or line break.
std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos)
        return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

}  // namespace

CsvEventSink::CsvEventSink(const std::string& path, const FlowMeta& meta, uint32_t flush_every)
    : path_(path), cca_(meta.cca), flush_every_(flush_every == 0 ? 1 : flush_every)
{
    file_ = std::fopen(path.c_str(), "w");
    if (!file_)
        throw std::runtime_error("CsvEventSink: cannot open " + path);
    if (std::fprintf(file_, "%s\n", headerRow(meta.role)) < 0) {
        std::fclose(file_);
        file_ = nullptr;
        throw std::runtime_error("CsvEventSink: cannot write header to " + path);
    }
}

CsvEventSink::~CsvEventSink() {
    if (!file_)
        return;
    try {
        close();
    } catch (const std::exception& e) {
        logf(LogLevel::ERROR, "CsvEventSink: %s", e.what());
    }
}

const char* CsvEventSink::headerRow(LogRole role) {
    return role == LogRole::SENDER
        ? "event,flow_id,seq,mode,bytes,scheduled_ns,actual_ns,lag_ns,status,cca"
        : "event,flow_id,seq,mode,bytes,recv_ns,send_ts_ns,cca";
}

std::string CsvEventSink::formatRow(const EventRecord& rec, const std::string& cca) {
    char buf[256];
    const auto kind = static_cast<EventKind>(rec.kind);
    const auto mode = static_cast<TransportMode>(rec.mode);

    if (kind == EventKind::SEND) {
        const int64_t lag = static_cast<int64_t>(rec.ts_ns - rec.scheduled_ns);
        std::snprintf(buf, sizeof(buf),
                      "send,%" PRIu64 ",%" PRIu64 ",%s,%u,%" PRIu64 ",%" PRIu64 ",%" PRId64 ",%s,",
                      rec.flow_id, rec.seq, modeName(mode), rec.bytes,
                      rec.scheduled_ns, rec.ts_ns, lag,
                      statusName(static_cast<SendStatus>(rec.status)));
    } else if (mode == TransportMode::DATAGRAM) {
        std::snprintf(buf, sizeof(buf),
                      "recv,%" PRIu64 ",%" PRIu64 ",%s,%u,%" PRIu64 ",%" PRIu64 ",",
                      rec.flow_id, rec.seq, modeName(mode), rec.bytes,
                      rec.ts_ns, rec.send_ts_ns);
    } else {
        std::snprintf(buf, sizeof(buf),
                      "recv,%" PRIu64 ",%" PRIu64 ",%s,%u,%" PRIu64 ",,",
                      rec.flow_id, rec.seq, modeName(mode), rec.bytes, rec.ts_ns);
    }
    return std::string(buf) + csvField(cca);
}

void CsvEventSink::append(const EventRecord& rec) {
    if (!file_)
        throw std::runtime_error("CsvEventSink: append after close on " + path_);

    const std::string row = formatRow(rec, cca_);
    if (std::fprintf(file_, "%s\n", row.c_str()) < 0)
        throw std::runtime_error("CsvEventSink: write failed on " + path_);
    ++rows_;

    if (++since_flush_ >= flush_every_)
        flush();
}

void CsvEventSink::flush() {
    if (!file_)
        return;
    since_flush_ = 0;
    if (std::fflush(file_) != 0)
        throw std::runtime_error("CsvEventSink: flush failed on " + path_);
}

void CsvEventSink::close() {
    if (!file_)
        return;
    std::FILE* f = file_;
    file_ = nullptr;
    if (std::fclose(f) != 0)
        throw std::runtime_error("CsvEventSink: close failed on " + path_);
}

}  // namespace flowbench
