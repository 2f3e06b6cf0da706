#include "io/event_log_reader.h"
#include "io/event_log_format.h"
#include "io/csv_event_sink.h"
#include "core/event_types.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace flowbench {

static void printHeader(const EventLogReader& reader) {
    const FileHeader& h = reader.header();
    const FlowMeta meta = reader.meta();
    std::printf("=== File Header ===\n");
    std::printf("  version:             %u.%u\n", h.version_major, h.version_minor);
    std::printf("  record_size:         %u bytes\n", h.record_size);
    std::printf("  flow_id:             %llu\n", (unsigned long long)meta.flow_id);
    std::printf("  role:                %s\n", meta.role == LogRole::SENDER ? "sender" : "receiver");
    std::printf("  mode:                %s\n", modeName(meta.mode));
    std::printf("  cca:                 %s\n", meta.cca.empty() ? "-" : meta.cca.c_str());
    if (meta.role == LogRole::SENDER) {
        std::printf("  target_bitrate:      %.3f Mbps\n",
                    static_cast<double>(meta.target_bitrate_bps) / 1e6);
        std::printf("  chunk_bytes:         %u\n", meta.chunk_bytes);
    }
    std::printf("  chunk_capacity:      %u\n", h.chunk_capacity);
    std::printf("  has_index:           %s%s\n",
                (h.header_flags & kHeaderFlagHasIndex) ? "yes" : "no",
                reader.recovered() ? " (recovered by scan)" : "");
}

static void printSummary(const EventLogReader& reader) {
    const auto& idx = reader.index();
    const uint64_t total = reader.totalRecords();
    const uint64_t first_ts = idx.empty() ? 0 : idx.front().span.first_ts_ns;
    const uint64_t last_ts = idx.empty() ? 0 : idx.back().span.last_ts_ns;
    const double duration_sec = last_ts > first_ts
        ? static_cast<double>(last_ts - first_ts) / 1e9 : 0.0;

    std::printf("\n=== Summary ===\n");
    std::printf("  chunks:              %u\n", reader.chunkCount());
    std::printf("  total_records:       %llu\n", (unsigned long long)total);
    std::printf("  time_range:          %llu - %llu ns\n",
                (unsigned long long)first_ts, (unsigned long long)last_ts);
    std::printf("  duration:            %.3f s\n", duration_sec);
    if (duration_sec > 0.0)
        std::printf("  events/sec:          %.1f\n", static_cast<double>(total) / duration_sec);
    if (reader.meta().role == LogRole::SENDER)
        std::printf("  dropped (index):     %llu\n", (unsigned long long)reader.totalDropped());

    std::printf("\n=== Chunks ===\n");
    for (size_t i = 0; i < idx.size(); ++i) {
        const ChunkSpan& sp = idx[i].span;
        std::printf("  [%zu] offset %llu: %u records, seq %llu-%llu, %u dropped\n", i,
                    (unsigned long long)idx[i].file_offset, sp.record_count,
                    (unsigned long long)sp.min_seq, (unsigned long long)sp.max_seq, sp.dropped);
    }
}

static void printDistribution(const EventLogReader& reader) {
    uint64_t sends = 0, recvs = 0, dropped = 0, bytes = 0;
    uint64_t max_lag = 0;
    int64_t highest = -1;

    for (uint32_t i = 0; i < reader.chunkCount(); ++i) {
        auto chunk = reader.readChunk(i);
        for (const auto& r : chunk) {
            if (r.kind == static_cast<uint8_t>(EventKind::SEND)) {
                ++sends;
                if (r.status == static_cast<uint8_t>(SendStatus::DROPPED))
                    ++dropped;
                if (r.ts_ns > r.scheduled_ns && r.ts_ns - r.scheduled_ns > max_lag)
                    max_lag = r.ts_ns - r.scheduled_ns;
            } else {
                ++recvs;
            }
            bytes += r.bytes;
            if (static_cast<int64_t>(r.seq) > highest)
                highest = static_cast<int64_t>(r.seq);
        }
    }

    std::printf("\n=== Events ===\n");
    std::printf("  send:                %llu\n", (unsigned long long)sends);
    std::printf("  send dropped:        %llu\n", (unsigned long long)dropped);
    std::printf("  recv:                %llu\n", (unsigned long long)recvs);
    std::printf("  payload_bytes:       %llu\n", (unsigned long long)bytes);
    std::printf("  highest_seq:         %lld\n", (long long)highest);
    if (sends > 0)
        std::printf("  max_send_lag:        %.3f ms\n", static_cast<double>(max_lag) / 1e6);
}

static void printFirstN(const EventLogReader& reader, int n) {
    std::printf("\n=== First %d Records ===\n", n);
    std::printf("  %-5s %-10s %-9s %-8s %-20s %-20s %-20s %-8s\n",
                "event", "seq", "mode", "bytes", "scheduled_ns", "ts_ns", "send_ts_ns", "status");

    int printed = 0;
    for (uint32_t c = 0; c < reader.chunkCount() && printed < n; ++c) {
        auto chunk = reader.readChunk(c);
        for (const auto& r : chunk) {
            if (printed >= n) break;
            std::printf("  %-5s %-10llu %-9s %-8u %-20llu %-20llu %-20llu %-8s\n",
                        kindName(static_cast<EventKind>(r.kind)),
                        (unsigned long long)r.seq,
                        modeName(static_cast<TransportMode>(r.mode)),
                        r.bytes,
                        (unsigned long long)r.scheduled_ns,
                        (unsigned long long)r.ts_ns,
                        (unsigned long long)r.send_ts_ns,
                        statusName(static_cast<SendStatus>(r.status)));
            printed++;
        }
    }
}

static void printSeqRange(const EventLogReader& reader, uint64_t lo, uint64_t hi) {
    auto records = reader.readSeqRange(lo, hi);
    std::printf("\n=== Seq %llu-%llu: %zu records ===\n",
                (unsigned long long)lo, (unsigned long long)hi, records.size());
    for (const auto& r : records)
        std::printf("  %s\n", CsvEventSink::formatRow(r, "").c_str());
}

// Rewrites the binary log in the CSV layout the live run would have produced.
static uint64_t exportCsv(const EventLogReader& reader, const std::string& out_path) {
    const FlowMeta meta = reader.meta();
    std::FILE* f = std::fopen(out_path.c_str(), "w");
    if (!f)
        throw std::runtime_error("cannot create " + out_path + ": " + std::strerror(errno));

    uint64_t rows = 0;
    bool ok = std::fprintf(f, "%s\n", CsvEventSink::headerRow(meta.role)) > 0;
    for (uint32_t c = 0; ok && c < reader.chunkCount(); ++c) {
        auto chunk = reader.readChunk(c);
        for (const auto& r : chunk) {
            const std::string row = CsvEventSink::formatRow(r, meta.cca);
            if (std::fprintf(f, "%s\n", row.c_str()) < 0) {
                ok = false;
                break;
            }
            ++rows;
        }
    }
    if (std::fclose(f) != 0)
        ok = false;
    if (!ok)
        throw std::runtime_error("write failed on " + out_path);
    return rows;
}

}  // namespace flowbench

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr,
                     "Usage: %s <file.fblog> [--events N] [--seq lo:hi] [--csv-out path]\n",
                     argv[0]);
        return 1;
    }

    const char* path = argv[1];
    int show_events = 10;
    std::string csv_out;
    bool seq_range = false;
    unsigned long long seq_lo = 0, seq_hi = 0;

    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--events" && i + 1 < argc) {
            show_events = std::atoi(argv[++i]);
        } else if (std::string(argv[i]) == "--csv-out" && i + 1 < argc) {
            csv_out = argv[++i];
        } else if (std::string(argv[i]) == "--seq" && i + 1 < argc) {
            if (std::sscanf(argv[++i], "%llu:%llu", &seq_lo, &seq_hi) != 2 || seq_lo > seq_hi) {
                std::fprintf(stderr, "Error: --seq expects lo:hi\n");
                return 1;
            }
            seq_range = true;
        }
    }

    try {
        flowbench::EventLogReader reader(path);

        flowbench::printHeader(reader);
        flowbench::printSummary(reader);
        flowbench::printDistribution(reader);
        flowbench::printFirstN(reader, show_events);
        if (seq_range)
            flowbench::printSeqRange(reader, seq_lo, seq_hi);

        if (!csv_out.empty()) {
            const uint64_t rows = flowbench::exportCsv(reader, csv_out);
            std::printf("\nwrote %llu rows to %s\n", (unsigned long long)rows, csv_out.c_str());
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
