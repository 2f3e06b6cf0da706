#include "runner/flow_runner.h"
#include "io/flow_sinks.h"
#include "pacing/rate_pacer.h"
#include "sender/i_unit_sender.h"
#include "source/chunk_source.h"
#include "transport/handshake.h"
#include "util/log.h"
#include "wire/wire_format.h"

#include <cmath>
#include <string>

namespace flowbench {

static constexpr uint64_t kProgressStepBytes = 1024 * 1024;

const char* stopReasonName(StopReason r) {
    switch (r) {
        case StopReason::NONE:           return "none";
        case StopReason::END_OF_INPUT:   return "end of input";
        case StopReason::CHUNK_LIMIT:    return "chunk limit";
        case StopReason::DURATION_LIMIT: return "duration limit";
        case StopReason::SHUTDOWN:       return "shutdown";
        case StopReason::FAILED:         return "failed";
    }
    return "unknown";
}

FlowRunner::FlowRunner(IConnector& connector, IClock& clock)
    : connector_(connector), clock_(clock) {}

bool FlowRunner::stopRequested() const {
    return stop_ && stop_->load(std::memory_order_relaxed);
}

void FlowRunner::validate(const ClientConfig& cfg) {
    if (cfg.host.empty() || cfg.port == 0)
        throw ConfigError("server address must be host:port");
    if (!std::isfinite(cfg.rate_mbps) || cfg.rate_mbps <= 0.0)
        throw ConfigError("--rate-mbps must be > 0");
    if (cfg.chunk_bytes == 0)
        throw ConfigError("--chunk-bytes must be > 0");
    if (cfg.mode == TransportMode::STREAM && cfg.chunk_bytes > wire::kMaxStreamFramePayload)
        throw ConfigError("--chunk-bytes exceeds the stream frame limit of " +
                          std::to_string(wire::kMaxStreamFramePayload));
    if (cfg.mode == TransportMode::DATAGRAM &&
        wire::kDatagramHeaderSize + cfg.chunk_bytes > cfg.max_datagram_size)
        throw ConfigError("--chunk-bytes " + std::to_string(cfg.chunk_bytes) +
                          " plus the " + std::to_string(wire::kDatagramHeaderSize) +
                          "-byte header exceeds --max-datagram-size " +
                          std::to_string(cfg.max_datagram_size));
    if (cfg.connect_attempts == 0)
        throw ConfigError("--connect-attempts must be >= 1");
    if (!std::isfinite(cfg.duration_s) || cfg.duration_s < 0.0)
        throw ConfigError("--duration-s must be >= 0");
    if (cfg.flush_every == 0)
        throw ConfigError("--flush-every must be >= 1");
    if (cfg.in_file.empty())
        throw ConfigError("--in-file is required");
    if (cfg.cca.size() > kCcaLabelMax)
        throw ConfigError("--cca label '" + cfg.cca + "' is longer than " +
                          std::to_string(kCcaLabelMax) + " bytes");
}

RunResult FlowRunner::run(const ClientConfig& cfg) {
    RunResult result;
    const uint64_t start_ns = clock_.nowNs();

    try {
        validate(cfg);
        ChunkSource source(cfg.in_file, cfg.chunk_bytes);
        RatePacer pacer(clock_, cfg.rate_mbps * 1e6);

        std::unique_ptr<IConnection> conn = connectWithRetry(cfg, result);
        if (!conn) {
            result.stop_reason = StopReason::SHUTDOWN;
        } else {
            result.flow_id = conn->id();
            std::unique_ptr<IUnitSender> sender =
                makeUnitSender(cfg.mode, *conn, clock_, cfg.chunk_bytes);

            FlowMeta meta;
            meta.flow_id = conn->id();
            meta.role = LogRole::SENDER;
            meta.mode = cfg.mode;
            meta.cca = cfg.cca;
            meta.target_bitrate_bps = static_cast<uint64_t>(std::llround(cfg.rate_mbps * 1e6));
            meta.chunk_bytes = cfg.chunk_bytes;

            FlowSinkOptions so;
            so.csv_path = cfg.csv_send.empty()
                ? "send_flow" + std::to_string(meta.flow_id) + ".csv" : cfg.csv_send;
            so.binary_path = cfg.bin_send;
            so.flush_every = cfg.flush_every;
            so.kafka_brokers = cfg.kafka_brokers;
            so.kafka_topic = cfg.kafka_topic;

            FlowSinks sinks(meta, so);
            for (auto* s : extra_sinks_)
                sinks.addSink(s);

            logf(LogLevel::INFO,
                 "FlowRunner: flow %llu to %s: %s, %llu bytes in %llu chunks of %u at %.3f Mbps "
                 "(%s pacing), log %s",
                 static_cast<unsigned long long>(meta.flow_id), conn->peer().c_str(),
                 modeName(cfg.mode),
                 static_cast<unsigned long long>(source.totalBytes()),
                 static_cast<unsigned long long>(source.expectedChunks()),
                 cfg.chunk_bytes, cfg.rate_mbps, policyName(sender->policy()),
                 so.csv_path.c_str());

            streamChunks(cfg, source, pacer, *sender, sinks.sink(), result);

            sender->finish();
            sinks.close();
            conn->close();
        }
    } catch (const ConfigError& e) {
        result.exit_code = kExitConfig;
        result.error = e.what();
    } catch (const ConnectError& e) {
        result.exit_code = kExitConnect;
        result.error = e.what();
    } catch (const TransportError& e) {
        result.exit_code = kExitTransport;
        result.error = e.what();
    } catch (const InputError& e) {
        result.exit_code = kExitInput;
        result.error = e.what();
    } catch (const std::exception& e) {
        // Remaining failures are event-log I/O.
        result.exit_code = kExitInput;
        result.error = e.what();
    }

    if (result.exit_code != kExitOk) {
        result.stop_reason = StopReason::FAILED;
        logf(LogLevel::ERROR, "FlowRunner: %s", result.error.c_str());
    } else if (result.stop_reason == StopReason::SHUTDOWN) {
        result.exit_code = kExitInterrupted;
    }

    result.elapsed_s = static_cast<double>(clock_.nowNs() - start_ns) / 1e9;
    const double mbps = result.elapsed_s > 0.0
        ? static_cast<double>(result.bytes_sent) * 8.0 / result.elapsed_s / 1e6 : 0.0;
    logf(LogLevel::INFO,
         "FlowRunner: flow %llu done (%s): %llu sent, %llu dropped, %llu bytes in %.3f s "
         "(%.3f Mbps), max lag %.3f ms",
         static_cast<unsigned long long>(result.flow_id), stopReasonName(result.stop_reason),
         static_cast<unsigned long long>(result.chunks_sent),
         static_cast<unsigned long long>(result.chunks_dropped),
         static_cast<unsigned long long>(result.bytes_sent),
         result.elapsed_s, mbps, static_cast<double>(result.max_lag_ns) / 1e6);
    return result;
}

std::unique_ptr<IConnection> FlowRunner::connectWithRetry(const ClientConfig& cfg,
                                                          RunResult& result) {
    ConnectParams params;
    params.host = cfg.host;
    params.port = cfg.port;
    params.mode = cfg.mode;
    params.cca = cfg.cca;
    params.max_datagram_size = cfg.max_datagram_size;
    params.connect_timeout_ms = cfg.connect_timeout_ms;

    for (uint32_t attempt = 1; attempt <= cfg.connect_attempts; ++attempt) {
        if (stopRequested())
            return nullptr;
        result.connect_attempts = attempt;
        try {
            return connector_.connect(params);
        } catch (const ConnectError& e) {
            if (attempt == cfg.connect_attempts)
                throw ConnectError("FlowRunner: giving up after " + std::to_string(attempt) +
                                   " connect attempts: " + e.what());
            logf(LogLevel::WARN, "FlowRunner: connect attempt %u/%u failed: %s; retrying in %u ms",
                 attempt, cfg.connect_attempts, e.what(), cfg.retry_delay_ms);
            clock_.sleepUntilNs(clock_.nowNs() +
                                static_cast<uint64_t>(cfg.retry_delay_ms) * 1000000ULL);
        }
    }
    return nullptr;
}

void FlowRunner::streamChunks(const ClientConfig& cfg, ChunkSource& source, RatePacer& pacer,
                              IUnitSender& sender, IEventSink& sink, RunResult& result) {
    const uint64_t t0 = clock_.nowNs();
    pacer.start(t0);
    const uint64_t end_ns = cfg.duration_s > 0.0
        ? t0 + static_cast<uint64_t>(std::llround(cfg.duration_s * 1e9)) : 0;

    uint64_t offered_bytes = 0;
    uint64_t next_progress = kProgressStepBytes;
    Chunk chunk;

    while (true) {
        if (stopRequested()) {
            result.stop_reason = StopReason::SHUTDOWN;
            break;
        }
        if (cfg.max_chunks > 0 && source.chunksProduced() >= cfg.max_chunks) {
            result.stop_reason = StopReason::CHUNK_LIMIT;
            break;
        }
        if (end_ns > 0 && clock_.nowNs() >= end_ns) {
            result.stop_reason = StopReason::DURATION_LIMIT;
            break;
        }
        if (!source.next(chunk)) {
            result.stop_reason = StopReason::END_OF_INPUT;
            break;
        }

        const uint32_t len = static_cast<uint32_t>(chunk.bytes.size());
        const PacedSlot slot = pacer.waitForSlot(len, stop_);
        if (slot.stopped) {
            result.stop_reason = StopReason::SHUTDOWN;
            break;
        }
        if (end_ns > 0 && slot.scheduled_ns >= end_ns) {
            result.stop_reason = StopReason::DURATION_LIMIT;
            break;
        }

        const SendOutcome out = sender.emit(chunk, slot.scheduled_ns);
        sink.append(makeSendRecord(result.flow_id, chunk.seq, sender.mode(), len,
                                   slot.scheduled_ns, out.actual_ns, out.status));

        if (out.status == SendStatus::OK) {
            ++result.chunks_sent;
            result.bytes_sent += len;
        } else {
            ++result.chunks_dropped;
        }
        if (out.actual_ns > slot.scheduled_ns && out.actual_ns - slot.scheduled_ns > result.max_lag_ns)
            result.max_lag_ns = out.actual_ns - slot.scheduled_ns;

        offered_bytes += len;
        if (offered_bytes >= next_progress) {
            logf(LogLevel::INFO, "FlowRunner: flow %llu progress %.1f MiB, %llu chunks, "
                 "%llu dropped, max lag %.3f ms",
                 static_cast<unsigned long long>(result.flow_id),
                 static_cast<double>(offered_bytes) / (1024.0 * 1024.0),
                 static_cast<unsigned long long>(source.chunksProduced()),
                 static_cast<unsigned long long>(result.chunks_dropped),
                 static_cast<double>(result.max_lag_ns) / 1e6);
            while (next_progress <= offered_bytes)
                next_progress += kProgressStepBytes;
        }
    }
}

}  // namespace flowbench
