#include "clock/system_clock.h"
#include "core/errors.h"
#include "runner/flow_runner.h"
#include "runner/shutdown.h"
#include "transport/socket_transport.h"
#include "util/log.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s --connect-to <host:port> --in-file <path> [options]\n"
        "  --connect-to <addr>       Server address, host:port or [v6]:port\n"
        "  --mode <m>                datagram|stream, dg|str (default: datagram)\n"
        "  --in-file <path>          Payload to send\n"
        "  --chunk-bytes <n>         Bytes per chunk (default: 1200)\n"
        "  --rate-mbps <x>           Target offered load in Mbps (default: 10.0)\n"
        "  --csv-send <path>         Send event CSV (default: send_flow<id>.csv)\n"
        "  --bin-send <path>         Also write an LZ4 binary event log\n"
        "  --cca <name>              Congestion-control label (e.g. cubic, bbr)\n"
        "  --max-datagram-size <n>   Local datagram size limit (default: 65535)\n"
        "  --connect-attempts <n>    Connect attempts before giving up (default: 5)\n"
        "  --retry-delay-ms <n>      Delay between connect attempts (default: 500)\n"
        "  --connect-timeout-ms <n>  Per-attempt connect timeout (default: 3000)\n"
        "  --duration-s <x>          Stop after this many seconds (default: input length)\n"
        "  --max-chunks <n>          Stop after this many chunks (default: no limit)\n"
        "  --flush-every <n>         CSV rows between flushes (default: 200)\n"
        "  --kafka-brokers <list>    Also publish events to Kafka\n"
        "  --kafka-topic <name>      Kafka topic (default: flowbench.events)\n"
        "  --log-level <l>           error|warn|info|debug (default: info)\n"
        "  --help                    Show this help\n",
        prog);
}

int main(int argc, char* argv[]) {
    flowbench::ClientConfig cfg;
    std::string connect_to;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "missing value for %s\n", arg);
                std::exit(flowbench::kExitConfig);
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "--connect-to") == 0)              connect_to = next();
        else if (std::strcmp(arg, "--mode") == 0) {
            const char* m = next();
            if (!flowbench::parseMode(m, cfg.mode)) {
                std::fprintf(stderr, "bad --mode: %s (expected datagram|stream)\n", m);
                return flowbench::kExitConfig;
            }
        }
        else if (std::strcmp(arg, "--in-file") == 0)            cfg.in_file = next();
        else if (std::strcmp(arg, "--chunk-bytes") == 0)        cfg.chunk_bytes = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--rate-mbps") == 0)          cfg.rate_mbps = std::strtod(next(), nullptr);
        else if (std::strcmp(arg, "--csv-send") == 0)           cfg.csv_send = next();
        else if (std::strcmp(arg, "--bin-send") == 0)           cfg.bin_send = next();
        else if (std::strcmp(arg, "--cca") == 0)                cfg.cca = next();
        else if (std::strcmp(arg, "--max-datagram-size") == 0)  cfg.max_datagram_size = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--connect-attempts") == 0)   cfg.connect_attempts = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--retry-delay-ms") == 0)     cfg.retry_delay_ms = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--connect-timeout-ms") == 0) cfg.connect_timeout_ms = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--duration-s") == 0)         cfg.duration_s = std::strtod(next(), nullptr);
        else if (std::strcmp(arg, "--max-chunks") == 0)         cfg.max_chunks = std::strtoull(next(), nullptr, 10);
        else if (std::strcmp(arg, "--flush-every") == 0)        cfg.flush_every = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--kafka-brokers") == 0)      cfg.kafka_brokers = next();
        else if (std::strcmp(arg, "--kafka-topic") == 0)        cfg.kafka_topic = next();
        else if (std::strcmp(arg, "--log-level") == 0) {
            const char* l = next();
            flowbench::LogLevel level;
            if (!flowbench::parseLogLevel(l, level)) {
                std::fprintf(stderr, "bad --log-level: %s\n", l);
                return flowbench::kExitConfig;
            }
            flowbench::setLogLevel(level);
        }
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg);
            printUsage(argv[0]);
            return flowbench::kExitConfig;
        }
    }

    if (connect_to.empty() || cfg.in_file.empty()) {
        printUsage(argv[0]);
        return flowbench::kExitConfig;
    }
    if (!flowbench::parseHostPort(connect_to, cfg.host, cfg.port)) {
        std::fprintf(stderr, "bad --connect-to: %s (expected host:port)\n", connect_to.c_str());
        return flowbench::kExitConfig;
    }

    flowbench::installShutdownHandler();

    flowbench::SystemClock clock;
    flowbench::SocketConnector connector;
    flowbench::FlowRunner runner(connector, clock);
    runner.setStopFlag(&flowbench::shutdownFlag());

    const flowbench::RunResult result = runner.run(cfg);

    std::printf("flow=%llu  mode=%s  stop=%s  sent=%llu  dropped=%llu  bytes=%llu  "
                "elapsed=%.3fs  max_lag=%.3fms  exit=%d\n",
                (unsigned long long)result.flow_id,
                flowbench::modeName(cfg.mode),
                flowbench::stopReasonName(result.stop_reason),
                (unsigned long long)result.chunks_sent,
                (unsigned long long)result.chunks_dropped,
                (unsigned long long)result.bytes_sent,
                result.elapsed_s,
                static_cast<double>(result.max_lag_ns) / 1e6,
                result.exit_code);
    return result.exit_code;
}
