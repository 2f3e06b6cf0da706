#include "core/errors.h"
#include "receiver/receiver_server.h"
#include "runner/shutdown.h"
#include "transport/handshake.h"
#include "transport/socket_transport.h"
#include "util/log.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "  --listen <addr>           host:port to listen on, TCP and UDP (default: 0.0.0.0:4433)\n"
        "  --out-dir <dir>           Directory for per-flow logs (default: results/recv)\n"
        "  --flush-every <n>         CSV rows between flushes (default: 200)\n"
        "  --idle-timeout-ms <n>     Drain a flow after this long without arrivals (default: 5000)\n"
        "  --drain-linger-ms <n>     Wait for late datagrams after stream end (default: 500)\n"
        "  --max-datagram-size <n>   Largest datagram accepted (default: 65535)\n"
        "  --max-flows <n>           Exit after serving this many flows (default: no limit)\n"
        "  --binary-log              Also write recv_flow<id>.fblog\n"
        "  --cca <name>              Label for flows whose client sent none\n"
        "  --kafka-brokers <list>    Also publish events to Kafka\n"
        "  --kafka-topic <name>      Kafka topic (default: flowbench.events)\n"
        "  --log-level <l>           error|warn|info|debug (default: info)\n"
        "  --help                    Show this help\n",
        prog);
}

int main(int argc, char* argv[]) {
    flowbench::ServerConfig cfg;
    std::string listen = "0.0.0.0:4433";

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "missing value for %s\n", arg);
                std::exit(flowbench::kExitConfig);
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "--listen") == 0)                  listen = next();
        else if (std::strcmp(arg, "--out-dir") == 0)            cfg.out_dir = next();
        else if (std::strcmp(arg, "--flush-every") == 0)        cfg.flush_every = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--idle-timeout-ms") == 0)    cfg.idle_timeout_ms = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--drain-linger-ms") == 0)    cfg.drain_linger_ms = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--max-datagram-size") == 0)  cfg.max_datagram_size = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--max-flows") == 0)          cfg.max_flows = static_cast<uint32_t>(std::strtoul(next(), nullptr, 10));
        else if (std::strcmp(arg, "--binary-log") == 0)         cfg.binary_log = true;
        else if (std::strcmp(arg, "--cca") == 0)                cfg.cca = next();
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

    if (!flowbench::parseHostPort(listen, cfg.host, cfg.port)) {
        std::fprintf(stderr, "bad --listen: %s (expected host:port)\n", listen.c_str());
        return flowbench::kExitConfig;
    }
    if (cfg.flush_every == 0 || cfg.idle_timeout_ms == 0) {
        std::fprintf(stderr, "--flush-every and --idle-timeout-ms must be >= 1\n");
        return flowbench::kExitConfig;
    }
    if (cfg.cca.size() > flowbench::kCcaLabelMax) {
        std::fprintf(stderr, "--cca label '%s' is longer than %zu bytes\n",
                     cfg.cca.c_str(), flowbench::kCcaLabelMax);
        return flowbench::kExitConfig;
    }

    flowbench::installShutdownHandler();

    try {
        flowbench::SocketListener::Options lo;
        lo.host = cfg.host;
        lo.port = cfg.port;
        lo.max_datagram_size = cfg.max_datagram_size;
        flowbench::SocketListener listener(lo);

        flowbench::ReceiverServer server(listener, cfg);
        server.setStopFlag(&flowbench::shutdownFlag());
        const int rc = server.run();
        listener.close();

        std::printf("flows=%llu  failed=%llu  exit=%d\n",
                    (unsigned long long)server.flowsAccepted(),
                    (unsigned long long)server.flowsFailed(), rc);
        return rc;
    } catch (const flowbench::ConfigError& e) {
        flowbench::logf(flowbench::LogLevel::ERROR, "%s", e.what());
        return flowbench::kExitConfig;
    } catch (const std::exception& e) {
        flowbench::logf(flowbench::LogLevel::ERROR, "%s", e.what());
        return flowbench::kExitTransport;
    }
}
