#pragma once

#include "core/event_types.h"
#include "io/csv_event_sink.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace flowbench {

/// One client flow. Filled from the command line by flowbench_client and
/// validated by FlowRunner before anything is opened on the network.
struct ClientConfig {
    std::string   host;
    uint16_t      port = 0;
    TransportMode mode = TransportMode::DATAGRAM;
    std::string   in_file;
    uint32_t      chunk_bytes = 1200;
    double        rate_mbps = 10.0;
    std::string   csv_send;              // empty = send_flow<id>.csv in the working directory
    std::string   bin_send;              // empty = no binary log
    std::string   cca;                   // congestion-control label
    uint32_t      max_datagram_size = 65535;
    uint32_t      connect_attempts = 5;
    uint32_t      retry_delay_ms = 500;
    uint32_t      connect_timeout_ms = 3000;
    double        duration_s = 0.0;      // 0 = until end of input
    uint64_t      max_chunks = 0;        // 0 = no limit
    uint32_t      flush_every = kDefaultFlushEvery;
    std::string   kafka_brokers;         // empty = no Kafka export
    std::string   kafka_topic = "flowbench.events";
};

/// The receiving server.
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t    port = 4433;
    std::string out_dir = "results/recv";
    uint32_t    flush_every = kDefaultFlushEvery;
    uint32_t    idle_timeout_ms = 5000;
    uint32_t    drain_linger_ms = 500;
    uint32_t    max_datagram_size = 65535;
    uint32_t    max_flows = 0;           // 0 = serve until shutdown
    size_t      max_kept_summaries = 1024;  // closed-flow summaries held in memory
    bool        binary_log = false;      // also write recv_flow<id>.fblog
    std::string cca;                     // label for flows whose client sent none
    std::string kafka_brokers;
    std::string kafka_topic = "flowbench.events";
};

}  // namespace flowbench
