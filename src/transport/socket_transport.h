#pragma once

#include "transport/i_transport.h"

#include <cstdint>
#include <memory>
#include <string>

namespace flowbench {

/// Splits "host:port" or "[v6addr]:port". Returns false on a missing or
/// out-of-range port.
bool parseHostPort(const std::string& s, std::string& host, uint16_t& port);

/// Client binding over POSIX sockets: one TCP connection per flow carries
/// the handshake and the ordered stream; datagrams travel over a connected
/// UDP socket, each prefixed with the flow id the server assigned.
class SocketConnector : public IConnector {
public:
    std::unique_ptr<IConnection> connect(const ConnectParams& params) override;
};

/// Server binding: a TCP listening socket plus one UDP socket shared by all
/// flows. A dispatch thread reads the UDP socket and routes each datagram
/// to its flow by the flow-id prefix; datagrams for unknown flows are
/// discarded.
class SocketListener : public IListener {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 4433;                 // 0 = ephemeral (tests)
        uint32_t max_datagram_size = 65535;   // server-side negotiation limit
        uint32_t handshake_timeout_ms = 2000;
        int      udp_rcvbuf_bytes = 8 * 1024 * 1024;
        size_t   flow_queue_limit = 65536;    // queued datagrams per flow
    };

    /// Binds both sockets. Throws ConfigError when the address cannot be
    /// resolved or bound.
    explicit SocketListener(const Options& opts);
    ~SocketListener() override;

    SocketListener(const SocketListener&) = delete;
    SocketListener& operator=(const SocketListener&) = delete;

    /// Returns nullptr on timeout and on a failed handshake (logged).
    std::unique_ptr<IInboundConnection> accept(uint32_t timeout_ms) override;
    void close() override;

    uint16_t tcpPort() const;
    uint16_t udpPort() const;

private:
    struct Impl;
    Impl* impl_;
};

}  // namespace flowbench
