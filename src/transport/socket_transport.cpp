#include "transport/socket_transport.h"
#include "clock/system_clock.h"
#include "core/errors.h"
#include "transport/handshake.h"
#include "util/log.h"
#include "wire/endian.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace flowbench {

namespace {

constexpr size_t kRecvBufferSize = 64 * 1024;

struct FdGuard {
    int fd;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    int release() { int f = fd; fd = -1; return f; }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

AddrInfoPtr resolve(const std::string& host, uint16_t port, int socktype, bool passive,
                    std::string& err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = socktype;
    if (passive)
        hints.ai_flags = AI_PASSIVE;

    addrinfo* result = nullptr;
    const std::string service = std::to_string(port);
    const int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(),
                               &hints, &result);
    if (rc != 0 || !result) {
        err = gai_strerror(rc);
        return AddrInfoPtr(nullptr, &freeaddrinfo);
    }
    return AddrInfoPtr(result, &freeaddrinfo);
}

std::string formatAddr(const sockaddr* sa) {
    char ip[INET6_ADDRSTRLEN] = {};
    if (sa->sa_family == AF_INET) {
        auto* in = reinterpret_cast<const sockaddr_in*>(sa);
        inet_ntop(AF_INET, &in->sin_addr, ip, sizeof(ip));
        return std::string(ip) + ":" + std::to_string(ntohs(in->sin_port));
    }
    if (sa->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
        inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip));
        return "[" + std::string(ip) + "]:" + std::to_string(ntohs(in6->sin6_port));
    }
    return "unknown";
}

void setPort(sockaddr_storage& ss, uint16_t port) {
    if (ss.ss_family == AF_INET)
        reinterpret_cast<sockaddr_in*>(&ss)->sin_port = htons(port);
    else if (ss.ss_family == AF_INET6)
        reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port = htons(port);
}

uint16_t boundPort(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0)
        return 0;
    if (ss.ss_family == AF_INET)
        return ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
    if (ss.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
    return 0;
}

bool setNonBlocking(int fd, bool on) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return false;
    const int next = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, next) == 0;
}

void sendAll(int fd, const uint8_t* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        const ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw TransportError(std::string("stream send failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
}

// Reads exactly len bytes within timeout_ms. On failure err says why.
bool recvExact(int fd, uint8_t* buf, size_t len, uint32_t timeout_ms, std::string& err) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t got = 0;
    while (got < len) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (left <= 0) {
            err = "timed out";
            return false;
        }
        pollfd p{fd, POLLIN, 0};
        const int rc = ::poll(&p, 1, static_cast<int>(left));
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            err = std::strerror(errno);
            return false;
        }
        if (rc == 0)
            continue;
        const ssize_t n = ::recv(fd, buf + got, len - got, 0);
        if (n == 0) {
            err = "peer closed during handshake";
            return false;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            err = std::strerror(errno);
            return false;
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

// Selects the kernel congestion-control algorithm by label. Labels the
// kernel does not know are still carried into the logs.
void applyCongestionControl(int fd, const std::string& cca) {
    if (cca.empty())
        return;
    std::string name = cca;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (setsockopt(fd, IPPROTO_TCP, TCP_CONGESTION, name.c_str(),
                   static_cast<socklen_t>(name.size())) != 0) {
        logf(LogLevel::WARN, "SocketConnector: congestion control '%s' not available (%s); "
             "label recorded only", cca.c_str(), std::strerror(errno));
    } else {
        logf(LogLevel::DEBUG, "SocketConnector: congestion control set to %s", name.c_str());
    }
}

// ---------------------------------------------------------------------------
// Client connection
// ---------------------------------------------------------------------------

class SocketConnection : public IConnection {
public:
    SocketConnection(int tcp_fd, int udp_fd, uint64_t id, std::string peer, size_t max_dg)
        : tcp_fd_(tcp_fd), udp_fd_(udp_fd), id_(id), peer_(std::move(peer)),
          max_datagram_(max_dg) {}

    ~SocketConnection() override { close(); }

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    uint64_t id() const override { return id_; }
    std::string peer() const override { return peer_; }
    size_t maxDatagramSize() const override { return max_datagram_; }

    void streamWrite(const uint8_t* data, size_t len) override {
        if (closed_ || finished_)
            throw TransportError("SocketConnection: stream write after finish");
        sendAll(tcp_fd_, data, len);
    }

    DatagramResult sendDatagram(const uint8_t* data, size_t len) override {
        if (closed_)
            return DatagramResult::FAILED;
        if (len > max_datagram_)
            return DatagramResult::TOO_LARGE;

        scratch_.resize(kFlowIdPrefixSize + len);
        wire::store64be(scratch_.data(), id_);
        std::memcpy(scratch_.data() + kFlowIdPrefixSize, data, len);

        const ssize_t n = ::send(udp_fd_, scratch_.data(), scratch_.size(),
                                 MSG_DONTWAIT | MSG_NOSIGNAL);
        if (n == static_cast<ssize_t>(scratch_.size()))
            return DatagramResult::SENT;
        if (n >= 0)
            return DatagramResult::FAILED;

        switch (errno) {
            case EAGAIN:
#if EWOULDBLOCK != EAGAIN
            case EWOULDBLOCK:
#endif
            case ENOBUFS:
                return DatagramResult::WOULD_BLOCK;
            case EMSGSIZE:
                return DatagramResult::TOO_LARGE;
            default:
                logf(LogLevel::DEBUG, "SocketConnection: datagram send failed: %s",
                     std::strerror(errno));
                return DatagramResult::FAILED;
        }
    }

    void finish() override {
        if (finished_ || closed_)
            return;
        finished_ = true;
        if (::shutdown(tcp_fd_, SHUT_WR) != 0 && errno != ENOTCONN)
            logf(LogLevel::WARN, "SocketConnection: shutdown failed: %s", std::strerror(errno));
    }

    void close() override {
        if (closed_)
            return;
        closed_ = true;
        if (tcp_fd_ >= 0)
            ::close(tcp_fd_);
        if (udp_fd_ >= 0)
            ::close(udp_fd_);
        tcp_fd_ = udp_fd_ = -1;
    }

private:
    int tcp_fd_;
    int udp_fd_;
    uint64_t id_;
    std::string peer_;
    size_t max_datagram_;
    bool finished_ = false;
    bool closed_ = false;
    std::vector<uint8_t> scratch_;
};

// ---------------------------------------------------------------------------
// Server side
// ---------------------------------------------------------------------------

// Datagrams routed to one flow by the dispatch thread. The pipe wakes the
// flow's poll() when a datagram is queued.
struct InboundQueue {
    std::mutex mu;
    std::deque<Arrival> datagrams;
    size_t limit;
    uint64_t overflow = 0;
    int wake_rd = -1;
    int wake_wr = -1;

    explicit InboundQueue(size_t lim) : limit(lim) {
        int fds[2];
        if (pipe(fds) != 0)
            throw TransportError(std::string("InboundQueue: pipe failed: ") + std::strerror(errno));
        wake_rd = fds[0];
        wake_wr = fds[1];
        setNonBlocking(wake_rd, true);
        setNonBlocking(wake_wr, true);
    }

    ~InboundQueue() {
        ::close(wake_rd);
        ::close(wake_wr);
    }

    InboundQueue(const InboundQueue&) = delete;
    InboundQueue& operator=(const InboundQueue&) = delete;

    void push(Arrival&& a) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (limit > 0 && datagrams.size() >= limit) {
                ++overflow;
                return;
            }
            datagrams.push_back(std::move(a));
        }
        const char c = 1;
        if (::write(wake_wr, &c, 1) < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
            logf(LogLevel::DEBUG, "InboundQueue: wake write failed: %s", std::strerror(errno));
    }

    void drainWake() {
        char buf[256];
        while (::read(wake_rd, buf, sizeof(buf)) > 0) {}
    }
};

class SocketInbound : public IInboundConnection {
public:
    SocketInbound(int tcp_fd, uint64_t id, std::string peer, ClientHello hello,
                  std::shared_ptr<InboundQueue> queue)
        : tcp_fd_(tcp_fd), id_(id), peer_(std::move(peer)), hello_(std::move(hello)),
          queue_(std::move(queue)), buf_(kRecvBufferSize) {}

    ~SocketInbound() override {
        close();
        if (queue_->overflow > 0)
            logf(LogLevel::WARN, "SocketInbound: flow %llu discarded %llu datagrams on a full queue",
                 static_cast<unsigned long long>(id_),
                 static_cast<unsigned long long>(queue_->overflow));
    }

    SocketInbound(const SocketInbound&) = delete;
    SocketInbound& operator=(const SocketInbound&) = delete;

    uint64_t id() const override { return id_; }
    std::string peer() const override { return peer_; }
    const ClientHello& hello() const override { return hello_; }

    ArrivalKind poll(uint32_t timeout_ms, Arrival& out) override {
        using Clock = std::chrono::steady_clock;
        const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

        while (true) {
            {
                std::lock_guard<std::mutex> lk(queue_->mu);
                if (!queue_->datagrams.empty()) {
                    out = std::move(queue_->datagrams.front());
                    queue_->datagrams.pop_front();
                    return out.kind;
                }
            }
            if (closed_)
                return finishAs(ArrivalKind::CLOSED, out);

            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();

            pollfd fds[2];
            fds[0] = pollfd{queue_->wake_rd, POLLIN, 0};
            fds[1] = pollfd{tcp_fd_, POLLIN, 0};
            const nfds_t nfds = fin_seen_ ? 1 : 2;

            const int rc = ::poll(fds, nfds, left > 0 ? static_cast<int>(left) : 0);
            if (rc < 0) {
                if (errno == EINTR)
                    continue;
                out.error = std::string("poll failed: ") + std::strerror(errno);
                return finishAs(ArrivalKind::ERROR, out, false);
            }
            if (rc == 0)
                return finishAs(ArrivalKind::TIMEOUT, out);

            if (fds[0].revents & POLLIN)
                queue_->drainWake();

            if (nfds == 2 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
                const ssize_t n = ::recv(tcp_fd_, buf_.data(), buf_.size(), 0);
                const uint64_t now = clock_.nowNs();
                if (n > 0) {
                    out.kind = ArrivalKind::STREAM_DATA;
                    out.recv_ns = now;
                    out.data.assign(buf_.begin(), buf_.begin() + n);
                    out.error.clear();
                    return out.kind;
                }
                if (n == 0) {
                    fin_seen_ = true;
                    out.recv_ns = now;
                    return finishAs(ArrivalKind::STREAM_FIN, out);
                }
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                    continue;
                out.error = std::string("stream receive failed: ") + std::strerror(errno);
                return finishAs(ArrivalKind::ERROR, out, false);
            }
        }
    }

    void close() override {
        if (closed_)
            return;
        closed_ = true;
        if (tcp_fd_ >= 0)
            ::close(tcp_fd_);
        tcp_fd_ = -1;
    }

private:
    ArrivalKind finishAs(ArrivalKind kind, Arrival& out, bool clear_error = true) {
        out.kind = kind;
        out.data.clear();
        if (clear_error)
            out.error.clear();
        return kind;
    }

    int tcp_fd_;
    uint64_t id_;
    std::string peer_;
    ClientHello hello_;
    std::shared_ptr<InboundQueue> queue_;
    std::vector<uint8_t> buf_;
    SystemClock clock_;
    bool fin_seen_ = false;
    bool closed_ = false;
};

}  // namespace

bool parseHostPort(const std::string& s, std::string& host, uint16_t& port) {
    std::string port_str;
    if (!s.empty() && s[0] == '[') {
        const size_t rb = s.find(']');
        if (rb == std::string::npos || rb + 1 >= s.size() || s[rb + 1] != ':')
            return false;
        host = s.substr(1, rb - 1);
        port_str = s.substr(rb + 2);
    } else {
        const size_t colon = s.rfind(':');
        if (colon == std::string::npos || colon == 0)
            return false;
        host = s.substr(0, colon);
        if (host.find(':') != std::string::npos)
            return false;
        port_str = s.substr(colon + 1);
    }

    if (host.empty() || port_str.empty() || port_str.size() > 5)
        return false;
    unsigned long value = 0;
    for (char c : port_str) {
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > 65535)
        return false;
    port = static_cast<uint16_t>(value);
    return true;
}

// ---------------------------------------------------------------------------
// SocketConnector
// ---------------------------------------------------------------------------

std::unique_ptr<IConnection> SocketConnector::connect(const ConnectParams& params) {
    const std::string target = params.host + ":" + std::to_string(params.port);
    if (params.port == 0)
        throw ConnectError("SocketConnector: no port in " + target);

    std::string err;
    AddrInfoPtr addrs = resolve(params.host, params.port, SOCK_STREAM, false, err);
    if (!addrs)
        throw ConnectError("SocketConnector: cannot resolve " + params.host + ": " + err);

    int fd = -1;
    sockaddr_storage peer_addr{};
    socklen_t peer_len = 0;
    std::string last_err = "no usable address";

    for (addrinfo* ai = addrs.get(); ai; ai = ai->ai_next) {
        FdGuard guard(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (guard.fd < 0) {
            last_err = std::strerror(errno);
            continue;
        }
        applyCongestionControl(guard.fd, params.cca);
        if (!setNonBlocking(guard.fd, true)) {
            last_err = std::strerror(errno);
            continue;
        }

        if (::connect(guard.fd, ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                last_err = std::strerror(errno);
                continue;
            }
            pollfd p{guard.fd, POLLOUT, 0};
            int rc;
            do {
                rc = ::poll(&p, 1, static_cast<int>(params.connect_timeout_ms));
            } while (rc < 0 && errno == EINTR);
            if (rc <= 0) {
                last_err = rc == 0 ? "timed out" : std::strerror(errno);
                continue;
            }
            int so_err = 0;
            socklen_t so_len = sizeof(so_err);
            if (getsockopt(guard.fd, SOL_SOCKET, SO_ERROR, &so_err, &so_len) != 0 || so_err != 0) {
                last_err = std::strerror(so_err != 0 ? so_err : errno);
                continue;
            }
        }

        if (!setNonBlocking(guard.fd, false)) {
            last_err = std::strerror(errno);
            continue;
        }
        std::memcpy(&peer_addr, ai->ai_addr, ai->ai_addrlen);
        peer_len = static_cast<socklen_t>(ai->ai_addrlen);
        fd = guard.release();
        break;
    }

    if (fd < 0)
        throw ConnectError("SocketConnector: connect to " + target + " failed: " + last_err);

    FdGuard tcp(fd);
    const int one = 1;
    if (setsockopt(tcp.fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0)
        logf(LogLevel::DEBUG, "SocketConnector: TCP_NODELAY failed: %s", std::strerror(errno));

    ClientHello hello;
    hello.mode = params.mode;
    hello.cca = params.cca;
    hello.max_datagram_size = params.max_datagram_size;

    uint8_t hello_buf[kHelloSize];
    encodeHello(hello, hello_buf);
    try {
        sendAll(tcp.fd, hello_buf, sizeof(hello_buf));
    } catch (const TransportError& e) {
        throw ConnectError("SocketConnector: handshake with " + target + " failed: " + e.what());
    }

    uint8_t ack_buf[kHelloAckSize];
    if (!recvExact(tcp.fd, ack_buf, sizeof(ack_buf), params.connect_timeout_ms, err))
        throw ConnectError("SocketConnector: handshake with " + target + " failed: " + err);

    HelloAck ack;
    if (!decodeHelloAck(ack_buf, ack))
        throw ConnectError("SocketConnector: " + target + " is not a flowbench server");
    if (ack.status != kHelloAccepted)
        throw ConnectError("SocketConnector: " + target + " rejected the flow");

    FdGuard udp(::socket(peer_addr.ss_family, SOCK_DGRAM, IPPROTO_UDP));
    if (udp.fd < 0)
        throw ConnectError(std::string("SocketConnector: udp socket failed: ") + std::strerror(errno));
    sockaddr_storage udp_addr = peer_addr;
    setPort(udp_addr, ack.udp_port);
    if (::connect(udp.fd, reinterpret_cast<sockaddr*>(&udp_addr), peer_len) != 0)
        throw ConnectError(std::string("SocketConnector: udp connect failed: ") + std::strerror(errno));

    const size_t max_dg = std::min(params.max_datagram_size, ack.max_datagram_size);
    const std::string peer = formatAddr(reinterpret_cast<sockaddr*>(&peer_addr));
    logf(LogLevel::INFO, "SocketConnector: connected to %s, flow %llu, %s, max datagram %zu",
         peer.c_str(), static_cast<unsigned long long>(ack.flow_id), modeName(params.mode),
         max_dg);

    const int tcp_fd = tcp.release();
    const int udp_fd = udp.release();
    return std::make_unique<SocketConnection>(tcp_fd, udp_fd, ack.flow_id, peer, max_dg);
}

// ---------------------------------------------------------------------------
// SocketListener
// ---------------------------------------------------------------------------

struct SocketListener::Impl {
    Options opts;
    int tcp_fd = -1;
    int udp_fd = -1;
    uint16_t tcp_port = 0;
    uint16_t udp_port = 0;
    uint64_t next_flow_id = 1;
    uint64_t runts = 0;

    std::atomic<bool> running{false};
    std::thread udp_thread;

    std::mutex reg_mu;
    std::unordered_map<uint64_t, std::weak_ptr<InboundQueue>> registry;

    SystemClock clock;

    explicit Impl(const Options& o) : opts(o) {}

    void udpLoop();
};

void SocketListener::Impl::udpLoop() {
    std::vector<uint8_t> buf(kRecvBufferSize);
    alignas(cmsghdr) char ctrl[CMSG_SPACE(sizeof(timespec))];

    while (running.load(std::memory_order_relaxed)) {
        pollfd p{udp_fd, POLLIN, 0};
        const int rc = ::poll(&p, 1, 100);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            logf(LogLevel::ERROR, "SocketListener: udp poll failed: %s", std::strerror(errno));
            break;
        }
        if (rc == 0)
            continue;

        while (true) {
            iovec iov{buf.data(), buf.size()};
            msghdr msg{};
            msg.msg_iov = &iov;
            msg.msg_iovlen = 1;
            msg.msg_control = ctrl;
            msg.msg_controllen = sizeof(ctrl);

            const ssize_t n = ::recvmsg(udp_fd, &msg, MSG_DONTWAIT);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK)
                    logf(LogLevel::WARN, "SocketListener: udp receive failed: %s",
                         std::strerror(errno));
                break;
            }

            // Kernel receive timestamp when available, else the time of the read.
            uint64_t recv_ns = clock.nowNs();
            for (cmsghdr* c = CMSG_FIRSTHDR(&msg); c; c = CMSG_NXTHDR(&msg, c)) {
                if (c->cmsg_level == SOL_SOCKET && c->cmsg_type == SCM_TIMESTAMPNS) {
                    timespec ts;
                    std::memcpy(&ts, CMSG_DATA(c), sizeof(ts));
                    recv_ns = static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL +
                              static_cast<uint64_t>(ts.tv_nsec);
                }
            }

            if (static_cast<size_t>(n) < kFlowIdPrefixSize) {
                ++runts;
                logf(LogLevel::DEBUG, "SocketListener: %zd-byte datagram without flow id", n);
                continue;
            }

            const uint64_t flow_id = wire::load64be(buf.data());
            std::shared_ptr<InboundQueue> queue;
            {
                std::lock_guard<std::mutex> lk(reg_mu);
                auto it = registry.find(flow_id);
                if (it != registry.end()) {
                    queue = it->second.lock();
                    if (!queue)
                        registry.erase(it);
                }
            }
            if (!queue) {
                logf(LogLevel::DEBUG, "SocketListener: datagram for unknown flow %llu",
                     static_cast<unsigned long long>(flow_id));
                continue;
            }

            Arrival a;
            a.kind = ArrivalKind::DATAGRAM;
            a.recv_ns = recv_ns;
            a.data.assign(buf.begin() + kFlowIdPrefixSize, buf.begin() + n);
            queue->push(std::move(a));
        }
    }
}

SocketListener::SocketListener(const Options& opts)
    : impl_(new Impl(opts))
{
    try {
        const std::string where = opts.host + ":" + std::to_string(opts.port);
        std::string err;
        AddrInfoPtr addrs = resolve(opts.host, opts.port, SOCK_STREAM, true, err);
        if (!addrs)
            throw ConfigError("SocketListener: cannot resolve " + opts.host + ": " + err);
        addrinfo* ai = addrs.get();

        FdGuard tcp(::socket(ai->ai_family, SOCK_STREAM, IPPROTO_TCP));
        if (tcp.fd < 0)
            throw ConfigError(std::string("SocketListener: socket failed: ") + std::strerror(errno));
        const int one = 1;
        if (setsockopt(tcp.fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0)
            logf(LogLevel::WARN, "SocketListener: SO_REUSEADDR failed: %s", std::strerror(errno));
        if (::bind(tcp.fd, ai->ai_addr, ai->ai_addrlen) != 0)
            throw ConfigError("SocketListener: cannot bind tcp " + where + ": " + std::strerror(errno));
        if (::listen(tcp.fd, 64) != 0)
            throw ConfigError("SocketListener: listen on " + where + " failed: " + std::strerror(errno));

        FdGuard udp(::socket(ai->ai_family, SOCK_DGRAM, IPPROTO_UDP));
        if (udp.fd < 0)
            throw ConfigError(std::string("SocketListener: udp socket failed: ") + std::strerror(errno));
        if (setsockopt(udp.fd, SOL_SOCKET, SO_RCVBUF, &opts.udp_rcvbuf_bytes,
                       sizeof(opts.udp_rcvbuf_bytes)) != 0)
            logf(LogLevel::WARN, "SocketListener: SO_RCVBUF failed: %s", std::strerror(errno));
        if (setsockopt(udp.fd, SOL_SOCKET, SO_TIMESTAMPNS, &one, sizeof(one)) != 0)
            logf(LogLevel::DEBUG, "SocketListener: no kernel receive timestamps: %s",
                 std::strerror(errno));
        if (::bind(udp.fd, ai->ai_addr, ai->ai_addrlen) != 0)
            throw ConfigError("SocketListener: cannot bind udp " + where + ": " + std::strerror(errno));

        impl_->tcp_fd = tcp.release();
        impl_->udp_fd = udp.release();
    } catch (...) {
        delete impl_;
        throw;
    }

    impl_->tcp_port = boundPort(impl_->tcp_fd);
    impl_->udp_port = boundPort(impl_->udp_fd);

    // Ids from consecutive server runs stay distinct within one output directory.
    impl_->next_flow_id = impl_->clock.nowNs() / 1000;

    impl_->running = true;
    impl_->udp_thread = std::thread([this] { impl_->udpLoop(); });

    logf(LogLevel::INFO, "SocketListener: listening on %s (tcp %u, udp %u)",
         opts.host.c_str(), impl_->tcp_port, impl_->udp_port);
}

SocketListener::~SocketListener() {
    close();
    delete impl_;
}

uint16_t SocketListener::tcpPort() const { return impl_->tcp_port; }
uint16_t SocketListener::udpPort() const { return impl_->udp_port; }

std::unique_ptr<IInboundConnection> SocketListener::accept(uint32_t timeout_ms) {
    if (!impl_->running.load())
        return nullptr;

    pollfd p{impl_->tcp_fd, POLLIN, 0};
    const int rc = ::poll(&p, 1, static_cast<int>(timeout_ms));
    if (rc < 0 && errno != EINTR)
        logf(LogLevel::WARN, "SocketListener: accept poll failed: %s", std::strerror(errno));
    if (rc <= 0)
        return nullptr;

    sockaddr_storage ss{};
    socklen_t ss_len = sizeof(ss);
    FdGuard conn(::accept(impl_->tcp_fd, reinterpret_cast<sockaddr*>(&ss), &ss_len));
    if (conn.fd < 0) {
        if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNABORTED)
            logf(LogLevel::WARN, "SocketListener: accept failed: %s", std::strerror(errno));
        return nullptr;
    }
    const std::string peer = formatAddr(reinterpret_cast<sockaddr*>(&ss));

    uint8_t hello_buf[kHelloSize];
    std::string err;
    if (!recvExact(conn.fd, hello_buf, sizeof(hello_buf), impl_->opts.handshake_timeout_ms, err)) {
        logf(LogLevel::WARN, "SocketListener: handshake from %s failed: %s", peer.c_str(), err.c_str());
        return nullptr;
    }
    ClientHello hello;
    if (!decodeHello(hello_buf, hello)) {
        logf(LogLevel::WARN, "SocketListener: %s sent a malformed hello", peer.c_str());
        return nullptr;
    }

    HelloAck ack;
    ack.flow_id = impl_->next_flow_id++;
    ack.max_datagram_size = std::min({hello.max_datagram_size, impl_->opts.max_datagram_size,
                                      kMaxSocketDatagram});
    ack.udp_port = impl_->udp_port;

    auto queue = std::make_shared<InboundQueue>(impl_->opts.flow_queue_limit);
    {
        std::lock_guard<std::mutex> lk(impl_->reg_mu);
        for (auto it = impl_->registry.begin(); it != impl_->registry.end();) {
            if (it->second.expired())
                it = impl_->registry.erase(it);
            else
                ++it;
        }
        impl_->registry[ack.flow_id] = queue;
    }

    uint8_t ack_buf[kHelloAckSize];
    encodeHelloAck(ack, ack_buf);
    try {
        sendAll(conn.fd, ack_buf, sizeof(ack_buf));
    } catch (const TransportError& e) {
        logf(LogLevel::WARN, "SocketListener: handshake reply to %s failed: %s", peer.c_str(), e.what());
        std::lock_guard<std::mutex> lk(impl_->reg_mu);
        impl_->registry.erase(ack.flow_id);
        return nullptr;
    }

    logf(LogLevel::INFO, "SocketListener: flow %llu from %s (%s, cca=%s, max datagram %u)",
         static_cast<unsigned long long>(ack.flow_id), peer.c_str(), modeName(hello.mode),
         hello.cca.empty() ? "-" : hello.cca.c_str(), ack.max_datagram_size);
    return std::make_unique<SocketInbound>(conn.release(), ack.flow_id, peer, hello, queue);
}

void SocketListener::close() {
    if (impl_->running.exchange(false) && impl_->udp_thread.joinable())
        impl_->udp_thread.join();
    if (impl_->tcp_fd >= 0) {
        ::close(impl_->tcp_fd);
        impl_->tcp_fd = -1;
    }
    if (impl_->udp_fd >= 0) {
        ::close(impl_->udp_fd);
        impl_->udp_fd = -1;
    }
    if (impl_->runts > 0)
        logf(LogLevel::DEBUG, "SocketListener: %llu datagrams too short for a flow id",
             static_cast<unsigned long long>(impl_->runts));
}

}  // namespace flowbench
