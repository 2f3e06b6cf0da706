#include "transport/handshake.h"
#include "core/errors.h"
#include "wire/endian.h"

#include <cstring>
#include <string>

namespace flowbench {

using wire::load16be;
using wire::load32be;
using wire::load64be;
using wire::store16be;
using wire::store32be;
using wire::store64be;

static constexpr uint8_t kHelloMagic[4] = {'F', 'B', 'H', 'S'};
static constexpr uint8_t kAckMagic[4]   = {'F', 'B', 'H', 'A'};

void encodeHello(const ClientHello& hello, uint8_t* out) {
    if (hello.cca.size() > kCcaLabelMax)
        throw ConfigError("cca label '" + hello.cca + "' exceeds " +
                          std::to_string(kCcaLabelMax) + " bytes");
    std::memset(out, 0, kHelloSize);
    std::memcpy(out, kHelloMagic, 4);
    store16be(out + 4, kHandshakeVersion);
    out[6] = static_cast<uint8_t>(hello.mode);
    store32be(out + 8, hello.max_datagram_size);
    std::memcpy(out + 12, hello.cca.data(), hello.cca.size());
}

bool decodeHello(const uint8_t* in, ClientHello& out) {
    if (std::memcmp(in, kHelloMagic, 4) != 0)
        return false;
    if (load16be(in + 4) != kHandshakeVersion)
        return false;
    if (in[6] > static_cast<uint8_t>(TransportMode::DATAGRAM))
        return false;

    out.mode = static_cast<TransportMode>(in[6]);
    out.max_datagram_size = load32be(in + 8);

    const char* label = reinterpret_cast<const char*>(in + 12);
    size_t n = 0;
    while (n < kCcaLabelMax && label[n] != '\0')
        ++n;
    out.cca.assign(label, n);
    return true;
}

void encodeHelloAck(const HelloAck& ack, uint8_t* out) {
    std::memset(out, 0, kHelloAckSize);
    std::memcpy(out, kAckMagic, 4);
    store16be(out + 4, kHandshakeVersion);
    out[6] = ack.status;
    store64be(out + 8, ack.flow_id);
    store32be(out + 16, ack.max_datagram_size);
    store16be(out + 20, ack.udp_port);
}

bool decodeHelloAck(const uint8_t* in, HelloAck& out) {
    if (std::memcmp(in, kAckMagic, 4) != 0)
        return false;
    if (load16be(in + 4) != kHandshakeVersion)
        return false;

    out.status            = in[6];
    out.flow_id           = load64be(in + 8);
    out.max_datagram_size = load32be(in + 16);
    out.udp_port          = load16be(in + 20);
    return true;
}

}  // namespace flowbench
