#include "transport.h"

#include <iomanip>
#include <sstream>

#include "errors.h"

static std::string hex2(uint8_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(v);
    return ss.str();
}

void Transport::send(const CommandFrame& frame) {
    Packet p = encode(frame);
    _trace.dump("--> cmd " + hex2(frame.cmd()) + " sub " + hex2(frame.subcmd()),
                p.data(), p.size());
    _channel.write(p.data(), p.size());
}

ReplyFrame Transport::send_and_receive(const CommandFrame& frame, unsigned int timeout_ms) {
    send(frame);

    Packet p{};
    int got = _channel.read(p.data(), p.size(), timeout_ms);
    if (got == 0) {
        throw TransportError("no reply to command " + hex2(frame.cmd()) + " within " +
                             std::to_string(timeout_ms) + " ms");
    }
    if (got != GK6X_PACKET_SIZE) {
        throw TransportError("Incomplete receive: got " + std::to_string(got) +
                             " bytes, expected " + std::to_string(GK6X_PACKET_SIZE));
    }

    ReplyFrame reply = decode_reply(p);
    _trace.dump("<-- cmd " + hex2(reply.cmd()) + " result " + hex2(reply.result()),
                p.data(), p.size());
    if (!reply.checksum_ok())
        _trace.warn("reply to command " + hex2(frame.cmd()) + " has a bad checksum");
    return reply;
}
