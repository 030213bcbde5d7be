#include "packet.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "crc16.h"
#include "errors.h"

// -----------------------------------------------------------------------
// Little-endian helpers
// -----------------------------------------------------------------------

static void put_u16(Packet& p, int pos, uint16_t v) {
    p[pos]     = static_cast<uint8_t>(v & 0xff);
    p[pos + 1] = static_cast<uint8_t>(v >> 8);
}

static uint16_t get_u16(const Packet& p, int pos) {
    return static_cast<uint16_t>(p[pos] | (p[pos + 1] << 8));
}

static Payload payload_of(const Packet& p) {
    Payload d;
    std::copy(p.begin() + GK6X_HEADER_SIZE, p.end(), d.begin());
    return d;
}

uint16_t compute_checksum(const Packet& p) {
    Packet tmp = p;
    tmp[GK6X_CHECKSUM_POS]     = 0;
    tmp[GK6X_CHECKSUM_POS + 1] = 0;
    return crc16_gk6x(tmp.data(), tmp.size());
}

// -----------------------------------------------------------------------
// CommandFrame
// -----------------------------------------------------------------------

CommandFrame::CommandFrame(uint8_t cmd, uint8_t subcmd, uint16_t offset, uint8_t offset_ext,
                           uint8_t length, uint16_t checksum, const Payload& data)
    : _cmd(cmd), _subcmd(subcmd), _offset(offset), _offset_ext(offset_ext),
      _length(length), _checksum(checksum), _data(data) {}

CommandFrame CommandFrame::with_checksum() const {
    return CommandFrame(_cmd, _subcmd, _offset, _offset_ext, _length,
                        compute_checksum(encode(*this)), _data);
}

bool CommandFrame::checksum_ok() const {
    return _checksum == compute_checksum(encode(*this));
}

bool CommandFrame::operator==(const CommandFrame& o) const {
    return _cmd == o._cmd && _subcmd == o._subcmd && _offset == o._offset &&
           _offset_ext == o._offset_ext && _length == o._length &&
           _checksum == o._checksum && _data == o._data;
}

// -----------------------------------------------------------------------
// ReplyFrame
// -----------------------------------------------------------------------

ReplyFrame::ReplyFrame(uint8_t cmd, uint8_t subcmd, uint8_t result,
                       const std::array<uint8_t, 3>& reserved, uint16_t checksum,
                       const Payload& data)
    : _cmd(cmd), _subcmd(subcmd), _result(result), _reserved(reserved),
      _checksum(checksum), _data(data) {}

ReplyFrame ReplyFrame::with_checksum() const {
    return ReplyFrame(_cmd, _subcmd, _result, _reserved,
                      compute_checksum(encode(*this)), _data);
}

bool ReplyFrame::checksum_ok() const {
    return _checksum == compute_checksum(encode(*this));
}

bool ReplyFrame::operator==(const ReplyFrame& o) const {
    return _cmd == o._cmd && _subcmd == o._subcmd && _result == o._result &&
           _reserved == o._reserved && _checksum == o._checksum && _data == o._data;
}

// -----------------------------------------------------------------------
// Builders
// -----------------------------------------------------------------------

CommandFrame make_command(uint8_t cmd, uint8_t subcmd,
                          uint32_t offset, uint8_t length,
                          const uint8_t* payload, size_t len,
                          OffsetMode mode) {
    if (offset > GK6X_MAX_OFFSET) {
        std::ostringstream ss;
        ss << "offset 0x" << std::hex << std::setw(8) << std::setfill('0') << offset
           << " > 0x00ffffff";
        throw ArgumentError(ss.str());
    }
    if (mode == OffsetMode::Small && offset > 0xffff) {
        std::ostringstream ss;
        ss << "offset 0x" << std::hex << offset << " does not fit a small-offset frame";
        throw ArgumentError(ss.str());
    }
    if (len > static_cast<size_t>(GK6X_PAYLOAD_SIZE)) {
        throw ArgumentError("payload of " + std::to_string(len) +
                            " bytes exceeds the " + std::to_string(GK6X_PAYLOAD_SIZE) +
                            "-byte frame capacity");
    }

    Payload data = {};
    if (len > 0)
        std::copy(payload, payload + len, data.begin());

    const uint16_t lo = static_cast<uint16_t>(offset & 0xffff);
    CommandFrame f = (mode == OffsetMode::Small)
        ? CommandFrame(cmd, subcmd, lo, length, 0, 0, data)
        : CommandFrame(cmd, subcmd, lo, static_cast<uint8_t>(offset >> 16), length, 0, data);
    return f.with_checksum();
}

CommandFrame make_command(uint8_t cmd, uint8_t subcmd,
                          uint32_t offset, uint8_t length,
                          const std::vector<uint8_t>& payload,
                          OffsetMode mode) {
    return make_command(cmd, subcmd, offset, length, payload.data(), payload.size(), mode);
}

// -----------------------------------------------------------------------
// Codec
// -----------------------------------------------------------------------

Packet encode(const CommandFrame& f) {
    Packet p{};
    p[0] = f.cmd();
    p[1] = f.subcmd();
    put_u16(p, 2, f.offset());
    p[4] = f.offset_ext();
    p[5] = f.length();
    put_u16(p, GK6X_CHECKSUM_POS, f.checksum());
    std::copy(f.data().begin(), f.data().end(), p.begin() + GK6X_HEADER_SIZE);
    return p;
}

Packet encode(const ReplyFrame& f) {
    Packet p{};
    p[0] = f.cmd();
    p[1] = f.subcmd();
    p[2] = f.result();
    p[3] = f.reserved()[0];
    p[4] = f.reserved()[1];
    p[5] = f.reserved()[2];
    put_u16(p, GK6X_CHECKSUM_POS, f.checksum());
    std::copy(f.data().begin(), f.data().end(), p.begin() + GK6X_HEADER_SIZE);
    return p;
}

CommandFrame decode_command(const Packet& p) {
    return CommandFrame(p[0], p[1], get_u16(p, 2), p[4], p[5],
                        get_u16(p, GK6X_CHECKSUM_POS), payload_of(p));
}

ReplyFrame decode_reply(const Packet& p) {
    return ReplyFrame(p[0], p[1], p[2], {p[3], p[4], p[5]},
                      get_u16(p, GK6X_CHECKSUM_POS), payload_of(p));
}
