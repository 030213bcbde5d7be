#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

// -----------------------------------------------------------------------
// GK6x 64-byte frame layout (Kemove DK61 and relatives)
//
//  Command (host → device)          Reply (device → host)
//  Byte  | Role                     Byte  | Role
//  ------|---------------------     ------|---------------------
//   0    | Command                   0    | Command (echo)
//   1    | Sub-command               1    | Sub-command (echo)
//   2-3  | Offset (LE)               2    | Result (0x01 = success)
//   4    | Offset bits 16-23, or     3-5  | Reserved
//        | argument byte (see below)
//   5    | Payload length (≤ 0x38)
//   6-7  | Checksum (LE)             6-7  | Checksum (LE)
//   8-63 | Payload, zero padded      8-63 | Payload, zero padded
//
// Checksum: CRC-16/CCITT-FALSE (poly 0x1021, IV 0xFFFF) over all 64
// bytes with bytes 6-7 set to zero.
// -----------------------------------------------------------------------

static constexpr int      GK6X_PACKET_SIZE  = 64;
static constexpr int      GK6X_HEADER_SIZE  = 8;
static constexpr int      GK6X_PAYLOAD_SIZE = GK6X_PACKET_SIZE - GK6X_HEADER_SIZE;  // 0x38
static constexpr uint32_t GK6X_MAX_OFFSET   = 0x00ffffff;

// Offset of the checksum field inside a frame
static constexpr int GK6X_CHECKSUM_POS = 6;

using Packet  = std::array<uint8_t, GK6X_PACKET_SIZE>;
using Payload = std::array<uint8_t, GK6X_PAYLOAD_SIZE>;

// How a command's offset is laid out in bytes 2-5.
//
//   Small: bytes 2-3 = 16-bit offset, byte 4 = length argument, byte 5 = 0.
//          Used by reset and key-value writes.
//   Full:  bytes 2-3 = offset & 0xffff, byte 4 = offset >> 16,
//          byte 5 = length. Used by lighting uploads whose logical
//          offset can pass 64 KiB.
enum class OffsetMode : uint8_t {
    Small,
    Full,
};

class CommandFrame {
public:
    CommandFrame() = default;
    CommandFrame(uint8_t cmd, uint8_t subcmd, uint16_t offset, uint8_t offset_ext,
                 uint8_t length, uint16_t checksum, const Payload& data);

    uint8_t        cmd()        const { return _cmd; }
    uint8_t        subcmd()     const { return _subcmd; }
    uint16_t       offset()     const { return _offset; }
    uint8_t        offset_ext() const { return _offset_ext; }
    uint8_t        length()     const { return _length; }
    uint16_t       checksum()   const { return _checksum; }
    const Payload& data()       const { return _data; }

    // Copy of this frame carrying the checksum recomputed over the frame
    // with its checksum field zeroed.
    CommandFrame with_checksum() const;

    bool checksum_ok() const;

    bool operator==(const CommandFrame& o) const;
    bool operator!=(const CommandFrame& o) const { return !(*this == o); }

private:
    uint8_t  _cmd        = 0;
    uint8_t  _subcmd     = 0;
    uint16_t _offset     = 0;
    uint8_t  _offset_ext = 0;
    uint8_t  _length     = 0;
    uint16_t _checksum   = 0;
    Payload  _data       = {};
};

class ReplyFrame {
public:
    ReplyFrame() = default;
    ReplyFrame(uint8_t cmd, uint8_t subcmd, uint8_t result,
               const std::array<uint8_t, 3>& reserved, uint16_t checksum,
               const Payload& data);

    uint8_t                       cmd()      const { return _cmd; }
    uint8_t                       subcmd()   const { return _subcmd; }
    uint8_t                       result()   const { return _result; }
    const std::array<uint8_t, 3>& reserved() const { return _reserved; }
    uint16_t                      checksum() const { return _checksum; }
    const Payload&                data()     const { return _data; }

    ReplyFrame with_checksum() const;
    bool checksum_ok() const;

    bool operator==(const ReplyFrame& o) const;
    bool operator!=(const ReplyFrame& o) const { return !(*this == o); }

private:
    uint8_t                _cmd      = 0;
    uint8_t                _subcmd   = 0;
    uint8_t                _result   = 0;
    std::array<uint8_t, 3> _reserved = {};
    uint16_t               _checksum = 0;
    Payload                _data     = {};
};

// -----------------------------------------------------------------------
// Builders / codec
// -----------------------------------------------------------------------

// Build a checksummed command frame.
// Throws ArgumentError if offset > 0x00ffffff (or > 0xffff in Small
// mode) or if len > 56. The payload is zero padded, never truncated.
CommandFrame make_command(uint8_t cmd, uint8_t subcmd,
                          uint32_t offset, uint8_t length,
                          const uint8_t* payload, size_t len,
                          OffsetMode mode);

CommandFrame make_command(uint8_t cmd, uint8_t subcmd,
                          uint32_t offset = 0, uint8_t length = 0,
                          const std::vector<uint8_t>& payload = {},
                          OffsetMode mode = OffsetMode::Small);

Packet encode(const CommandFrame& f);
Packet encode(const ReplyFrame& f);

CommandFrame decode_command(const Packet& p);
ReplyFrame   decode_reply(const Packet& p);

// CRC over the encoded packet with bytes 6-7 zeroed.
uint16_t compute_checksum(const Packet& p);
