#pragma once

#include <cstdint>
#include <vector>

#include "data.h"
#include "packet.h"
#include "trace.h"
#include "transport.h"

// -----------------------------------------------------------------------
// Timeouts (ms), per command class
// -----------------------------------------------------------------------
static constexpr unsigned int GK6X_KEY_VALUES_TIMEOUT_MS = 100;
static constexpr unsigned int GK6X_RESET_TIMEOUT_MS      = 1000;
static constexpr unsigned int GK6X_LIGHTING_TIMEOUT_MS   = 1000;
static constexpr unsigned int GK6X_DEFAULT_TIMEOUT_MS    = 100;

// Key values per frame: 14 x 4 bytes = one full payload
static constexpr int GK6X_KEYS_PER_FRAME = GK6X_PAYLOAD_SIZE / 4;

// -----------------------------------------------------------------------
// Static lighting buffer
//
//  Offset          | Content
//  ----------------|----------------------------------------------------
//  0 .. 511        | Effect table, 32 slots x 16 bytes (four u32 LE).
//                  |   slot 0     = [512, 1, 0, 0]  (static effect data
//                  |                starts right after the table)
//                  |   slot 1..31 = [ffffffff x 4]  (unused)
//  512 .. 515      | Local effect header: u16 type (0 = static),
//                  |   u16 payload byte count
//  516 ..          | One u32 LE 0x00RRGGBB per LED
// -----------------------------------------------------------------------
static constexpr int      GK6X_EFFECT_SLOTS        = 32;
static constexpr int      GK6X_EFFECT_SLOT_SIZE    = 16;
static constexpr int      GK6X_EFFECT_TABLE_SIZE   = GK6X_EFFECT_SLOTS * GK6X_EFFECT_SLOT_SIZE;
static constexpr int      GK6X_LOCAL_HEADER_SIZE   = 4;
static constexpr uint16_t GK6X_EFFECT_TYPE_STATIC  = 0x0000;
static constexpr uint32_t GK6X_EFFECT_SLOT_UNUSED  = 0xffffffff;

// Info sub-commands
static constexpr uint8_t GK6X_INFO_FIRMWARE    = 0x01;
static constexpr uint8_t GK6X_INFO_BUFFER_SIZE = 0x09;

// -----------------------------------------------------------------------
// Frame sequence builders
//
// Each builder returns every frame that has to go out (reply read after
// each) to apply the setting. They do no I/O.
// -----------------------------------------------------------------------

// Split `codes` into frames of 14 driver values each. Small-offset mode,
// offset = running byte offset, length = bytes in the frame.
std::vector<CommandFrame> build_key_value_frames(uint8_t opcode, LayerCode layer,
                                                 const std::vector<uint32_t>& codes);

// Assemble the logical static-lighting buffer (see layout above).
// Throws ArgumentError if the color payload does not fit the 16-bit
// byte count.
std::vector<uint8_t> build_static_lighting_buffer(const std::vector<uint32_t>& colors);

// Split `buffer` into 56-byte full-offset frames.
std::vector<CommandFrame> build_chunked_frames(uint8_t opcode, LayerCode layer,
                                               const std::vector<uint8_t>& buffer);

// -----------------------------------------------------------------------
// Command layer
//
// One method per device capability. Every reply's command byte is
// compared against the request's; a mismatch throws ProtocolError and
// nothing further is sent for that operation.
// -----------------------------------------------------------------------
class KeyboardCommands {
public:
    KeyboardCommands(const KeyboardModel& model, HidChannel& channel,
                     const Trace& trace = Trace());

    const KeyboardModel& model() const { return _model; }
    const Trace&         trace() const { return _trace; }

    // Wipe one data type of a layer before rewriting it.
    // The device does not always answer this one; callers that can live
    // with that catch TransportError themselves.
    void reset_layer_data(LayerCode layer, LayerDataType type);

    // Write one driver value per physical key.
    // Throws ArgumentError unless codes.size() == model().keys.size().
    void set_key_values(LayerCode layer, const std::vector<uint32_t>& codes);
    void set_fn_key_values(LayerCode layer, const std::vector<uint32_t>& codes);

    // Upload a static per-LED color table (0xRRGGBB per LED index).
    // Throws ArgumentError unless colors.size() == model().led_count.
    void set_static_lighting(LayerCode layer, const std::vector<uint32_t>& colors);

    ReplyFrame query_info(uint8_t subcmd);
    void       set_active_layer(LayerCode layer);
    void       ping();

    // The keyboard reboots instead of answering.
    void restart();

private:
    const KeyboardModel& _model;
    Transport            _transport;
    Trace                _trace;

    ReplyFrame _request(const CommandFrame& frame, unsigned int timeout_ms);
    void _send_all(const std::vector<CommandFrame>& frames, unsigned int timeout_ms);
    void _set_key_values(uint8_t opcode, LayerCode layer, const std::vector<uint32_t>& codes);
};
