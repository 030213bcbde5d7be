#include "protocol.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "errors.h"

static std::string hex2(uint8_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(v);
    return ss.str();
}

static void write_u32(std::vector<uint8_t>& buf, size_t pos, uint32_t v) {
    buf[pos + 0] = static_cast<uint8_t>(v & 0xff);
    buf[pos + 1] = static_cast<uint8_t>((v >> 8) & 0xff);
    buf[pos + 2] = static_cast<uint8_t>((v >> 16) & 0xff);
    buf[pos + 3] = static_cast<uint8_t>((v >> 24) & 0xff);
}

static void write_u16(std::vector<uint8_t>& buf, size_t pos, uint16_t v) {
    buf[pos + 0] = static_cast<uint8_t>(v & 0xff);
    buf[pos + 1] = static_cast<uint8_t>(v >> 8);
}

// -----------------------------------------------------------------------
// Builders
// -----------------------------------------------------------------------

std::vector<CommandFrame> build_key_value_frames(uint8_t opcode, LayerCode layer,
                                                 const std::vector<uint32_t>& codes) {
    std::vector<CommandFrame> frames;

    uint32_t offset = 0;
    for (size_t first = 0; first < codes.size(); first += GK6X_KEYS_PER_FRAME) {
        size_t count = std::min<size_t>(GK6X_KEYS_PER_FRAME, codes.size() - first);

        std::vector<uint8_t> chunk(count * 4);
        for (size_t i = 0; i < count; ++i)
            write_u32(chunk, i * 4, codes[first + i]);

        frames.push_back(make_command(opcode, static_cast<uint8_t>(layer), offset,
                                      static_cast<uint8_t>(chunk.size()), chunk,
                                      OffsetMode::Small));
        offset += static_cast<uint32_t>(chunk.size());
    }
    return frames;
}

std::vector<uint8_t> build_static_lighting_buffer(const std::vector<uint32_t>& colors) {
    const size_t payload_size = colors.size() * 4;
    if (payload_size > 0xffff) {
        throw ArgumentError("static lighting payload of " + std::to_string(payload_size) +
                            " bytes does not fit the 16-bit size field");
    }

    std::vector<uint8_t> buf(GK6X_EFFECT_TABLE_SIZE + GK6X_LOCAL_HEADER_SIZE + payload_size, 0);

    // Slot 0: static effect, its data starts right after the table
    write_u32(buf, 0,  GK6X_EFFECT_TABLE_SIZE);
    write_u32(buf, 4,  1);
    write_u32(buf, 8,  0);
    write_u32(buf, 12, 0);

    for (int slot = 1; slot < GK6X_EFFECT_SLOTS; ++slot)
        for (int word = 0; word < 4; ++word)
            write_u32(buf, slot * GK6X_EFFECT_SLOT_SIZE + word * 4, GK6X_EFFECT_SLOT_UNUSED);

    write_u16(buf, GK6X_EFFECT_TABLE_SIZE,     GK6X_EFFECT_TYPE_STATIC);
    write_u16(buf, GK6X_EFFECT_TABLE_SIZE + 2, static_cast<uint16_t>(payload_size));

    size_t pos = GK6X_EFFECT_TABLE_SIZE + GK6X_LOCAL_HEADER_SIZE;
    for (uint32_t color : colors) {
        write_u32(buf, pos, color);
        pos += 4;
    }
    return buf;
}

std::vector<CommandFrame> build_chunked_frames(uint8_t opcode, LayerCode layer,
                                               const std::vector<uint8_t>& buffer) {
    std::vector<CommandFrame> frames;
    for (size_t offset = 0; offset < buffer.size(); offset += GK6X_PAYLOAD_SIZE) {
        size_t len = std::min<size_t>(GK6X_PAYLOAD_SIZE, buffer.size() - offset);
        frames.push_back(make_command(opcode, static_cast<uint8_t>(layer),
                                      static_cast<uint32_t>(offset),
                                      static_cast<uint8_t>(len),
                                      buffer.data() + offset, len,
                                      OffsetMode::Full));
    }
    return frames;
}

// -----------------------------------------------------------------------
// KeyboardCommands
// -----------------------------------------------------------------------

KeyboardCommands::KeyboardCommands(const KeyboardModel& model, HidChannel& channel,
                                   const Trace& trace)
    : _model(model), _transport(channel, trace), _trace(trace) {}

ReplyFrame KeyboardCommands::_request(const CommandFrame& frame, unsigned int timeout_ms) {
    ReplyFrame reply = _transport.send_and_receive(frame, timeout_ms);
    if (reply.cmd() != frame.cmd()) {
        throw ProtocolError("command " + hex2(frame.cmd()) + " (sub " + hex2(frame.subcmd()) +
                            ") answered with command " + hex2(reply.cmd()) +
                            ", result " + hex2(reply.result()),
                            frame.cmd(), reply);
    }
    return reply;
}

void KeyboardCommands::_send_all(const std::vector<CommandFrame>& frames,
                                 unsigned int timeout_ms) {
    for (size_t i = 0; i < frames.size(); ++i) {
        const CommandFrame& f = frames[i];
        _trace.debug("pkt " + std::to_string(i + 1) + "/" + std::to_string(frames.size()) +
                     " at offset " +
                     std::to_string(f.offset() | (static_cast<uint32_t>(f.offset_ext()) << 16)));
        _request(f, timeout_ms);
    }
}

void KeyboardCommands::reset_layer_data(LayerCode layer, LayerDataType type) {
    _trace.debug("reset layer " + std::to_string(static_cast<int>(layer)) +
                 " data type " + std::to_string(static_cast<int>(type)));
    _request(make_command(_model.opcodes.layer_reset_data_type, static_cast<uint8_t>(layer),
                          static_cast<uint32_t>(type)),
             GK6X_RESET_TIMEOUT_MS);
}

void KeyboardCommands::_set_key_values(uint8_t opcode, LayerCode layer,
                                       const std::vector<uint32_t>& codes) {
    if (codes.size() != _model.keys.size()) {
        throw ArgumentError("expected " + std::to_string(_model.keys.size()) +
                            " key values, got " + std::to_string(codes.size()));
    }
    _send_all(build_key_value_frames(opcode, layer, codes), GK6X_KEY_VALUES_TIMEOUT_MS);
}

void KeyboardCommands::set_key_values(LayerCode layer, const std::vector<uint32_t>& codes) {
    _set_key_values(_model.opcodes.layer_set_key_values, layer, codes);
}

void KeyboardCommands::set_fn_key_values(LayerCode layer, const std::vector<uint32_t>& codes) {
    _set_key_values(_model.opcodes.layer_fn_set_key_values, layer, codes);
}

void KeyboardCommands::set_static_lighting(LayerCode layer, const std::vector<uint32_t>& colors) {
    if (colors.size() != _model.led_count) {
        throw ArgumentError("expected " + std::to_string(_model.led_count) +
                            " LED colors, got " + std::to_string(colors.size()));
    }
    std::vector<uint8_t> buf = build_static_lighting_buffer(colors);
    _trace.debug("static lighting buffer: " + std::to_string(buf.size()) + " bytes");
    _send_all(build_chunked_frames(_model.opcodes.layer_set_light_values, layer, buf),
              GK6X_LIGHTING_TIMEOUT_MS);
}

ReplyFrame KeyboardCommands::query_info(uint8_t subcmd) {
    return _request(make_command(_model.opcodes.info, subcmd), GK6X_DEFAULT_TIMEOUT_MS);
}

void KeyboardCommands::set_active_layer(LayerCode layer) {
    _request(make_command(_model.opcodes.set_layer, static_cast<uint8_t>(layer)),
             GK6X_DEFAULT_TIMEOUT_MS);
}

void KeyboardCommands::ping() {
    _request(make_command(_model.opcodes.ping, 0x00), GK6X_DEFAULT_TIMEOUT_MS);
}

void KeyboardCommands::restart() {
    _transport.send(make_command(_model.opcodes.restart, 0x00));
}
