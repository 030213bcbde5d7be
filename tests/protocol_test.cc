#include "protocol.h"
#include "errors.h"
#include "fake_channel.h"
#include <cstdint>
#include <vector>

#include <gtest/gtest.h>

namespace
{
constexpr uint8_t RESET_OPCODE      = 0x21;
constexpr uint8_t KEY_VALUES_OPCODE = 0x22;
constexpr uint8_t LIGHT_OPCODE      = 0x27;
constexpr uint8_t FN_KEY_VALUES_OPCODE = 0x31;

std::vector<uint8_t> le_bytes(const std::vector<uint32_t>& words)
{
  std::vector<uint8_t> out;
  for (uint32_t w : words)
    for (int i = 0; i < 4; ++i)
      out.push_back(static_cast<uint8_t>(w >> (8 * i)));
  return out;
}

uint32_t read_u32(const std::vector<uint8_t>& buf, size_t pos)
{
  return static_cast<uint32_t>(buf[pos]) | (static_cast<uint32_t>(buf[pos + 1]) << 8) |
         (static_cast<uint32_t>(buf[pos + 2]) << 16) | (static_cast<uint32_t>(buf[pos + 3]) << 24);
}

std::vector<uint32_t> numbered_codes(size_t count)
{
  std::vector<uint32_t> codes(count);
  for (size_t i = 0; i < count; ++i)
    codes[i] = 0x02000400u + static_cast<uint32_t>(i << 8);
  return codes;
}

class KeyboardCommandsTest : public ::testing::Test
{
protected:
  const KeyboardModel& model = find_model("dk61");
  FakeChannel channel;
  KeyboardCommands kb{model, channel};
};

} // namespace

TEST(KeyValueFramesTest, frame_count_follows_chunking_law)
{
  for (size_t count : {1u, 13u, 14u, 15u, 28u, 29u, 61u}) {
    auto frames = build_key_value_frames(KEY_VALUES_OPCODE, LayerCode::Layer1, numbered_codes(count));
    EXPECT_EQ(frames.size(), (4 * count + 55) / 56) << count << " codes";
  }
  EXPECT_TRUE(build_key_value_frames(KEY_VALUES_OPCODE, LayerCode::Layer1, {}).empty());
}

TEST_F(KeyboardCommandsTest, set_key_values_chunks_into_56_byte_frames)
{
  auto codes = numbered_codes(model.keys.size());
  ASSERT_EQ(codes.size(), 61u);

  kb.set_key_values(LayerCode::Layer1, codes);

  // 244 bytes → 4 full frames + 20 bytes
  ASSERT_EQ(channel.sent.size(), 5u);
  for (size_t i = 0; i < channel.sent.size(); ++i) {
    const CommandFrame& f = channel.sent[i];
    EXPECT_EQ(f.cmd(), KEY_VALUES_OPCODE);
    EXPECT_EQ(f.subcmd(), static_cast<uint8_t>(LayerCode::Layer1));
    EXPECT_EQ(static_cast<size_t>(f.offset()), i * 56);
    EXPECT_EQ(f.offset_ext(), i < 4 ? 56 : 20);
    EXPECT_EQ(f.length(), 0);
    EXPECT_TRUE(f.checksum_ok());
  }
  EXPECT_EQ(channel.payload_bytes(KEY_VALUES_OPCODE, OffsetMode::Small), le_bytes(codes));
  EXPECT_EQ(channel.read_timeouts, std::vector<unsigned int>(5, GK6X_KEY_VALUES_TIMEOUT_MS));
}

TEST_F(KeyboardCommandsTest, fn_key_values_use_fn_opcode)
{
  kb.set_fn_key_values(LayerCode::Layer2, numbered_codes(model.keys.size()));

  ASSERT_EQ(channel.sent.size(), 5u);
  for (const auto& f : channel.sent) {
    EXPECT_EQ(f.cmd(), FN_KEY_VALUES_OPCODE);
    EXPECT_EQ(f.subcmd(), static_cast<uint8_t>(LayerCode::Layer2));
  }
}

TEST_F(KeyboardCommandsTest, key_values_must_cover_every_key)
{
  EXPECT_THROW(kb.set_key_values(LayerCode::Layer1, numbered_codes(60)), ArgumentError);
  EXPECT_TRUE(channel.sent.empty());
}

TEST_F(KeyboardCommandsTest, desync_stops_key_value_upload)
{
  channel.answers[1] = FakeChannel::Answer::WrongCommand;

  try {
    kb.set_key_values(LayerCode::Layer3, numbered_codes(model.keys.size()));
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError& e) {
    EXPECT_EQ(e.request_cmd(), KEY_VALUES_OPCODE);
    EXPECT_EQ(e.reply().cmd(), 0x00);
  }
  EXPECT_EQ(channel.sent.size(), 2u);
}

TEST_F(KeyboardCommandsTest, timeout_stops_key_value_upload)
{
  channel.answers[2] = FakeChannel::Answer::Timeout;

  EXPECT_THROW(kb.set_key_values(LayerCode::Layer1, numbered_codes(model.keys.size())),
               TransportError);
  EXPECT_EQ(channel.sent.size(), 3u);
}

TEST_F(KeyboardCommandsTest, reset_layer_data_frame)
{
  kb.reset_layer_data(LayerCode::Layer2, LayerDataType::FnKeySet);

  ASSERT_EQ(channel.sent.size(), 1u);
  const CommandFrame& f = channel.sent[0];
  EXPECT_EQ(f.cmd(), RESET_OPCODE);
  EXPECT_EQ(f.subcmd(), static_cast<uint8_t>(LayerCode::Layer2));
  EXPECT_EQ(f.offset(), static_cast<uint16_t>(LayerDataType::FnKeySet));
  EXPECT_EQ(f.offset_ext(), 0);
  EXPECT_EQ(f.length(), 0);
  EXPECT_EQ(channel.read_timeouts, std::vector<unsigned int>{GK6X_RESET_TIMEOUT_MS});
}

TEST_F(KeyboardCommandsTest, reset_without_reply_is_a_transport_error)
{
  channel.answers[0] = FakeChannel::Answer::Timeout;

  EXPECT_THROW(kb.reset_layer_data(LayerCode::Layer1, LayerDataType::Lighting), TransportError);
}

TEST(StaticLightingBufferTest, layout)
{
  std::vector<uint32_t> colors(132, 0x000000);
  colors[0]   = 0xff0000;
  colors[131] = 0x0000ff;

  std::vector<uint8_t> buf = build_static_lighting_buffer(colors);

  ASSERT_EQ(buf.size(), 512u + 4u + 132u * 4u);

  // Slot 0 points at the local effect right after the table
  EXPECT_EQ(read_u32(buf, 0), 512u);
  EXPECT_EQ(read_u32(buf, 4), 1u);
  EXPECT_EQ(read_u32(buf, 8), 0u);
  EXPECT_EQ(read_u32(buf, 12), 0u);

  for (size_t i = 16; i < 512; ++i)
    ASSERT_EQ(buf[i], 0xff) << "byte " << i;

  // u16 type 0, u16 byte count 528 = 0x0210
  EXPECT_EQ(buf[512], 0x00);
  EXPECT_EQ(buf[513], 0x00);
  EXPECT_EQ(buf[514], 0x10);
  EXPECT_EQ(buf[515], 0x02);

  EXPECT_EQ(read_u32(buf, 516), 0x00ff0000u);
  EXPECT_EQ(read_u32(buf, 516 + 4), 0u);
  EXPECT_EQ(read_u32(buf, 516 + 131 * 4), 0x000000ffu);
}

TEST(StaticLightingBufferTest, rejects_payload_beyond_16_bit_size)
{
  EXPECT_NO_THROW(build_static_lighting_buffer(std::vector<uint32_t>(0x3fff)));
  EXPECT_THROW(build_static_lighting_buffer(std::vector<uint32_t>(0x4000)), ArgumentError);
}

TEST(ChunkedFramesTest, offsets_past_64k_use_extension_byte)
{
  std::vector<uint8_t> buffer(0x10040, 0x11);

  auto frames = build_chunked_frames(LIGHT_OPCODE, LayerCode::Layer1, buffer);

  ASSERT_EQ(frames.size(), (buffer.size() + 55) / 56);
  const CommandFrame& last = frames.back();
  uint32_t last_offset = static_cast<uint32_t>((frames.size() - 1) * 56);
  EXPECT_EQ(static_cast<uint32_t>(last.offset()), last_offset & 0xffff);
  EXPECT_EQ(last.offset_ext(), 0x01);
  EXPECT_EQ(static_cast<size_t>(last.length()), buffer.size() - last_offset);
}

TEST(ChunkedFramesTest, payloads_past_64k_reassemble)
{
  std::vector<uint8_t> buffer(0x10040);
  for (size_t i = 0; i < buffer.size(); ++i)
    buffer[i] = static_cast<uint8_t>(i * 7);

  FakeChannel channel;
  for (const auto& f : build_chunked_frames(LIGHT_OPCODE, LayerCode::Layer1, buffer)) {
    Packet p = encode(f);
    channel.write(p.data(), p.size());
  }

  EXPECT_EQ(channel.sent.back().offset_ext(), 0x01);
  EXPECT_EQ(channel.payload_bytes(LIGHT_OPCODE, OffsetMode::Full), buffer);
}

TEST_F(KeyboardCommandsTest, set_static_lighting_uploads_whole_buffer)
{
  std::vector<uint32_t> colors(model.led_count, 0x123456);

  kb.set_static_lighting(LayerCode::Base, colors);

  // 1044 bytes → 18 full frames + 36 bytes
  ASSERT_EQ(channel.sent.size(), 19u);
  for (size_t i = 0; i < channel.sent.size(); ++i) {
    const CommandFrame& f = channel.sent[i];
    EXPECT_EQ(f.cmd(), LIGHT_OPCODE);
    EXPECT_EQ(f.subcmd(), static_cast<uint8_t>(LayerCode::Base));
    EXPECT_EQ(static_cast<size_t>(f.offset()), i * 56);
    EXPECT_EQ(f.offset_ext(), 0);
    EXPECT_EQ(f.length(), i < 18 ? 56 : 36);
  }
  EXPECT_EQ(channel.payload_bytes(LIGHT_OPCODE, OffsetMode::Full), build_static_lighting_buffer(colors));
  EXPECT_EQ(channel.read_timeouts, std::vector<unsigned int>(19, GK6X_LIGHTING_TIMEOUT_MS));
}

TEST_F(KeyboardCommandsTest, static_lighting_needs_one_color_per_led)
{
  EXPECT_THROW(kb.set_static_lighting(LayerCode::Base, std::vector<uint32_t>(61)), ArgumentError);
  EXPECT_TRUE(channel.sent.empty());
}

TEST_F(KeyboardCommandsTest, desync_stops_lighting_upload)
{
  channel.answers[5] = FakeChannel::Answer::WrongCommand;

  EXPECT_THROW(kb.set_static_lighting(LayerCode::Layer1, std::vector<uint32_t>(model.led_count)),
               ProtocolError);
  EXPECT_EQ(channel.sent.size(), 6u);
}

TEST_F(KeyboardCommandsTest, info_layer_and_ping)
{
  ReplyFrame info = kb.query_info(GK6X_INFO_BUFFER_SIZE);
  kb.set_active_layer(LayerCode::Layer3);
  kb.ping();

  EXPECT_EQ(info.cmd(), 0x01);
  ASSERT_EQ(channel.sent.size(), 3u);
  EXPECT_EQ(channel.sent[0].cmd(), 0x01);
  EXPECT_EQ(channel.sent[0].subcmd(), GK6X_INFO_BUFFER_SIZE);
  EXPECT_EQ(channel.sent[1].cmd(), 0x0b);
  EXPECT_EQ(channel.sent[1].subcmd(), static_cast<uint8_t>(LayerCode::Layer3));
  EXPECT_EQ(channel.sent[2].cmd(), 0x0c);
}

TEST_F(KeyboardCommandsTest, restart_does_not_wait_for_reply)
{
  kb.restart();

  ASSERT_EQ(channel.sent.size(), 1u);
  EXPECT_EQ(channel.sent[0].cmd(), 0x03);
  EXPECT_TRUE(channel.read_timeouts.empty());
}
