#include "crc16.h"
#include <cstdint>
#include <cstring>
#include <array>

#include <gtest/gtest.h>

namespace
{
constexpr char CHECK_INPUT[] = "123456789";
constexpr size_t CHECK_INPUT_LEN = 9;

const uint8_t* check_bytes()
{
  return reinterpret_cast<const uint8_t*>(CHECK_INPUT);
}

} // namespace

TEST(Crc16Test, gk6x_variant_matches_ccitt_false_check_value)
{
  EXPECT_EQ(crc16_gk6x(check_bytes(), CHECK_INPUT_LEN), 0x29b1);
  EXPECT_EQ(crc16(check_bytes(), CHECK_INPUT_LEN, 0x1021, 0xffff, 0x0000), 0x29b1);
}

TEST(Crc16Test, empty_input_returns_initial_value_xor_out)
{
  EXPECT_EQ(crc16_gk6x(nullptr, 0), 0xffff);
  EXPECT_EQ(crc16(nullptr, 0, 0x1021, 0x1234, 0x0000), 0x1234);
  EXPECT_EQ(crc16(nullptr, 0, 0x1021, 0xffff, 0xffff), 0x0000);
}

TEST(Crc16Test, xor_out_is_applied_last)
{
  uint16_t plain = crc16(check_bytes(), CHECK_INPUT_LEN, 0x1021, 0xffff, 0x0000);
  EXPECT_EQ(crc16(check_bytes(), CHECK_INPUT_LEN, 0x1021, 0xffff, 0xffff),
            static_cast<uint16_t>(plain ^ 0xffff));
}

TEST(Crc16Test, usb_variant_uses_poly_8005)
{
  EXPECT_EQ(crc16_usb(check_bytes(), CHECK_INPUT_LEN), 0x5118);
  EXPECT_EQ(crc16_usb(check_bytes(), CHECK_INPUT_LEN),
            crc16(check_bytes(), CHECK_INPUT_LEN, 0x8005, 0xffff, 0xffff));
}

TEST(Crc16Test, captured_frames_checksum)
{
  // Checksums observed on the wire, computed with bytes 6-7 zeroed
  std::array<uint8_t, 64> command{};
  command[0] = 0x01;
  command[1] = 0x01;
  EXPECT_EQ(crc16_gk6x(command.data(), command.size()), 0x1b74);

  std::array<uint8_t, 64> reply{};
  const uint8_t head[] = {0x01, 0x01, 0x01};
  const uint8_t body[] = {0x01, 0x39, 0x10, 0x02, 0x09, 0x01};
  std::memcpy(reply.data(), head, sizeof(head));
  std::memcpy(reply.data() + 8, body, sizeof(body));
  EXPECT_EQ(crc16_gk6x(reply.data(), reply.size()), 0x2535);
}

TEST(Crc16Test, deterministic)
{
  std::array<uint8_t, 64> buf{};
  for (size_t i = 0; i < buf.size(); ++i)
    buf[i] = static_cast<uint8_t>(i * 7);
  EXPECT_EQ(crc16_gk6x(buf.data(), buf.size()), crc16_gk6x(buf.data(), buf.size()));
}
