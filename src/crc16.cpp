#include "crc16.h"

uint16_t crc16(const uint8_t* data, size_t len,
               uint16_t poly, uint16_t iv, uint16_t xor_out) {
    uint32_t crc = iv;
    for (size_t i = 0; i < len; ++i) {
        crc ^= static_cast<uint32_t>(data[i]) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            crc <<= 1;
            if (crc & 0x10000)
                crc = (crc ^ poly) & 0xffff;
        }
    }
    return static_cast<uint16_t>((crc & 0xffff) ^ xor_out);
}

uint16_t crc16_usb(const uint8_t* data, size_t len, uint16_t iv) {
    return crc16(data, len, 0x8005, iv, 0xffff);
}

uint16_t crc16_gk6x(const uint8_t* data, size_t len, uint16_t iv) {
    return crc16(data, len, 0x1021, iv, 0x0000);
}
