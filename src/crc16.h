#pragma once

#include <cstddef>
#include <cstdint>

// -----------------------------------------------------------------------
// CRC-16, MSB-first (non-reflected).
//
// For every byte: XOR it into the high byte of the accumulator, then
// eight times shift left and XOR the polynomial whenever bit 16 falls
// out. The result is XORed with xor_out.
// -----------------------------------------------------------------------

uint16_t crc16(const uint8_t* data, size_t len,
               uint16_t poly, uint16_t iv, uint16_t xor_out);

// poly 0x8005, IV 0xFFFF, XOR-out 0xFFFF. Not used by the GK6x frames.
uint16_t crc16_usb(const uint8_t* data, size_t len, uint16_t iv = 0xffff);

// CRC-16/CCITT-FALSE: poly 0x1021, IV 0xFFFF, no XOR-out.
// This is the checksum carried in bytes 6-7 of every GK6x frame.
uint16_t crc16_gk6x(const uint8_t* data, size_t len, uint16_t iv = 0xffff);
