#pragma once

#include <cstdint>
#include <string>

#include <libusb.h>

#include "transport.h"

// Default timeout for USB writes in milliseconds
static constexpr unsigned int USB_WRITE_TIMEOUT_MS = 1000;

struct UsbTarget {
    uint16_t vid;
    uint16_t pid;
    int      interface_number;  // HID interface carrying the control channel
    uint8_t  ep_out;            // interrupt OUT endpoint (host → device)
    uint8_t  ep_in;             // interrupt IN endpoint (device → host)
};

// libusb-backed HID control channel. The handle is released (and the
// kernel driver reattached) by close() or the destructor, whichever
// comes first.
class UsbKeyboard : public HidChannel {
public:
    UsbKeyboard();
    ~UsbKeyboard() override;

    // Non-copyable
    UsbKeyboard(const UsbKeyboard&) = delete;
    UsbKeyboard& operator=(const UsbKeyboard&) = delete;

    // Open the keyboard by VID/PID and claim its control interface
    // (detaches the kernel driver automatically).
    // Throws TransportError on failure.
    void open(const UsbTarget& target);

    // Release the interface and reattach the kernel driver
    void close();

    void write(const uint8_t* data, size_t len) override;
    int  read(uint8_t* buf, size_t len, unsigned int timeout_ms) override;

    // Print interfaces and endpoints to stdout and check that the
    // configured control endpoints exist. Throws TransportError.
    void probe();

    bool is_open() const { return _handle != nullptr; }

private:
    libusb_context*       _ctx    = nullptr;
    libusb_device_handle* _handle = nullptr;

    UsbTarget _target   = {};
    bool      _detached = false;
    bool      _claimed  = false;
};
