#pragma once

#include <cstddef>
#include <cstdint>

#include "packet.h"
#include "trace.h"

// Bidirectional byte channel to the keyboard's control interface.
// UsbKeyboard (usb.h) is the libusb implementation; tests plug in fakes.
class HidChannel {
public:
    virtual ~HidChannel() = default;

    // Write `len` bytes to the OUT endpoint.
    // Throws TransportError on failure.
    virtual void write(const uint8_t* data, size_t len) = 0;

    // Read up to `len` bytes from the IN endpoint.
    // Returns the number of bytes received, 0 on timeout.
    // Throws TransportError on any other failure.
    virtual int read(uint8_t* buf, size_t len, unsigned int timeout_ms) = 0;
};

// One frame out, at most one frame back. No retries at this level.
class Transport {
public:
    Transport(HidChannel& channel, const Trace& trace = Trace())
        : _channel(channel), _trace(trace) {}

    // Write exactly one 64-byte frame.
    void send(const CommandFrame& frame);

    // Write one frame and read back the 64-byte reply.
    // Throws TransportError when nothing arrives within timeout_ms or
    // when the device sends a short packet.
    ReplyFrame send_and_receive(const CommandFrame& frame, unsigned int timeout_ms);

    const Trace& trace() const { return _trace; }

private:
    HidChannel& _channel;
    Trace       _trace;
};
