#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "packet.h"

// Bad frame arguments (offset out of range, oversized payload).
// Raised before any byte reaches the device.
class ArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Unknown key, layer, color or model name in a keymap.
// Raised before any frame for the affected layer is sent.
class LookupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// USB write/read failure, read timeout or short read.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The device answered a command with a reply for a different command.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(const std::string& what, uint8_t request_cmd, const ReplyFrame& reply)
        : std::runtime_error(what), _request_cmd(request_cmd), _reply(reply) {}

    uint8_t request_cmd() const { return _request_cmd; }
    const ReplyFrame& reply() const { return _reply; }

private:
    uint8_t    _request_cmd;
    ReplyFrame _reply;
};
