#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Hex dumps
// -----------------------------------------------------------------------

// Format up to 16 bytes as
//   "01 01 00 00 00 00 74 1b  00 00 00 00 00 00 00 00   ......t. ........"
// Missing bytes are padded with blanks so columns line up.
std::string hexdump_line(const uint8_t* data, size_t len);

// Full dump, one hexdump_line() per 16 bytes, each prefixed with an
// 8-digit hex offset starting at `start`.
std::vector<std::string> hexdump_lines(const uint8_t* data, size_t len, size_t start = 0);

void hexdump(std::ostream& os, const uint8_t* data, size_t len, size_t start = 0);

// -----------------------------------------------------------------------
// Trace sink
//
// Handed explicitly to the transport, the command layer and the keymap
// programmer. A default-constructed Trace prints nothing.
// -----------------------------------------------------------------------

class Trace {
public:
    Trace() = default;
    explicit Trace(std::ostream& out, bool verbose = false, std::ostream* err = nullptr)
        : _out(&out), _err(err), _verbose(verbose) {}

    bool verbose() const { return _out != nullptr && _verbose; }

    // Progress messages, printed whenever a stream is attached.
    void info(const std::string& msg) const;

    // Printed only in verbose mode.
    void debug(const std::string& msg) const;

    // Goes to the error stream when one is attached.
    void warn(const std::string& msg) const;

    // Labelled hexdump, verbose mode only.
    void dump(const std::string& label, const uint8_t* data, size_t len) const;

private:
    std::ostream* _out     = nullptr;
    std::ostream* _err     = nullptr;
    bool          _verbose = false;
};
