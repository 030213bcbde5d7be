#include "trace.h"

#include <iomanip>
#include <sstream>

std::string hexdump_line(const uint8_t* data, size_t len) {
    if (len > 16) len = 16;

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    std::string printable;
    for (size_t i = 0; i < 16; ++i) {
        if (i == 8) hex << " ";
        if (i > 0) hex << " ";
        if (i < len) {
            hex << std::setw(2) << static_cast<int>(data[i]);
            printable += (data[i] >= 0x20 && data[i] < 0x7f) ? static_cast<char>(data[i]) : '.';
        } else {
            hex << "  ";
        }
    }

    std::string right = printable.size() > 8 ? printable.substr(8) : "";
    return hex.str() + "   " + printable.substr(0, 8) + " " + right;
}

std::vector<std::string> hexdump_lines(const uint8_t* data, size_t len, size_t start) {
    std::vector<std::string> lines;
    for (size_t off = 0; off < len; off += 16) {
        std::ostringstream ss;
        ss << std::hex << std::setw(8) << std::setfill('0') << (start + off) << "  "
           << hexdump_line(data + off, len - off);
        lines.push_back(ss.str());
    }
    return lines;
}

void hexdump(std::ostream& os, const uint8_t* data, size_t len, size_t start) {
    for (const auto& line : hexdump_lines(data, len, start))
        os << line << "\n";
}

// -----------------------------------------------------------------------
// Trace
// -----------------------------------------------------------------------

void Trace::info(const std::string& msg) const {
    if (_out) *_out << msg << "\n";
}

void Trace::debug(const std::string& msg) const {
    if (verbose()) *_out << "  " << msg << "\n";
}

void Trace::warn(const std::string& msg) const {
    std::ostream* os = _err ? _err : _out;
    if (os) *os << "Warning: " << msg << "\n";
}

void Trace::dump(const std::string& label, const uint8_t* data, size_t len) const {
    if (!verbose()) return;
    if (!label.empty())
        *_out << "    " << label << "\n";
    for (const auto& line : hexdump_lines(data, len))
        *_out << "    " << line << "\n";
}
