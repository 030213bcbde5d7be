#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <vector>

#include "packet.h"
#include "transport.h"

// Scripted HidChannel: records every frame written and answers each one
// with an echo of its command byte unless told otherwise.
class FakeChannel : public HidChannel {
public:
    enum class Answer { Echo, WrongCommand, Timeout };

    std::vector<CommandFrame> sent;
    std::vector<unsigned int> read_timeouts;
    std::map<size_t, Answer>  answers;   // index into `sent` → answer

    void write(const uint8_t* data, size_t len) override {
        Packet p{};
        std::copy(data, data + std::min<size_t>(len, p.size()), p.begin());
        sent.push_back(decode_command(p));
    }

    int read(uint8_t* buf, size_t len, unsigned int timeout_ms) override {
        read_timeouts.push_back(timeout_ms);

        Answer answer = Answer::Echo;
        auto it = answers.find(sent.size() - 1);
        if (it != answers.end()) answer = it->second;
        if (answer == Answer::Timeout) return 0;

        const CommandFrame& req = sent.back();
        uint8_t cmd = (answer == Answer::WrongCommand) ? 0x00 : req.cmd();
        ReplyFrame reply = ReplyFrame(cmd, req.subcmd(), 0x01, {}, 0, Payload{}).with_checksum();
        Packet p = encode(reply);
        std::copy(p.begin(), p.begin() + std::min<size_t>(len, p.size()), buf);
        return static_cast<int>(std::min<size_t>(len, p.size()));
    }

    // Payload bytes of every sent frame with the given opcode, in order.
    // Small-offset frames carry their length in byte 4, full-offset
    // frames in byte 5.
    std::vector<uint8_t> payload_bytes(uint8_t cmd, OffsetMode mode) const {
        std::vector<uint8_t> out;
        for (const auto& f : sent) {
            if (f.cmd() != cmd) continue;
            size_t len = (mode == OffsetMode::Small) ? f.offset_ext() : f.length();
            out.insert(out.end(), f.data().begin(), f.data().begin() + len);
        }
        return out;
    }
};
