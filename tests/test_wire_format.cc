#include "wire_format.hh"

#include <cassert>
#include <string>
#include <vector>

using WireFormat::Message;

namespace {

std::vector<Message>
sampleMessages()
{
    std::vector<Message> messages;
    messages.push_back(Message::send("report.pdf", 10));
    messages.push_back(Message::send("", 0));
    messages.push_back(Message::send("caf\xc3\xa9.txt", 0xFFFFFFFFu));
    messages.push_back(Message::accept());
    messages.push_back(Message::part(0, std::string("hello")));
    messages.push_back(Message::part(7, std::string()));
    messages.push_back(Message::part(0xDEADBEEF, std::string("\0\1\2", 3)));
    messages.push_back(Message::sync(std::vector<uint32_t>()));
    messages.push_back(Message::sync(std::vector<uint32_t>{1, 3, 5}));
    messages.push_back(Message::ack(std::vector<uint32_t>{0}));
    messages.push_back(Message::ack(std::vector<uint32_t>()));
    messages.push_back(Message::loss(std::vector<uint32_t>{9, 4, 0xFFFFFFFFu}));
    return messages;
}

bool
decodeFails(const std::string& frame)
{
    try {
        WireFormat::decode(frame);
    } catch (const WireFormat::DecodeError&) {
        return true;
    }
    return false;
}

}

int main() {
    for (const auto& message : sampleMessages()) {
        assert(WireFormat::decode(WireFormat::encode(message)) == message);
    }

    // Layout: big-endian, one opcode byte.
    std::string part = WireFormat::encode(Message::part(0x01020304, "ab"));
    assert(part == std::string("\x02\x01\x02\x03\x04" "ab", 7));
    std::string send = WireFormat::encode(Message::send("f", 2));
    assert(send == std::string("\x00\x00\x00\x00\x02\x00\x00\x00\x01" "f", 10));
    std::string ack = WireFormat::encode(Message::ack(std::vector<uint32_t>{5}));
    assert(ack == std::string("\x04\x00\x00\x00\x01\x00\x00\x00\x05", 9));
    assert(WireFormat::encode(Message::accept()) == std::string("\x01", 1));

    // Every strict prefix of a frame with a fixed layout is rejected. PART
    // frames consume the rest of the datagram, so only prefixes shorter
    // than the header fail.
    for (const auto& message : sampleMessages()) {
        std::string frame = WireFormat::encode(message);
        size_t minimum = message.opcode == WireFormat::PART ? 5 : frame.size();
        for (size_t length = 0; length < minimum; length++) {
            assert(decodeFails(frame.substr(0, length)));
        }
    }

    assert(decodeFails(std::string()));
    assert(decodeFails(std::string("\x06", 1)));
    assert(decodeFails(std::string("\xff\x00\x00\x00\x00", 5)));
    // Trailing garbage after an id list or an accept.
    assert(decodeFails(ack + "x"));
    assert(decodeFails(std::string("\x01\x00", 2)));
    // A count far larger than the frame.
    assert(decodeFails(std::string("\x03\xff\xff\xff\xff\x00\x00\x00\x01", 9)));
    // File name length past the end of the frame.
    assert(decodeFails(std::string("\x00\x00\x00\x00\x01\x00\x00\x00\x09" "ab", 11)));
    // File names must be UTF-8: stray continuation byte, cut sequence,
    // overlong '/', surrogate.
    assert(decodeFails(WireFormat::encode(Message::send("a\x80", 1))));
    assert(decodeFails(WireFormat::encode(Message::send("caf\xc3", 1))));
    assert(decodeFails(WireFormat::encode(Message::send("\xc0\xaf", 1))));
    assert(decodeFails(WireFormat::encode(Message::send("\xed\xa0\x80", 1))));
    assert(WireFormat::decode(WireFormat::encode(
            Message::send("\xf0\x9f\x93\x84.txt", 1))).fileName ==
           "\xf0\x9f\x93\x84.txt");

    // encodePart matches the generic encoder and refuses oversized chunks.
    std::string chunk(10, 'z');
    assert(WireFormat::encodePart(3, chunk.data(), chunk.size(), 10) ==
           WireFormat::encode(Message::part(3, chunk)));
    bool threw = false;
    try {
        WireFormat::encodePart(3, chunk.data(), chunk.size(), 9);
    } catch (const WireFormat::DoesNotFit&) {
        threw = true;
    }
    assert(threw);

    // Long id lists are split, each frame within the limit.
    std::vector<uint32_t> ids;
    for (uint32_t i = 0; i < 10; i++) {
        ids.push_back(i * 2);
    }
    auto frames = WireFormat::encodeIdLists(WireFormat::SYNC, ids, 4);
    assert(frames.size() == 3);
    std::vector<uint32_t> joined;
    for (const auto& frame : frames) {
        assert(frame.size() <= 5 + 4 * 4);
        Message decoded = WireFormat::decode(frame);
        assert(decoded.opcode == WireFormat::SYNC);
        joined.insert(joined.end(), decoded.ids.begin(), decoded.ids.end());
    }
    assert(joined == ids);
    auto empty = WireFormat::encodeIdLists(WireFormat::LOSS,
                                           std::vector<uint32_t>(), 4);
    assert(empty.size() == 1);
    assert(WireFormat::decode(empty[0]) == Message::loss(std::vector<uint32_t>()));

    return 0;
}
