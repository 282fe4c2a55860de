#include "memory_link.hh"
#include "sync_responder.hh"
#include "wire_format.hh"

#include <algorithm>
#include <cassert>
#include <set>
#include <vector>

using WireFormat::Message;

int main() {
    ReceivedSet received(20);
    assert(received.total() == 20);
    for (uint32_t id = 0; id < 20; id += 2) {
        assert(received.insert(id));
    }
    // Inserting twice is a no-op; ids outside the transfer are refused.
    assert(!received.insert(4));
    assert(!received.insert(20));
    assert(received.size() == 10);
    assert(received.contains(8));
    assert(!received.contains(9));
    assert(!received.complete());

    // ack = S ∩ R, loss = S − R, disjoint, together exactly S.
    std::vector<uint32_t> polled = {9, 0, 3, 4, 4, 17, 18, 25};
    std::vector<uint32_t> ack;
    std::vector<uint32_t> loss;
    received.partition(polled, ack, loss);
    assert((ack == std::vector<uint32_t>{0, 4, 4, 18}));
    assert((loss == std::vector<uint32_t>{9, 3, 17, 25}));
    std::multiset<uint32_t> together(ack.begin(), ack.end());
    together.insert(loss.begin(), loss.end());
    assert(together == std::multiset<uint32_t>(polled.begin(), polled.end()));

    Config config;
    config.mtu = 5 + 2 * 4; // two ids per frame
    MemoryLink link;
    SyncResponder responder(config, link, received);

    // Mixed poll: Ack frames then Loss frames, split to fit the MTU.
    responder.respond(std::vector<uint32_t>{0, 1, 2, 3, 4});
    std::vector<std::string> frames = link.sentFrames();
    assert(frames.size() == 3);
    assert(WireFormat::decode(frames[0]) == Message::ack(std::vector<uint32_t>{0, 2}));
    assert(WireFormat::decode(frames[1]) == Message::ack(std::vector<uint32_t>{4}));
    assert(WireFormat::decode(frames[2]) == Message::loss(std::vector<uint32_t>{1, 3}));
    assert(responder.lossesReported() == 2);
    link.clearSent();

    // All received: no Loss frame at all.
    responder.respond(std::vector<uint32_t>{6, 8});
    frames = link.sentFrames();
    assert(frames.size() == 1);
    assert(WireFormat::decode(frames[0]).opcode == WireFormat::ACK);
    link.clearSent();

    // None received: no Ack frame; an empty poll sends nothing.
    responder.respond(std::vector<uint32_t>{5});
    responder.respond(std::vector<uint32_t>());
    frames = link.sentFrames();
    assert(frames.size() == 1);
    assert(WireFormat::decode(frames[0]) == Message::loss(std::vector<uint32_t>{5}));
    link.clearSent();

    // Polls queued on the channel are answered in order.
    Channel<std::vector<uint32_t>> syncs;
    syncs.push(std::vector<uint32_t>{10});
    syncs.push(std::vector<uint32_t>{11});
    syncs.close();
    responder.run(syncs);
    frames = link.sentFrames();
    assert(frames.size() == 2);
    assert(WireFormat::decode(frames[0]) == Message::ack(std::vector<uint32_t>{10}));
    assert(WireFormat::decode(frames[1]) == Message::loss(std::vector<uint32_t>{11}));

    return 0;
}
