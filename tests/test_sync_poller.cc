#include "ack_loss_processor.hh"
#include "memory_link.hh"
#include "sync_poller.hh"
#include "wire_format.hh"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using WireFormat::Message;

namespace {

std::vector<uint32_t>
polledIds(MemoryLink& link)
{
    std::vector<uint32_t> ids;
    for (const auto& frame : link.sentFrames()) {
        Message message = WireFormat::decode(frame);
        assert(message.opcode == WireFormat::SYNC);
        ids.insert(ids.end(), message.ids.begin(), message.ids.end());
    }
    return ids;
}

}

int main() {
    Config config;
    config.mtu = 5 + 3 * 4; // three ids per Sync frame
    config.syncInterval = std::chrono::milliseconds(5);

    MemoryLink link;
    PartCache cache;
    SyncPoller poller(config, link, cache);

    // Nothing outstanding: the tick is skipped.
    assert(poller.pollOnce() == 0);
    assert(link.sentFrames().empty());

    for (uint32_t id = 0; id < 8; id++) {
        cache.insert(id, WireFormat::encode(Message::part(id, "data" + std::to_string(id))));
    }
    assert(poller.pollOnce() == 8);
    assert(link.sentFrames().size() == 3);
    assert((polledIds(link) == std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6, 7}));
    link.clearSent();

    // Acks evict; losses resend the cached frame unchanged.
    AckLossProcessor processor(link, cache);
    processor.handle(Message::ack(std::vector<uint32_t>{0, 2, 4, 6}));
    assert(processor.acknowledged() == 4);
    assert((cache.unacknowledged() == std::vector<uint32_t>{1, 3, 5, 7}));

    processor.handleDatagram(WireFormat::encode(
            Message::loss(std::vector<uint32_t>{1, 3})));
    std::vector<std::string> resent = link.sentFrames();
    assert(resent.size() == 2);
    assert(WireFormat::decode(resent[0]) == Message::part(1, "data1"));
    assert(WireFormat::decode(resent[1]) == Message::part(3, "data3"));
    assert(processor.retransmitted() == 2);
    link.clearSent();

    // Duplicate acks, and losses of acked or never-sent ids, change nothing.
    processor.handle(Message::ack(std::vector<uint32_t>{0, 2}));
    processor.handle(Message::loss(std::vector<uint32_t>{0, 99}));
    assert(processor.acknowledged() == 4);
    assert(link.sentFrames().empty());
    assert(cache.size() == 4);

    // Garbage and unexpected messages are dropped.
    processor.handleDatagram(std::string("\x09garbage", 8));
    processor.handle(Message::part(1, "x"));
    assert(cache.size() == 4);

    // The poller keeps polling on its own until stopped.
    std::thread polling([&] { poller.run(); });
    while (link.sentFrames().size() < 4) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    poller.stop();
    polling.join();
    for (const auto& frame : link.sentFrames()) {
        Message sync = WireFormat::decode(frame);
        assert((sync.ids == std::vector<uint32_t>{1, 3, 5}) ||
               (sync.ids == std::vector<uint32_t>{7}));
    }

    // The processor's receive loop consumes what the receiver sends.
    MemoryLink receiver;
    MemoryLink::connectPair(link, receiver);
    std::thread processing([&] { processor.run(); });
    receiver.send(WireFormat::encode(Message::ack(std::vector<uint32_t>{1, 3, 5, 7})));
    assert(cache.waitUntilEmpty(std::chrono::milliseconds(2000)));
    processor.stop();
    processing.join();
    assert(processor.acknowledged() == 8);

    // Silence only counts while something is waiting for an answer.
    const auto limit = std::chrono::milliseconds(20);
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    assert(!processor.receiverSilent(limit));
    cache.insert(8, WireFormat::encode(Message::part(8, "data8")));
    assert(!processor.receiverSilent(limit));
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    assert(processor.receiverSilent(limit));
    processor.handle(Message::ack(std::vector<uint32_t>{8}));
    assert(!processor.receiverSilent(limit));

    return 0;
}
