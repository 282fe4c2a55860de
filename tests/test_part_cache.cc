#include "part_cache.hh"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

int main() {
    PartCache cache;
    assert(cache.empty());
    for (uint32_t id = 0; id < 5; id++) {
        cache.insert(id, "frame" + std::to_string(id));
    }
    assert(cache.size() == 5);
    assert((cache.unacknowledged() == std::vector<uint32_t>{0, 1, 2, 3, 4}));

    std::string frame;
    assert(cache.lookup(3, frame));
    assert(frame == "frame3");

    // An ack evicts both the id and its frame; a later loss finds nothing.
    assert(cache.acknowledge(3));
    assert(!cache.lookup(3, frame));
    assert((cache.unacknowledged() == std::vector<uint32_t>{0, 1, 2, 4}));

    // Duplicate and unknown acks are no-ops.
    assert(!cache.acknowledge(3));
    assert(!cache.acknowledge(42));
    assert(cache.size() == 4);

    assert(!cache.waitUntilEmpty(std::chrono::milliseconds(1)));

    // A waiter for room wakes up when acks come in.
    bool gotRoom = false;
    std::thread waiter([&] { gotRoom = cache.waitForRoom(2); });
    cache.acknowledge(0);
    cache.acknowledge(1);
    cache.acknowledge(2);
    waiter.join();
    assert(gotRoom);

    cache.acknowledge(4);
    assert(cache.waitUntilEmpty(std::chrono::milliseconds(1)));
    assert(cache.unacknowledged().empty());

    // Shutdown releases a transmitter stuck waiting for room.
    cache.insert(10, "x");
    bool result = true;
    std::thread blocked([&] { result = cache.waitForRoom(1); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    cache.shutdown();
    blocked.join();
    assert(!result);

    return 0;
}
