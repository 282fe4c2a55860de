#include "channel.hh"

#include <cassert>
#include <string>
#include <thread>
#include <vector>

int main() {
    Channel<int> unbounded;
    for (int i = 0; i < 100; i++) {
        assert(unbounded.push(i));
    }
    unbounded.close();
    assert(!unbounded.push(100));
    int value;
    for (int i = 0; i < 100; i++) {
        assert(unbounded.pop(value));
        assert(value == i);
    }
    assert(!unbounded.pop(value));

    // A bounded channel hands items across threads in order.
    Channel<std::string> bounded(2);
    std::thread producer([&] {
        for (int i = 0; i < 50; i++) {
            bounded.push(std::to_string(i));
        }
        bounded.close();
    });
    std::vector<std::string> received;
    std::string item;
    while (bounded.pop(item)) {
        received.push_back(item);
    }
    producer.join();
    assert(received.size() == 50);
    assert(received.front() == "0");
    assert(received.back() == "49");

    // close() wakes a blocked consumer.
    Channel<int> idle;
    bool popped = true;
    std::thread consumer([&] { popped = idle.pop(value); });
    idle.close();
    consumer.join();
    assert(!popped);

    return 0;
}
