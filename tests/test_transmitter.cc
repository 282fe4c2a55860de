#include "memory_link.hh"
#include "test_util.hh"
#include "transmitter.hh"
#include "wire_format.hh"

#include <cassert>
#include <chrono>
#include <fcntl.h>
#include <string>
#include <thread>
#include <vector>

namespace {

Config
smallConfig()
{
    Config config;
    config.mtu = 1005;     // 1000-byte parts
    config.blockParts = 3; // 3000-byte reads
    config.quiet = true;
    return config;
}

}

int main() {
    assert(partsForSize(0, 1000) == 0);
    assert(partsForSize(1, 1000) == 1);
    assert(partsForSize(10000, 1000) == 10);
    assert(partsForSize(10001, 1000) == 11);

    Config config = smallConfig();
    assert(config.partSize() == 1000);
    assert(config.blockSize() == 3000);

    std::string dir = makeTempDir("gofast_tx");
    std::string path = dir + "/source.bin";
    std::string contents = patternBytes(10000);
    writeFile(path, contents);

    // Bulk reads come back as 3000-byte blocks with a short final one.
    {
        FileDescriptor source(open(path.c_str(), O_RDONLY));
        assert(source.size() == 10000);
        Channel<std::string> blocks;
        assert(readBlocks(source, source.size(), config.blockSize(), blocks) == 10000);
        std::vector<size_t> sizes;
        std::string block;
        std::string joined;
        while (blocks.pop(block)) {
            sizes.push_back(block.size());
            joined += block;
        }
        assert((sizes == std::vector<size_t>{3000, 3000, 3000, 1000}));
        assert(joined == contents);
    }

    // 10000 bytes of 1000-byte parts: ids 0..9, each cached before sending.
    {
        FileDescriptor source(open(path.c_str(), O_RDONLY));
        Channel<std::string> blocks;
        readBlocks(source, source.size(), config.blockSize(), blocks);

        MemoryLink link;
        PartCache cache;
        Transmitter transmitter(config, link, cache);
        transmitter.run(blocks);
        assert(transmitter.partsSent() == 10);

        std::vector<std::string> frames = link.sentFrames();
        assert(frames.size() == 10);
        std::string rebuilt;
        for (uint32_t id = 0; id < 10; id++) {
            WireFormat::Message message = WireFormat::decode(frames[id]);
            assert(message.opcode == WireFormat::PART);
            assert(message.id == id);
            assert(message.data.size() == 1000);
            rebuilt += message.data;

            std::string cached;
            assert(cache.lookup(id, cached));
            assert(cached == frames[id]);
        }
        assert(rebuilt == contents);
        assert(cache.size() == 10);
    }

    // A file that does not end on a part boundary gets a short last part.
    {
        std::string odd = patternBytes(2500, 7);
        writeFile(path, odd);
        FileDescriptor source(open(path.c_str(), O_RDONLY));
        Channel<std::string> blocks;
        readBlocks(source, source.size(), config.blockSize(), blocks);

        MemoryLink link;
        PartCache cache;
        Transmitter transmitter(config, link, cache);
        transmitter.run(blocks);
        std::vector<std::string> frames = link.sentFrames();
        assert(frames.size() == 3);
        assert(WireFormat::decode(frames[2]).data.size() == 500);
        assert(WireFormat::decode(frames[2]).id == 2);
    }

    // With the in-flight limit reached the transmitter waits for acks, and
    // gives up when the cache shuts down.
    {
        config.maxInFlight = 2;
        MemoryLink link;
        PartCache cache;
        Transmitter transmitter(config, link, cache);
        bool finished = true;
        std::thread sender([&] {
            finished = transmitter.transmitBlock(std::string(3000, 'a'));
        });
        while (cache.size() < 2) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        assert(transmitter.partsSent() == 2);
        cache.shutdown();
        sender.join();
        assert(!finished);
        assert(transmitter.partsSent() == 2);
    }

    removeTree(dir);
    return 0;
}
