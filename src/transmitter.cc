#include <algorithm>
#include <thread>

#include "log.hh"
#include "transmitter.hh"
#include "wire_format.hh"

uint64_t
readBlocks(FileDescriptor& source, uint64_t length, size_t blockSize,
           Channel<std::string>& blocks)
{
    uint64_t total = 0;
    while (total < length) {
        size_t wanted = static_cast<size_t>(
                std::min<uint64_t>(blockSize, length - total));
        std::string block(wanted, '\0');
        size_t bytesRead = source.read_fully(&block[0], block.size());
        if (bytesRead == 0) {
            break;
        }
        block.resize(bytesRead);
        total += bytesRead;
        if (!blocks.push(std::move(block))) {
            // The transfer was torn down under us.
            return total;
        }
        if (bytesRead < wanted) {
            break;
        }
    }
    logDebug("reached end of file, bytes=%lu", static_cast<unsigned long>(total));
    blocks.close();
    return total;
}

uint64_t
partsForSize(uint64_t fileSize, size_t partSize)
{
    return (fileSize + partSize - 1) / partSize;
}

Transmitter::Transmitter(const Config& config, DatagramLink& link,
                         PartCache& cache)
    : config(config)
    , link(link)
    , cache(cache)
    , nextId(0)
{}

bool
Transmitter::transmitBlock(const std::string& block)
{
    const size_t partSize = config.partSize();
    for (size_t offset = 0; offset < block.size(); offset += partSize) {
        if (!cache.waitForRoom(config.maxInFlight)) {
            return false;
        }

        uint32_t id = nextId;
        size_t length = std::min(partSize, block.size() - offset);
        std::string frame = WireFormat::encodePart(id, block.data() + offset,
                                                   length, partSize);

        // Cache before sending so a Loss for this id can always be served.
        cache.insert(id, frame);
        link.send(frame);
        nextId = id + 1;

        if (DEBUG_F) {
            logDebug("sent part id=%u bytes=%zu", id, length);
        }
        if (config.sendGap.count() > 0) {
            std::this_thread::sleep_for(config.sendGap);
        }
    }
    return true;
}

void
Transmitter::run(Channel<std::string>& blocks)
{
    std::string block;
    while (blocks.pop(block)) {
        if (!transmitBlock(block)) {
            return;
        }
    }
    logInfo("transmitter done, parts=%u", partsSent());
}
