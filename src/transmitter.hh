#ifndef TRANSMITTER_HH
#define TRANSMITTER_HH

#include <atomic>
#include <cstdint>
#include <string>

#include "channel.hh"
#include "common.hh"
#include "file_descriptor.hh"
#include "link.hh"
#include "part_cache.hh"

/**
 * Reads the first \p length bytes of \p source in bulk blocks of
 * \p blockSize bytes and queues them for the transmitter. Only the last
 * block can be short. Closes \p blocks at end of file.
 *
 * \return
 *      Total number of bytes read.
 * \throw unix_error
 *      The file could not be read.
 */
uint64_t readBlocks(FileDescriptor& source, uint64_t length,
                    size_t blockSize, Channel<std::string>& blocks);

/**
 * Number of parts needed for a file of \p fileSize bytes.
 */
uint64_t partsForSize(uint64_t fileSize, size_t partSize);

/**
 * Slices file blocks into parts, frames them with consecutive ids starting
 * at 0 and sends them, registering every frame in the PartCache first.
 */
class Transmitter {
  public:
    Transmitter(const Config& config, DatagramLink& link, PartCache& cache);

    /**
     * Sends every part of one block.
     *
     * \return
     *      False if the cache was shut down while waiting for room.
     */
    bool transmitBlock(const std::string& block);

    /**
     * Transmits blocks until \p blocks is closed and drained, or the cache
     * is shut down.
     */
    void run(Channel<std::string>& blocks);

    /**
     * Number of parts sent so far, which is also the next id.
     */
    uint32_t partsSent() const
    {
        return nextId;
    }

  private:
    const Config& config;

    DatagramLink& link;

    PartCache& cache;

    std::atomic<uint32_t> nextId;

    DISALLOW_COPY_AND_ASSIGN(Transmitter)
};

#endif /* TRANSMITTER_HH */
