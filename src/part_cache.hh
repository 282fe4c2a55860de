#ifndef PART_CACHE_HH
#define PART_CACHE_HH

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "common.hh"

/**
 * Sender-side record of parts on the wire: the set of ids not acknowledged
 * yet, and the exact frame sent for each so a loss can be repaired without
 * re-reading the file. Both are updated under a single lock, so a Sync
 * snapshot never lists an id whose frame is not cached.
 */
class PartCache {
  public:
    PartCache();

    /**
     * Registers a frame about to be sent.
     */
    void insert(uint32_t id, std::string frame);

    /**
     * Drops an id from both the unacknowledged set and the frame cache.
     *
     * \return
     *      False if the id was not outstanding (duplicate or bogus Ack).
     */
    bool acknowledge(uint32_t id);

    /**
     * Copies the cached frame for an id.
     *
     * \return
     *      False if nothing is cached under that id.
     */
    bool lookup(uint32_t id, std::string& frame);

    /**
     * Point-in-time copy of the unacknowledged ids, in increasing order.
     */
    std::vector<uint32_t> unacknowledged();

    size_t size();

    bool empty();

    /**
     * Blocks until fewer than \p limit parts are outstanding.
     *
     * \return
     *      False if shutdown() was called while waiting.
     */
    bool waitForRoom(size_t limit);

    /**
     * Blocks up to \p timeout for every outstanding part to be acknowledged.
     *
     * \return
     *      True if the cache is empty.
     */
    bool waitUntilEmpty(std::chrono::milliseconds timeout);

    /**
     * Releases every thread blocked in waitForRoom().
     */
    void shutdown();

  private:
    std::mutex mutex;

    /// Signalled whenever an id is acknowledged or on shutdown.
    std::condition_variable drained;

    std::set<uint32_t> unacked;

    std::unordered_map<uint32_t, std::string> frames;

    bool stopped;

    DISALLOW_COPY_AND_ASSIGN(PartCache)
};

#endif /* PART_CACHE_HH */
