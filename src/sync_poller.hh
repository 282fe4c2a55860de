#ifndef SYNC_POLLER_HH
#define SYNC_POLLER_HH

#include <condition_variable>
#include <mutex>

#include "common.hh"
#include "link.hh"
#include "part_cache.hh"

/**
 * Loss detection without per-packet acknowledgments: every syncInterval,
 * ask the receiver about every part still unacknowledged. An empty
 * unacknowledged set skips the tick; no frame is sent.
 */
class SyncPoller {
  public:
    SyncPoller(const Config& config, DatagramLink& link, PartCache& cache);

    /**
     * Snapshots the unacknowledged set and sends it as Sync frames.
     *
     * \return
     *      Number of ids polled.
     */
    size_t pollOnce();

    /**
     * Polls every syncInterval until stop() is called.
     */
    void run();

    void stop();

  private:
    const Config& config;

    DatagramLink& link;

    PartCache& cache;

    std::mutex mutex;

    std::condition_variable wakeup;

    bool stopped;

    DISALLOW_COPY_AND_ASSIGN(SyncPoller)
};

#endif /* SYNC_POLLER_HH */
