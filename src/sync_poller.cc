#include "log.hh"
#include "sync_poller.hh"
#include "wire_format.hh"

SyncPoller::SyncPoller(const Config& config, DatagramLink& link,
                       PartCache& cache)
    : config(config)
    , link(link)
    , cache(cache)
    , mutex()
    , wakeup()
    , stopped(false)
{}

size_t
SyncPoller::pollOnce()
{
    std::vector<uint32_t> ids = cache.unacknowledged();
    if (ids.empty()) {
        return 0;
    }

    std::vector<std::string> frames = WireFormat::encodeIdLists(
            WireFormat::SYNC, ids, config.maxIdsPerFrame());
    for (const auto& frame : frames) {
        link.send(frame);
    }
    logDebug("sent sync ids=%zu frames=%zu", ids.size(), frames.size());
    return ids.size();
}

void
SyncPoller::run()
{
    std::unique_lock<std::mutex> lock(mutex);
    while (!wakeup.wait_for(lock, config.syncInterval,
                            [this] { return stopped; })) {
        lock.unlock();
        pollOnce();
        lock.lock();
    }
}

void
SyncPoller::stop()
{
    Guard _(mutex);
    stopped = true;
    wakeup.notify_all();
}
