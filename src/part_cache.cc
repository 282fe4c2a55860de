#include "part_cache.hh"

PartCache::PartCache()
    : mutex()
    , drained()
    , unacked()
    , frames()
    , stopped(false)
{}

void
PartCache::insert(uint32_t id, std::string frame)
{
    Guard _(mutex);
    frames[id] = std::move(frame);
    unacked.insert(id);
}

bool
PartCache::acknowledge(uint32_t id)
{
    Guard _(mutex);
    frames.erase(id);
    if (unacked.erase(id) == 0) {
        return false;
    }
    drained.notify_all();
    return true;
}

bool
PartCache::lookup(uint32_t id, std::string& frame)
{
    Guard _(mutex);
    auto it = frames.find(id);
    if (it == frames.end()) {
        return false;
    }
    frame = it->second;
    return true;
}

std::vector<uint32_t>
PartCache::unacknowledged()
{
    Guard _(mutex);
    return std::vector<uint32_t>(unacked.begin(), unacked.end());
}

size_t
PartCache::size()
{
    Guard _(mutex);
    return unacked.size();
}

bool
PartCache::empty()
{
    Guard _(mutex);
    return unacked.empty();
}

bool
PartCache::waitForRoom(size_t limit)
{
    std::unique_lock<std::mutex> lock(mutex);
    drained.wait(lock, [this, limit] {
        return stopped || unacked.size() < limit;
    });
    return !stopped;
}

bool
PartCache::waitUntilEmpty(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex);
    return drained.wait_for(lock, timeout, [this] {
        return unacked.empty();
    });
}

void
PartCache::shutdown()
{
    Guard _(mutex);
    stopped = true;
    drained.notify_all();
}
