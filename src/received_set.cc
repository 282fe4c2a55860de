#include "received_set.hh"

ReceivedSet::ReceivedSet(uint32_t totalParts)
    : mutex()
    , totalParts(totalParts)
    , received(totalParts, false)
    , count(0)
{}

bool
ReceivedSet::insert(uint32_t id)
{
    Guard _(mutex);
    if (id >= totalParts || received[id]) {
        return false;
    }
    received[id] = true;
    count++;
    return true;
}

bool
ReceivedSet::contains(uint32_t id)
{
    Guard _(mutex);
    return id < totalParts && received[id];
}

void
ReceivedSet::partition(const std::vector<uint32_t>& ids,
                       std::vector<uint32_t>& ack,
                       std::vector<uint32_t>& loss)
{
    Guard _(mutex);
    for (uint32_t id : ids) {
        if (id < totalParts && received[id]) {
            ack.push_back(id);
        } else {
            loss.push_back(id);
        }
    }
}

uint32_t
ReceivedSet::size()
{
    Guard _(mutex);
    return count;
}
