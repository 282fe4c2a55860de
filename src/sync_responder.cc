#include "log.hh"
#include "sync_responder.hh"
#include "wire_format.hh"

SyncResponder::SyncResponder(const Config& config, DatagramLink& link,
                             ReceivedSet& received)
    : config(config)
    , link(link)
    , received(received)
    , losses(0)
{}

void
SyncResponder::respond(const std::vector<uint32_t>& ids)
{
    std::vector<uint32_t> ack;
    std::vector<uint32_t> loss;
    received.partition(ids, ack, loss);

    if (!ack.empty()) {
        for (const auto& frame : WireFormat::encodeIdLists(
                WireFormat::ACK, ack, config.maxIdsPerFrame())) {
            link.send(frame);
        }
    }
    if (!loss.empty()) {
        logDebug("detected packet loss, lost=%zu polled=%zu",
                 loss.size(), ids.size());
        for (const auto& frame : WireFormat::encodeIdLists(
                WireFormat::LOSS, loss, config.maxIdsPerFrame())) {
            link.send(frame);
        }
        losses += loss.size();
    }
}

void
SyncResponder::run(Channel<std::vector<uint32_t>>& syncs)
{
    std::vector<uint32_t> ids;
    while (syncs.pop(ids)) {
        respond(ids);
    }
}
