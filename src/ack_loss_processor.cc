#include "ack_loss_processor.hh"
#include "log.hh"

AckLossProcessor::AckLossProcessor(DatagramLink& link, PartCache& cache)
    : link(link)
    , cache(cache)
    , stopped(false)
    , lastHeardTicks(Clock::now().time_since_epoch().count())
    , acked(0)
    , resent(0)
{}

void
AckLossProcessor::handle(const WireFormat::Message& message)
{
    lastHeardTicks = Clock::now().time_since_epoch().count();

    switch (message.opcode) {
        case WireFormat::ACK:
            onAck(message.ids);
            break;
        case WireFormat::LOSS:
            onLoss(message.ids);
            break;
        case WireFormat::ACCEPT:
            // A duplicate answer to our handshake.
            logDebug("ignoring late accept");
            break;
        default:
            logWarning("unexpected message from receiver, opcode=%s",
                       WireFormat::opcodeName(message.opcode));
            break;
    }
}

void
AckLossProcessor::handleDatagram(const std::string& datagram)
{
    WireFormat::Message message;
    try {
        message = WireFormat::decode(datagram);
    } catch (const WireFormat::DecodeError& e) {
        logWarning("dropping datagram, bytes=%zu error=\"%s\"",
                   datagram.size(), e.what());
        return;
    }
    handle(message);
}

void
AckLossProcessor::run()
{
    std::string datagram;
    while (!stopped) {
        if (link.recv(datagram, RECV_TIMEOUT_MS)) {
            handleDatagram(datagram);
        }
    }
}

bool
AckLossProcessor::receiverSilent(Clock::duration limit)
{
    Clock::time_point now = Clock::now();
    if (cache.empty()) {
        lastHeardTicks = now.time_since_epoch().count();
        return false;
    }
    return now - Clock::time_point(Clock::duration(lastHeardTicks.load())) >
            limit;
}

void
AckLossProcessor::stop()
{
    stopped = true;
}

void
AckLossProcessor::onAck(const std::vector<uint32_t>& ids)
{
    for (uint32_t id : ids) {
        if (cache.acknowledge(id)) {
            acked++;
        } else {
            logDebug("ack for part not in flight, id=%u", id);
        }
    }
}

void
AckLossProcessor::onLoss(const std::vector<uint32_t>& ids)
{
    std::string frame;
    for (uint32_t id : ids) {
        // Copy out under the cache lock, send outside it.
        if (!cache.lookup(id, frame)) {
            logDebug("loss for part not in flight, id=%u", id);
            continue;
        }
        link.send(frame);
        resent++;
    }
    if (!ids.empty()) {
        logDebug("retransmitted lost parts, reported=%zu", ids.size());
    }
}
