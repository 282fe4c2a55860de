#include <atomic>
#include <fcntl.h>
#include <limits>

#include "ack_loss_processor.hh"
#include "channel.hh"
#include "log.hh"
#include "part_cache.hh"
#include "progress.hh"
#include "sender_session.hh"
#include "sync_poller.hh"
#include "transmitter.hh"
#include "util.hh"
#include "wire_format.hh"
#include "worker_group.hh"

namespace {

/**
 * Bulk blocks read ahead of the transmitter.
 */
const size_t BLOCK_QUEUE_DEPTH = 4;

std::string
baseName(const std::string& path)
{
    return path.substr(path.find_last_of("/\\") + 1);
}

}

SenderSession::SenderSession(const Config& config, DatagramLink& link,
                             const std::string& path)
    : config(config)
    , link(link)
    , path(path)
    , resent(0)
{}

/**
 * Announces the file and waits for the receiver to accept it, resending
 * the announcement when the request or the response gets lost.
 */
void
SenderSession::handshake(const std::string& fileName, uint32_t parts)
{
    const std::string request =
            WireFormat::encode(WireFormat::Message::send(fileName, parts));
    std::string datagram;

    for (uint32_t attempt = 0; attempt <= config.handshakeRetries; attempt++) {
        link.send(request);
        logDebug("sent handshake request, attempt=%u", attempt);

        Clock::time_point deadline = Clock::now() + config.handshakeTimeout;
        while (true) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - Clock::now());
            if (left.count() <= 0 ||
                    !link.recv(datagram, static_cast<int>(left.count()))) {
                break;
            }
            try {
                if (WireFormat::decode(datagram).opcode == WireFormat::ACCEPT) {
                    logInfo("handshake accepted, file=%s parts=%u",
                            fileName.c_str(), parts);
                    return;
                }
                logDebug("ignoring message before accept");
            } catch (const WireFormat::DecodeError& e) {
                logWarning("dropping datagram during handshake, error=\"%s\"",
                           e.what());
            }
        }
    }
    throw TransferError("receiver did not accept after " +
                        std::to_string(config.handshakeRetries + 1) +
                        " attempts");
}

void
SenderSession::run()
{
    FileDescriptor source(SystemCall("open " + path,
                                     open(path.c_str(), O_RDONLY)));
    const uint64_t fileSize = source.size();
    const uint64_t parts = partsForSize(fileSize, config.partSize());
    if (parts > std::numeric_limits<uint32_t>::max()) {
        throw TransferError(path + " needs more parts than ids can number");
    }
    logInfo("sending file=%s bytes=%lu parts=%lu part_size=%zu",
            path.c_str(), static_cast<unsigned long>(fileSize),
            static_cast<unsigned long>(parts), config.partSize());

    handshake(baseName(path), static_cast<uint32_t>(parts));
    if (parts == 0) {
        logInfo("empty file, nothing to transmit");
        return;
    }

    PartCache cache;
    Channel<std::string> blocks(BLOCK_QUEUE_DEPTH);
    Transmitter transmitter(config, link, cache);
    SyncPoller poller(config, link, cache);
    AckLossProcessor processor(link, cache);
    Progress progress("acked", "resent", parts, config.quiet);
    std::atomic<bool> transmitted(false);

    WorkerGroup workers([&] {
        blocks.close();
        cache.shutdown();
        poller.stop();
        processor.stop();
    });
    workers.spawn("reader", [&] {
        readBlocks(source, fileSize, config.blockSize(), blocks);
    });
    workers.spawn("transmitter", [&] {
        transmitter.run(blocks);
        transmitted = true;
    });
    workers.spawn("sync poller", [&] { poller.run(); });
    workers.spawn("ack/loss processor", [&] { processor.run(); });

    bool idle = false;
    bool truncated = false;
    while (!workers.failed()) {
        // An empty cache means done only if every part had entered it.
        bool done = transmitted;
        bool drained = cache.waitUntilEmpty(std::chrono::milliseconds(100));
        progress.update(processor.acknowledged(), processor.retransmitted());
        if (done && drained) {
            truncated = transmitter.partsSent() != parts;
            break;
        }
        if (processor.receiverSilent(config.idleTimeout)) {
            idle = true;
            break;
        }
    }

    workers.shutdown();
    workers.joinAll();
    workers.rethrowIfFailed();
    resent = processor.retransmitted();
    if (idle) {
        throw TransferError("no answer from receiver for " +
                            std::to_string(config.idleTimeout.count()) +
                            " ms, unacknowledged=" +
                            std::to_string(cache.size()));
    }
    if (truncated) {
        throw TransferError(path + " changed size while being sent, sent " +
                            std::to_string(transmitter.partsSent()) + " of " +
                            std::to_string(parts) + " parts");
    }
    progress.update(processor.acknowledged(), resent);
    progress.finish();
    logInfo("transfer complete, file=%s parts=%lu retransmitted=%lu",
            path.c_str(), static_cast<unsigned long>(parts),
            static_cast<unsigned long>(resent));
}
