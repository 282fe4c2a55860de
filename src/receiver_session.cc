#include <fcntl.h>

#include "log.hh"
#include "progress.hh"
#include "receiver_session.hh"
#include "sync_responder.hh"
#include "util.hh"
#include "worker_group.hh"

namespace {

/**
 * Strips any directory part from a name chosen by the remote side.
 *
 * \return
 *      The bare file name, or an empty string if nothing usable is left.
 */
std::string
sanitizeFileName(const std::string& name)
{
    std::string base = name.substr(name.find_last_of("/\\") + 1);
    if (base == "." || base == ".." ||
            base.find('\0') != std::string::npos) {
        return "";
    }
    return base;
}

}

ReceiverSession::ReceiverSession(const Config& config, DatagramLink& link,
                                 const std::string& outputDir)
    : config(config)
    , link(link)
    , outputDir(outputDir)
    , fileName()
    , path()
    , totalParts(0)
{}

std::unique_ptr<FileDescriptor>
ReceiverSession::awaitHandshake()
{
    std::string datagram;
    while (true) {
        if (!link.recv(datagram, -1)) {
            continue;
        }

        WireFormat::Message message;
        try {
            message = WireFormat::decode(datagram);
        } catch (const WireFormat::DecodeError& e) {
            logWarning("dropping datagram before handshake, error=\"%s\"",
                       e.what());
            continue;
        }
        if (message.opcode != WireFormat::SEND) {
            logDebug("ignoring %s before handshake",
                     WireFormat::opcodeName(message.opcode));
            continue;
        }

        std::string name = sanitizeFileName(message.fileName);
        if (name.empty()) {
            logWarning("rejecting transfer with unusable file name \"%s\"",
                       message.fileName.c_str());
            continue;
        }

        fileName = name;
        totalParts = message.parts;
        path = outputDir.empty() ? name : outputDir + "/" + name;
        std::unique_ptr<FileDescriptor> file(new FileDescriptor(
                SystemCall("open " + path,
                           open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                                0644))));

        link.pinPeer();
        link.send(WireFormat::encode(WireFormat::Message::accept()));
        logInfo("accepted transfer, file=%s parts=%u", path.c_str(),
                totalParts);
        return file;
    }
}

bool
ReceiverSession::validPart(const WireFormat::Message& part)
{
    if (part.id >= totalParts) {
        logWarning("dropping part outside transfer, id=%u parts=%u",
                   part.id, totalParts);
        return false;
    }
    // Offsets are id * partSize, so every part but the last must be full.
    // A sender cutting other sizes would be answered with Loss forever.
    bool last = part.id + 1 == totalParts;
    if (last ? part.data.size() > config.partSize()
             : part.data.size() != config.partSize()) {
        throw TransferError("sender's part size differs from ours: part " +
                            std::to_string(part.id) + " has " +
                            std::to_string(part.data.size()) +
                            " bytes, part size is " +
                            std::to_string(config.partSize()) +
                            " (use the same -m on both ends)");
    }
    if (part.data.empty()) {
        logWarning("dropping empty part, id=%u", part.id);
        return false;
    }
    return true;
}

void
ReceiverSession::route(const std::string& datagram, ReceivedSet& received,
                       ReassemblyWriter& writer,
                       Channel<ReceivedPart>& parts,
                       Channel<std::vector<uint32_t>>& syncs)
{
    WireFormat::Message message;
    try {
        message = WireFormat::decode(datagram);
    } catch (const WireFormat::DecodeError& e) {
        logWarning("dropping datagram, bytes=%zu error=\"%s\"",
                   datagram.size(), e.what());
        return;
    }

    switch (message.opcode) {
        case WireFormat::PART: {
            if (!validPart(message)) {
                return;
            }
            if (!received.insert(message.id)) {
                logDebug("duplicate part, id=%u", message.id);
            }
            if (!writer.complete()) {
                ReceivedPart part = {message.id, std::move(message.data)};
                parts.push(std::move(part));
            }
            break;
        }
        case WireFormat::SYNC:
            syncs.push(std::move(message.ids));
            break;
        case WireFormat::SEND:
            if (sanitizeFileName(message.fileName) == fileName &&
                    message.parts == totalParts) {
                // Our Accept got lost.
                link.send(WireFormat::encode(WireFormat::Message::accept()));
            } else {
                logWarning("ignoring second transfer, file=%s",
                           message.fileName.c_str());
            }
            break;
        default:
            logWarning("unexpected message from sender, opcode=%s",
                       WireFormat::opcodeName(message.opcode));
            break;
    }
}

void
ReceiverSession::run()
{
    std::unique_ptr<FileDescriptor> file = awaitHandshake();

    ReceivedSet received(totalParts);
    ReassemblyWriter writer(config, std::move(*file), totalParts);
    if (writer.complete()) {
        logInfo("transfer complete, file=%s parts=0", path.c_str());
        return;
    }

    Channel<ReceivedPart> parts;
    Channel<std::vector<uint32_t>> syncs;
    SyncResponder responder(config, link, received);
    Progress progress("received", "lost", totalParts, config.quiet);

    WorkerGroup workers([&] {
        parts.close();
        syncs.close();
    });
    workers.spawn("reassembly writer", [&] { writer.run(parts); });
    workers.spawn("sync responder", [&] { responder.run(syncs); });

    std::string datagram;
    Clock::time_point lastHeard = Clock::now();
    Clock::time_point completedAt;
    bool complete = false;
    bool idle = false;
    while (!workers.failed()) {
        bool heard = link.recv(datagram, RECV_TIMEOUT_MS);
        Clock::time_point now = Clock::now();
        if (heard) {
            lastHeard = now;
            route(datagram, received, writer, parts, syncs);
        }
        progress.update(received.size(), responder.lossesReported());

        if (!complete && writer.complete()) {
            complete = true;
            completedAt = now;
            logDebug("lingering for %ld ms",
                     static_cast<long>(config.linger.count()));
        }
        if (complete && now - completedAt >= config.linger) {
            break;
        }
        if (!complete && now - lastHeard > config.idleTimeout) {
            idle = true;
            break;
        }
    }

    workers.shutdown();
    workers.joinAll();
    workers.rethrowIfFailed();
    if (idle) {
        throw TransferError("no data from sender for " +
                            std::to_string(config.idleTimeout.count()) +
                            " ms, received " +
                            std::to_string(received.size()) + " of " +
                            std::to_string(totalParts) + " parts");
    }
    progress.finish();
    logInfo("transfer complete, file=%s parts=%u losses_reported=%lu",
            path.c_str(), totalParts,
            static_cast<unsigned long>(responder.lossesReported()));
}
