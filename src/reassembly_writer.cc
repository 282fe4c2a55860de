#include <algorithm>

#include "log.hh"
#include "reassembly_writer.hh"

ReassemblyWriter::ReassemblyWriter(const Config& config, FileDescriptor&& file,
                                   uint32_t totalParts)
    : config(config)
    , file(std::move(file))
    , totalParts(totalParts)
    , buffer()
    , seen(totalParts, false)
    , distinct(0)
    , state(COLLECTING)
{
    buffer.reserve(config.writeBatch);
    if (totalParts == 0) {
        finish();
    }
}

bool
ReassemblyWriter::deliver(uint32_t id, std::string data)
{
    if (complete()) {
        return true;
    }
    if (id >= totalParts) {
        logWarning("dropping part outside transfer, id=%u parts=%u",
                   id, totalParts);
        return false;
    }

    if (!seen[id]) {
        seen[id] = true;
        distinct++;
    }
    ReceivedPart part = {id, std::move(data)};
    buffer.push_back(std::move(part));

    if (distinct == totalParts) {
        finish();
    } else if (buffer.size() >= config.writeBatch) {
        flush();
    }
    return complete();
}

void
ReassemblyWriter::flush()
{
    if (buffer.empty()) {
        return;
    }
    state = FLUSHING;

    std::sort(buffer.begin(), buffer.end(),
              [](const ReceivedPart& a, const ReceivedPart& b) {
                  return a.id < b.id;
              });

    uint32_t runStart = buffer[0].id;
    uint32_t previous = buffer[0].id;
    std::string run;
    run.swap(buffer[0].data);
    for (size_t i = 1; i < buffer.size(); i++) {
        ReceivedPart& part = buffer[i];
        if (part.id == previous) {
            // Same bytes for the same offset.
            continue;
        }
        if (part.id == previous + 1) {
            run.append(part.data);
        } else {
            writeRun(runStart, run);
            runStart = part.id;
            run.swap(part.data);
        }
        previous = part.id;
    }
    // The last run is written whether or not it closed with a gap.
    writeRun(runStart, run);

    buffer.clear();
    state = COLLECTING;
}

void
ReassemblyWriter::run(Channel<ReceivedPart>& parts)
{
    ReceivedPart part;
    while (!complete() && parts.pop(part)) {
        deliver(part.id, std::move(part.data));
    }
    if (!complete()) {
        flush();
    }
}

void
ReassemblyWriter::writeRun(uint32_t firstId, const std::string& bytes)
{
    uint64_t offset = static_cast<uint64_t>(firstId) * config.partSize();
    file.pwrite_all(bytes.data(), bytes.size(), offset);
    if (DEBUG_F) {
        logDebug("wrote run first=%u bytes=%zu offset=%lu", firstId,
                 bytes.size(), static_cast<unsigned long>(offset));
    }
}

void
ReassemblyWriter::finish()
{
    flush();
    file.close();
    state = COMPLETE;
    logInfo("file complete, parts=%u", totalParts);
}
