#ifndef REASSEMBLY_WRITER_HH
#define REASSEMBLY_WRITER_HH

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "channel.hh"
#include "common.hh"
#include "file_descriptor.hh"

/**
 * A part as handed from the listener to the writer.
 */
struct ReceivedPart {
    uint32_t id;
    std::string data;
};

/**
 * Puts parts back together in the destination file, whatever order they
 * arrive in. Parts are buffered up to writeBatch, then sorted, merged into
 * contiguous runs and written at id * partSize with positioned writes.
 * Duplicates land on the same bytes again and are counted once.
 *
 * State goes COLLECTING -> FLUSHING -> COLLECTING ... -> COMPLETE. Once
 * every part has been seen the buffer is flushed and the file is closed.
 */
class ReassemblyWriter {
  public:
    enum State {
        COLLECTING,
        FLUSHING,
        COMPLETE,
    };

    /**
     * \param file
     *      Destination, already created and truncated. Closed on completion.
     * \param totalParts
     *      Part count announced by the sender; zero completes immediately.
     */
    ReassemblyWriter(const Config& config, FileDescriptor&& file,
                     uint32_t totalParts);

    /**
     * Buffers one part, flushing if the batch is full or it was the last
     * missing one.
     *
     * \return
     *      True once the transfer is complete.
     * \throw unix_error
     *      Writing or closing the file failed.
     */
    bool deliver(uint32_t id, std::string data);

    /**
     * Writes out everything buffered.
     */
    void flush();

    /**
     * Delivers parts from \p parts until complete or the channel closes.
     * A closed channel still gets its buffered parts flushed.
     */
    void run(Channel<ReceivedPart>& parts);

    bool complete() const
    {
        return state == COMPLETE;
    }

    State currentState() const
    {
        return state;
    }

    /**
     * Number of distinct part ids delivered so far.
     */
    uint32_t distinctParts() const
    {
        return distinct;
    }

  private:
    void writeRun(uint32_t firstId, const std::string& bytes);
    void finish();

    const Config& config;

    FileDescriptor file;

    const uint32_t totalParts;

    std::vector<ReceivedPart> buffer;

    std::vector<bool> seen;

    std::atomic<uint32_t> distinct;

    std::atomic<State> state;

    DISALLOW_COPY_AND_ASSIGN(ReassemblyWriter)
};

#endif /* REASSEMBLY_WRITER_HH */
