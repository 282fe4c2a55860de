#ifndef RECEIVER_SESSION_HH
#define RECEIVER_SESSION_HH

#include <cstdint>
#include <memory>
#include <string>

#include "channel.hh"
#include "common.hh"
#include "file_descriptor.hh"
#include "link.hh"
#include "reassembly_writer.hh"
#include "received_set.hh"
#include "wire_format.hh"

/**
 * Receives one file over a DatagramLink. The calling thread is the
 * listener; the Sync responder and the reassembly writer run beside it.
 */
class ReceiverSession {
  public:
    /**
     * \param outputDir
     *      Directory the announced file is created in.
     */
    ReceiverSession(const Config& config, DatagramLink& link,
                    const std::string& outputDir);

    /**
     * Waits for a sender, receives its file, then lingers to acknowledge
     * the sender's last polls.
     *
     * \throw TransferError
     *      The sender went silent before the file was complete, or cuts
     *      parts of a different size.
     * \throw unix_error
     *      Writing the file or using the socket failed.
     */
    void run();

    /**
     * Where the file was written; empty before the handshake.
     */
    const std::string& filePath() const
    {
        return path;
    }

  private:
    /**
     * Blocks until a valid Send arrives, creates the file and accepts.
     */
    std::unique_ptr<FileDescriptor> awaitHandshake();

    void route(const std::string& datagram, ReceivedSet& received,
               ReassemblyWriter& writer, Channel<ReceivedPart>& parts,
               Channel<std::vector<uint32_t>>& syncs);

    /**
     * \return
     *      False for a part to drop.
     * \throw TransferError
     *      The part's size shows the sender cuts parts of another size.
     */
    bool validPart(const WireFormat::Message& part);

    /// How long one recv() may block before timeouts are checked.
    static const int RECV_TIMEOUT_MS = 100;

    const Config& config;

    DatagramLink& link;

    const std::string outputDir;

    std::string fileName;

    std::string path;

    uint32_t totalParts;

    DISALLOW_COPY_AND_ASSIGN(ReceiverSession)
};

#endif /* RECEIVER_SESSION_HH */
