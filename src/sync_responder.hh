#ifndef SYNC_RESPONDER_HH
#define SYNC_RESPONDER_HH

#include <cstdint>
#include <vector>

#include "channel.hh"
#include "common.hh"
#include "link.hh"
#include "received_set.hh"

/**
 * Answers the sender's Sync polls: ids already received are acked, the
 * rest are reported lost. A part reported lost may still be in flight;
 * that only costs one redundant retransmission.
 */
class SyncResponder {
  public:
    SyncResponder(const Config& config, DatagramLink& link,
                  ReceivedSet& received);

    /**
     * Sends Ack frames for the received subset of \p ids and Loss frames
     * for the rest. An empty subset produces no frame.
     */
    void respond(const std::vector<uint32_t>& ids);

    /**
     * Responds to every id list popped from \p syncs until it is closed.
     */
    void run(Channel<std::vector<uint32_t>>& syncs);

    uint64_t lossesReported() const
    {
        return losses;
    }

  private:
    const Config& config;

    DatagramLink& link;

    ReceivedSet& received;

    /// Only touched by the responder thread.
    uint64_t losses;

    DISALLOW_COPY_AND_ASSIGN(SyncResponder)
};

#endif /* SYNC_RESPONDER_HH */
