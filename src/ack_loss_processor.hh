#ifndef ACK_LOSS_PROCESSOR_HH
#define ACK_LOSS_PROCESSOR_HH

#include <atomic>
#include <cstdint>
#include <string>

#include "common.hh"
#include "link.hh"
#include "part_cache.hh"
#include "wire_format.hh"

/**
 * Consumes the receiver's answers to Sync polls. Acked ids leave the
 * PartCache; lost ids are resent verbatim from it (same id, same bytes).
 */
class AckLossProcessor {
  public:
    AckLossProcessor(DatagramLink& link, PartCache& cache);

    /**
     * Applies one message from the receiver. Ids the cache does not know
     * about are logged and skipped.
     */
    void handle(const WireFormat::Message& message);

    /**
     * Decodes and applies one datagram; malformed ones are dropped.
     */
    void handleDatagram(const std::string& datagram);

    /**
     * Receives and handles datagrams until stop() is called.
     *
     * \throw unix_error
     *      Receiving or retransmitting failed.
     */
    void run();

    void stop();

    /**
     * Whether parts are waiting on a receiver that has said nothing for
     * longer than \a limit. Time with nothing in flight is not counted.
     */
    bool receiverSilent(Clock::duration limit);

    uint64_t acknowledged() const
    {
        return acked;
    }

    uint64_t retransmitted() const
    {
        return resent;
    }

  private:
    void onAck(const std::vector<uint32_t>& ids);
    void onLoss(const std::vector<uint32_t>& ids);

    /// How long one recv() may block before stop() is noticed.
    static const int RECV_TIMEOUT_MS = 100;

    DatagramLink& link;

    PartCache& cache;

    std::atomic<bool> stopped;

    std::atomic<Clock::rep> lastHeardTicks;

    std::atomic<uint64_t> acked;

    std::atomic<uint64_t> resent;

    DISALLOW_COPY_AND_ASSIGN(AckLossProcessor)
};

#endif /* ACK_LOSS_PROCESSOR_HH */
