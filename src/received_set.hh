#ifndef RECEIVED_SET_HH
#define RECEIVED_SET_HH

#include <cstdint>
#include <mutex>
#include <vector>

#include "common.hh"

/**
 * Receiver-side set of part ids seen on the wire. Sized once from the
 * handshake's part count; inserting an id twice is a no-op.
 */
class ReceivedSet {
  public:
    explicit ReceivedSet(uint32_t totalParts);

    /**
     * \return
     *      True if the id was not present before. Ids outside the transfer
     *      are never inserted.
     */
    bool insert(uint32_t id);

    bool contains(uint32_t id);

    /**
     * Splits a polled id list into the ids present (\p ack) and the ids
     * missing (\p loss). Input order is kept within each list.
     */
    void partition(const std::vector<uint32_t>& ids,
                   std::vector<uint32_t>& ack,
                   std::vector<uint32_t>& loss);

    uint32_t size();

    uint32_t total() const
    {
        return totalParts;
    }

    bool complete()
    {
        return size() == totalParts;
    }

  private:
    std::mutex mutex;

    const uint32_t totalParts;

    std::vector<bool> received;

    uint32_t count;

    DISALLOW_COPY_AND_ASSIGN(ReceivedSet)
};

#endif /* RECEIVED_SET_HH */
