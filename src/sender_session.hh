#ifndef SENDER_SESSION_HH
#define SENDER_SESSION_HH

#include <cstdint>
#include <string>

#include "common.hh"
#include "link.hh"

/**
 * Sends one file over a DatagramLink: handshake, then the transmitter,
 * Sync poller and Ack/Loss processor run until every part is acked.
 */
class SenderSession {
  public:
    SenderSession(const Config& config, DatagramLink& link,
                  const std::string& path);

    /**
     * Runs the whole transfer.
     *
     * \throw TransferError
     *      The receiver never accepted or went silent.
     * \throw unix_error
     *      Reading the file or using the socket failed.
     */
    void run();

    uint64_t retransmissions() const
    {
        return resent;
    }

  private:
    void handshake(const std::string& fileName, uint32_t parts);

    const Config& config;

    DatagramLink& link;

    const std::string path;

    uint64_t resent;

    DISALLOW_COPY_AND_ASSIGN(SenderSession)
};

#endif /* SENDER_SESSION_HH */
