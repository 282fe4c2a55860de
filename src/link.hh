#ifndef LINK_HH
#define LINK_HH

#include <memory>
#include <string>

#include "common.hh"
#include "socket.hh"

/**
 * The two primitives the transfer engine needs from the network: send a
 * datagram to the peer, and wait a bounded time for one from it.
 */
class DatagramLink {
  public:
    virtual ~DatagramLink() = default;

    /**
     * Sends one datagram to the peer.
     *
     * \throw unix_error
     *      The underlying send failed.
     */
    virtual void send(const std::string& datagram) = 0;

    /**
     * Waits up to timeoutMs (forever if negative) for one datagram.
     *
     * \return
     *      True and the datagram in \p datagram, or false on timeout.
     */
    virtual bool recv(std::string& datagram, int timeoutMs) = 0;

    /**
     * From now on, talk only to whoever sent the last datagram. Called
     * before the link is shared between threads.
     */
    virtual void pinPeer() {}
};

/**
 * DatagramLink over a UDP socket. Until a peer is known (either connected
 * up front or pinned after a datagram), replies go to the last source.
 */
class UDPLink : public DatagramLink {
  public:
    /**
     * Receiver side: bound to a well-known port, peer learned later.
     */
    explicit UDPLink(const Address& local);

    /**
     * Sender side: bound locally and connected to the receiver.
     */
    UDPLink(const Address& local, const Address& peer);

    void send(const std::string& datagram) override;
    bool recv(std::string& datagram, int timeoutMs) override;
    void pinPeer() override;

    Address localAddress() const
    {
        return socket.local_address();
    }

  private:
    UDPSocket socket;

    /// Source of the last datagram, used while not connected.
    std::unique_ptr<Address> lastSource;

    bool connected;

    DISALLOW_COPY_AND_ASSIGN(UDPLink)
};

#endif /* LINK_HH */
