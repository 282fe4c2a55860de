#include <cerrno>
#include <stdexcept>

#include "link.hh"
#include "log.hh"
#include "util.hh"

namespace {

/**
 * A connected UDP socket reports an earlier ICMP port-unreachable on its
 * next call. The datagram is simply lost; the idle timeout deals with a
 * peer that stays away.
 */
bool
isPeerUnreachable(const unix_error& e)
{
    return e.code().value() == ECONNREFUSED;
}

}

UDPLink::UDPLink(const Address& local)
    : socket()
    , lastSource()
    , connected(false)
{
    socket.set_reuseaddr();
    socket.bind(local);
}

UDPLink::UDPLink(const Address& local, const Address& peer)
    : socket()
    , lastSource()
    , connected(false)
{
    socket.set_reuseaddr();
    socket.bind(local);
    socket.connect(peer);
    connected = true;
}

void
UDPLink::send(const std::string& datagram)
{
    if (connected) {
        try {
            socket.send(datagram);
        } catch (const unix_error& e) {
            if (!isPeerUnreachable(e)) {
                throw;
            }
            logDebug("send dropped, peer unreachable");
        }
    } else if (lastSource) {
        socket.sendto(*lastSource, datagram);
    } else {
        throw std::logic_error("UDPLink: no peer to send to");
    }
}

bool
UDPLink::recv(std::string& datagram, int timeoutMs)
{
    if (!socket.wait_readable(timeoutMs)) {
        return false;
    }
    UDPSocket::received_datagram received;
    try {
        received = socket.recv();
    } catch (const unix_error& e) {
        if (!isPeerUnreachable(e)) {
            throw;
        }
        return false;
    }
    if (!connected) {
        lastSource.reset(new Address(received.source_address));
    }
    datagram.swap(received.payload);
    return true;
}

void
UDPLink::pinPeer()
{
    if (connected || !lastSource) {
        return;
    }
    socket.connect(*lastSource);
    connected = true;
}
