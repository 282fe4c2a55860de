#ifndef SOCKET_HH
#define SOCKET_HH

#include <functional>
#include <string>

#include "address.hh"
#include "file_descriptor.hh"

/* class for network sockets (UDP, TCP, etc.) */
class Socket : public FileDescriptor
{
private:
  /* get the local address the socket is bound to */
  Address get_address( const std::string & name_of_function,
                       const std::function<int(int, sockaddr *, socklen_t *)> & function ) const;

protected:
  /* default constructor */
  Socket( const int domain, const int type );

  /* set socket option */
  template <typename option_type>
  void setsockopt( const int level, const int option, const option_type & option_value );

public:
  /* bind socket to a specified local address (the receiver listens on it) */
  void bind( const Address & address );

  /* connect socket to a specified peer address */
  void connect( const Address & address );

  /* accessors */
  Address local_address( void ) const;

  /* allow local address to be reused sooner, at the cost of some robustness */
  void set_reuseaddr( void );
};

/* UDP socket */
class UDPSocket : public Socket
{
public:
  UDPSocket() : Socket( AF_INET, SOCK_DGRAM ) {}

  struct received_datagram {
    Address source_address;
    std::string payload;
  };

  /* receive datagram and where it came from */
  received_datagram recv( void );

  /* send datagram to specified address */
  void sendto( const Address & peer, const std::string & payload );

  /* send datagram to connected address */
  void send( const std::string & payload );

  /* wait until a datagram is readable; false on timeout */
  bool wait_readable( const int timeout_ms );
};

#endif /* SOCKET_HH */
