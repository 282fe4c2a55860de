#include <stdexcept>

#include <poll.h>
#include <sys/socket.h>

#include "socket.hh"
#include "util.hh"

using namespace std;

/* default constructor for socket of (subclassed) domain and type */
Socket::Socket( const int domain, const int type )
  : FileDescriptor( SystemCall( "socket", socket( domain, type, 0 ) ) )
{}

/* get the local address the socket is bound to */
Address Socket::get_address( const std::string & name_of_function,
                             const std::function<int(int, sockaddr *, socklen_t *)> & function ) const
{
  Address::raw address;
  socklen_t size = sizeof( address );

  SystemCall( name_of_function, function( fd_num(),
                                          &address.as_sockaddr,
                                          &size ) );

  return Address( address, size );
}

Address Socket::local_address( void ) const
{
  return get_address( "getsockname", getsockname );
}

/* bind socket to a specified local address (the receiver listens on it) */
void Socket::bind( const Address & address )
{
  SystemCall( "bind", ::bind( fd_num(),
                              &address.to_sockaddr(),
                              address.size() ) );
}

/* connect socket to a specified peer address */
void Socket::connect( const Address & address )
{
  SystemCall( "connect", ::connect( fd_num(),
                                    &address.to_sockaddr(),
                                    address.size() ) );
}

/* receive datagram and where it came from */
UDPSocket::received_datagram UDPSocket::recv( void )
{
  static const ssize_t RECEIVE_MTU = 65536;

  /* receive source address and payload */
  Address::raw datagram_source_address;
  msghdr header; zero( header );
  iovec msg_iovec; zero( msg_iovec );

  char msg_payload[ RECEIVE_MTU ];

  /* prepare to get the source address */
  header.msg_name = &datagram_source_address;
  header.msg_namelen = sizeof( datagram_source_address );

  /* prepare to get the payload */
  msg_iovec.iov_base = msg_payload;
  msg_iovec.iov_len = sizeof( msg_payload );
  header.msg_iov = &msg_iovec;
  header.msg_iovlen = 1;

  /* call recvmsg */
  const ssize_t recv_len = SystemCall( "recvmsg", recvmsg( fd_num(), &header, 0 ) );

  /* make sure we got the whole datagram */
  if ( header.msg_flags & MSG_TRUNC ) {
    throw runtime_error( "recvfrom (oversized datagram)" );
  } else if ( header.msg_flags ) {
    throw runtime_error( "recvfrom (unhandled flag)" );
  }

  received_datagram ret = { Address( datagram_source_address,
                                     header.msg_namelen ),
                            string( msg_payload, recv_len ) };

  return ret;
}

/* send datagram to specified address */
void UDPSocket::sendto( const Address & destination, const string & payload )
{
  const ssize_t bytes_sent =
    SystemCall( "sendto", ::sendto( fd_num(),
                                    payload.data(),
                                    payload.size(),
                                    0,
                                    &destination.to_sockaddr(),
                                    destination.size() ) );

  if ( size_t( bytes_sent ) != payload.size() ) {
    throw runtime_error( "datagram payload too big for sendto()" );
  }
}

/* send datagram to connected address */
void UDPSocket::send( const string & payload )
{
  const ssize_t bytes_sent =
    SystemCall( "send", ::send( fd_num(),
                                payload.data(),
                                payload.size(),
                                0 ) );

  if ( size_t( bytes_sent ) != payload.size() ) {
    throw runtime_error( "datagram payload too big for send()" );
  }
}

/* wait until a datagram is readable */
bool UDPSocket::wait_readable( const int timeout_ms )
{
  struct pollfd ufds { fd_num(), POLLIN, 0 };

  while ( true ) {
    const int rv = ::poll( &ufds, 1, timeout_ms );
    if ( rv < 0 and errno == EINTR ) {
      continue;
    }
    SystemCall( "poll", rv );
    return rv > 0;
  }
}

/* set socket option */
template <typename option_type>
void Socket::setsockopt( const int level, const int option, const option_type & option_value )
{
  SystemCall( "setsockopt", ::setsockopt( fd_num(), level, option,
                                          &option_value, sizeof( option_value ) ) );
}

/* allow local address to be reused sooner, at the cost of some robustness */
void Socket::set_reuseaddr( void )
{
  setsockopt( SOL_SOCKET, SO_REUSEADDR, int( true ) );
}
