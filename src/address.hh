#ifndef ADDRESS_HH
#define ADDRESS_HH

#include <string>
#include <utility>
#include <cstdint>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

/* Address class for IPv4/v6 addresses */
class Address
{
public:
  typedef union {
    sockaddr as_sockaddr;
    sockaddr_storage as_sockaddr_storage;
  } raw;

private:
  socklen_t size_;

  raw addr_;

  /* private constructor given ip/host, service/port, and optional hints */
  Address( const std::string & node, const std::string & service, const addrinfo * hints );

public:
  /* constructors */
  Address();
  Address( const raw & addr, const size_t size );
  Address( const sockaddr & addr, const size_t size );

  /* construct by resolving host name and service name */
  Address( const std::string & hostname, const std::string & service );

  /* construct with numerical IP address and numeral port number */
  Address( const std::string & ip, const uint16_t port );

  /* accessors */
  std::pair<std::string, uint16_t> ip_port( void ) const;

  std::string to_string( void ) const;

  socklen_t size( void ) const { return size_; }
  const sockaddr & to_sockaddr( void ) const;
};

#endif /* ADDRESS_HH */
