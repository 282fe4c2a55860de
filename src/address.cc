#include <memory>
#include <stdexcept>

#include <netdb.h>
#include <arpa/inet.h>

#include "address.hh"
#include "util.hh"

using namespace std;

/* error category for getaddrinfo and getnameinfo */
class gai_error_category : public error_category
{
public:
  const char * name( void ) const noexcept override { return "gai_error_category"; }
  string message( const int return_value ) const noexcept override
  {
    return gai_strerror( return_value );
  }
};

/* private constructor given ip/host, service/port, and optional hints */
Address::Address( const string & node, const string & service, const addrinfo * hints )
  : size_(),
    addr_()
{
  /* prepare for the answer */
  addrinfo *resolved_address;

  /* look up the name or names */
  const int gai_ret = getaddrinfo( node.c_str(), service.c_str(), hints, &resolved_address );
  if ( gai_ret ) {
    static gai_error_category category;
    throw tagged_error( category, "getaddrinfo(" + node + ":" + service + ")", gai_ret );
  }

  /* if success, should always have at least one entry */
  if ( not resolved_address ) {
    throw runtime_error( "getaddrinfo returned successfully but with no results" );
  }

  /* put resolved_address in a wrapper so it will get freed if we have to throw an exception */
  unique_ptr<addrinfo, decltype( freeaddrinfo ) *> wrapped_address( resolved_address, freeaddrinfo );

  /* assign to our private members (making sure size fits) */
  *this = Address( *wrapped_address->ai_addr, wrapped_address->ai_addrlen );
}

/* empty address */
Address::Address()
  : size_(),
    addr_()
{}

/* construct from raw storage */
Address::Address( const raw & addr, const size_t size )
  : Address( addr.as_sockaddr, size )
{}

/* construct from sockaddr */
Address::Address( const sockaddr & addr, const size_t size )
  : size_( size ),
    addr_()
{
  /* make sure proposed sockaddr can fit */
  if ( size > sizeof( addr_ ) ) {
    throw runtime_error( "invalid sockaddr size" );
  }

  memcpy( &addr_, &addr, size );
}

/* make addrinfo hints for UDP-capable resolution */
static addrinfo make_hints( const int ai_flags, const int ai_family )
{
  addrinfo hints;
  zero( hints );
  hints.ai_flags = ai_flags;
  hints.ai_family = ai_family;
  hints.ai_socktype = SOCK_DGRAM;
  return hints;
}

/* construct by resolving host name and service name */
Address::Address( const std::string & hostname, const std::string & service )
  : size_(),
    addr_()
{
  const auto hints = make_hints( AI_ALL, AF_INET );
  *this = Address( hostname, service, &hints );
}

/* construct with numerical IP address and numeral port number */
Address::Address( const std::string & ip, const uint16_t port )
  : size_(),
    addr_()
{
  /* tell getaddrinfo that we don't want to resolve anything */
  const auto hints = make_hints( AI_NUMERICHOST | AI_NUMERICSERV, AF_INET );
  *this = Address( ip, ::to_string( port ), &hints );
}

/* accessors */
pair<string, uint16_t> Address::ip_port( void ) const
{
  char ip[ NI_MAXHOST ], port[ NI_MAXSERV ];

  const int gni_ret = getnameinfo( &to_sockaddr(),
                                   size_,
                                   ip, sizeof( ip ),
                                   port, sizeof( port ),
                                   NI_NUMERICHOST | NI_NUMERICSERV );
  if ( gni_ret ) {
    static gai_error_category category;
    throw tagged_error( category, "getnameinfo", gni_ret );
  }

  return make_pair( ip, stoi( port ) );
}

string Address::to_string( void ) const
{
  const auto ip_and_port = ip_port();
  return ip_and_port.first + ":" + ::to_string( ip_and_port.second );
}

const sockaddr & Address::to_sockaddr( void ) const
{
  return addr_.as_sockaddr;
}
