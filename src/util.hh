#ifndef UTIL_HH
#define UTIL_HH

#include <string>
#include <cerrno>
#include <cstring>
#include <system_error>

/* tagged_error: system_error + name of what was being attempted */
class tagged_error : public std::system_error
{
private:
  std::string attempt_and_error_;

public:
  tagged_error( const std::error_category & category,
                const std::string & s_attempt,
                const int error_code )
    : system_error( error_code, category ),
      attempt_and_error_( s_attempt + ": " + std::system_error::what() )
  {}

  const char * what( void ) const noexcept override
  {
    return attempt_and_error_.c_str();
  }
};

/* unix_error: a tagged_error for syscalls */
class unix_error : public tagged_error
{
public:
  unix_error( const std::string & s_attempt,
              const int s_errno = errno )
    : tagged_error( std::system_category(), s_attempt, s_errno )
  {}
};

/* error-checking wrapper for most syscalls */
template <typename T>
T SystemCall( const std::string & s_attempt, const T return_value )
{
  if ( return_value >= 0 ) {
    return return_value;
  }

  throw unix_error( s_attempt );
}

/* zero out an arbitrary structure */
template <typename T>
void zero( T & x )
{
  memset( &x, 0, sizeof( x ) );
}

#endif /* UTIL_HH */
