#include <unistd.h>
#include <sys/stat.h>

#include "file_descriptor.hh"
#include "util.hh"

using namespace std;

/* construct from fd number */
FileDescriptor::FileDescriptor( const int fd )
  : fd_( fd )
{}

/* move constructor */
FileDescriptor::FileDescriptor( FileDescriptor && other )
  : fd_( other.fd_ )
{
  /* mark other file descriptor as inactive */
  other.fd_ = -1;
}

/* destructor */
FileDescriptor::~FileDescriptor()
{
  if ( fd_ < 0 ) { /* has already been moved away or closed */
    return;
  }

  /* errors here cannot be reported; close() explicitly to see them */
  ::close( fd_ );
}

void FileDescriptor::close( void )
{
  if ( fd_ < 0 ) {
    return;
  }

  const int fd = fd_;
  fd_ = -1;
  SystemCall( "close", ::close( fd ) );
}

uint64_t FileDescriptor::size( void ) const
{
  struct stat stat_buf;
  SystemCall( "fstat", fstat( fd_num(), &stat_buf ) );
  return stat_buf.st_size;
}

size_t FileDescriptor::read_fully( char * buffer, const size_t length )
{
  size_t total = 0;

  /* a short read is not end of file; keep going until read() returns 0 */
  while ( total < length ) {
    const ssize_t bytes_read = ::read( fd_num(), buffer + total, length - total );
    if ( bytes_read < 0 ) {
      if ( errno == EINTR ) {
        continue;
      }
      throw unix_error( "read" );
    }

    if ( bytes_read == 0 ) {
      break;
    }

    total += bytes_read;
  }

  return total;
}

void FileDescriptor::pwrite_all( const char * buffer, const size_t length, const uint64_t offset )
{
  size_t total = 0;

  while ( total < length ) {
    const ssize_t bytes_written = ::pwrite( fd_num(), buffer + total, length - total,
                                            static_cast<off_t>( offset + total ) );
    if ( bytes_written < 0 ) {
      if ( errno == EINTR ) {
        continue;
      }
      throw unix_error( "pwrite" );
    }

    total += bytes_written;
  }
}
