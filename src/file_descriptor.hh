#ifndef FILE_DESCRIPTOR_HH
#define FILE_DESCRIPTOR_HH

#include <string>
#include <cstdint>

/* Unix file descriptors (sockets, files, etc.) */
class FileDescriptor
{
private:
  int fd_;

public:
  /* construct from fd number */
  explicit FileDescriptor( const int fd );

  /* move constructor */
  FileDescriptor( FileDescriptor && other );

  /* destructor */
  virtual ~FileDescriptor();

  /* accessors */
  const int & fd_num( void ) const { return fd_; }
  bool is_open( void ) const { return fd_ >= 0; }

  /* close explicitly, reporting errors (the destructor swallows them) */
  void close( void );

  /* size in bytes of the underlying file */
  uint64_t size( void ) const;

  /* read until the buffer is full or end of file; returns bytes read */
  size_t read_fully( char * buffer, const size_t length );

  /* positioned write of the whole buffer */
  void pwrite_all( const char * buffer, const size_t length, const uint64_t offset );

  /* forbid copying FileDescriptor objects or assigning them */
  FileDescriptor( const FileDescriptor & other ) = delete;
  const FileDescriptor & operator=( const FileDescriptor & other ) = delete;
};

#endif /* FILE_DESCRIPTOR_HH */
