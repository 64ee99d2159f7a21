#pragma once
#include <cstddef>
#include <sys/types.h>

namespace stream {

// Ordered, reliable, blocking byte stream. The transfer state machines only
// ever see this interface.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  // >0 bytes read, 0 at end of stream, -errno on failure
  virtual ssize_t read(void* buf, size_t n) = 0;

  // Writes all n bytes; returns n or -errno
  virtual ssize_t write(const void* buf, size_t n) = 0;

  // Idempotent; wakes blocked readers and writers
  virtual int close() = 0;
};

// Loops until n bytes arrived or the stream ended. Returns the byte count
// (short only at end of stream) or -errno.
ssize_t read_full(ByteStream& s, void* buf, size_t n);

}
