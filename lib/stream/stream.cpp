#include <cstdint>

#include "stream/stream.hpp"

namespace stream {

ssize_t read_full(ByteStream& s, void* buf, size_t n){
  uint8_t *p = static_cast<uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t r = s.read(p+done, n-done);
    if (r < 0) return r;
    if (r == 0) break; // EOF
    done += (size_t)r;
  }
  return (ssize_t)done;
}

}
