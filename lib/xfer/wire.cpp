#include <cerrno>
#include <cstdio>

#include "util.hpp"
#include "xfer/wire.hpp"

using sealdrop::ERR_FRAMING;
using sealdrop::ERR_TRANSPORT;

namespace xfer {

int read_exact(stream::ByteStream& s, void* buf, size_t n, const std::string& step, sealdrop::Error& err){
  ssize_t r = stream::read_full(s, buf, n);
  if (r < 0) return err.set(ERR_TRANSPORT, step, static_cast<int>(-r));
  if (static_cast<size_t>(r) != n)
    return err.set(ERR_FRAMING, step, 0, "stream ended after " + std::to_string(r) + " of " + std::to_string(n) + " bytes");
  return 0;
}

int write_all(stream::ByteStream& s, const void* buf, size_t n, const std::string& step, sealdrop::Error& err){
  if (n == 0) return 0;
  ssize_t w = s.write(buf, n);
  if (w < 0) return err.set(ERR_TRANSPORT, step, static_cast<int>(-w));
  if (static_cast<size_t>(w) != n) return err.set(ERR_TRANSPORT, step, EPIPE);
  return 0;
}

int read_frame(stream::ByteStream& s, uint32_t min_len, uint32_t max_len,
               std::vector<uint8_t>& out, const std::string& what, sealdrop::Error& err){
  uint8_t hdr[4];
  int rc = read_exact(s, hdr, sizeof(hdr), "read " + what + " len", err);
  if (rc != 0) return rc;

  uint32_t len = util::enc::get_be32(hdr);
  if (len < min_len || len > max_len)
    return err.set(ERR_FRAMING, "read " + what + " len", 0,
                   "length " + std::to_string(len) + " outside [" + std::to_string(min_len) + ", " + std::to_string(max_len) + "]");

  out.resize(len);
  return read_exact(s, out.data(), len, "read " + what, err);
}

int write_frame(stream::ByteStream& s, const std::vector<uint8_t>& payload, const std::string& what, sealdrop::Error& err){
  uint8_t hdr[4];
  util::enc::put_be32(hdr, static_cast<uint32_t>(payload.size()));
  int rc = write_all(s, hdr, sizeof(hdr), "write " + what + " len", err);
  if (rc != 0) return rc;
  return write_all(s, payload.data(), payload.size(), "write " + what, err);
}

int read_tagged(stream::ByteStream& s, uint8_t tag, uint32_t max_len,
                std::vector<uint8_t>& out, const std::string& what, sealdrop::Error& err){
  uint8_t got = 0;
  int rc = read_exact(s, &got, 1, "read " + what + " tag", err);
  if (rc != 0) return rc;
  if (got != tag){
    char buf[64];
    std::snprintf(buf, sizeof(buf), "expected 0x%02x, got 0x%02x", tag, got);
    return err.set(ERR_FRAMING, "read " + what + " tag", 0, buf);
  }
  return read_frame(s, 1, max_len, out, what, err);
}

}
