#pragma once
#include <string>

namespace sealdrop {

// Failure classes of a transfer. Negative so they travel through the same
// int return paths as -errno.
enum ErrKind : int {
  ERR_NONE      = 0,
  ERR_TRANSPORT = -1001,  // stream reset, timeout, closed channel
  ERR_FRAMING   = -1002,  // bad tag, length out of bounds, short stream
  ERR_AUTH      = -1003,  // AEAD open failed
  ERR_INTEGRITY = -1004,  // final digest differs from the manifest
  ERR_LOCAL_IO  = -1005,  // source/destination filesystem errors
  ERR_CRYPTO    = -1006,  // RNG, key generation, RSA failures
};

const char* kind_name(int kind);

struct Error {
  int         kind = ERR_NONE;
  int         sys  = 0;   // errno when one applies
  std::string step;
  std::string detail;

  // Fills the record and returns kind so callers can `return err.set(...)`.
  int set(int k, const std::string& s, int e = 0, const std::string& d = {});
  std::string str() const;
};

}
