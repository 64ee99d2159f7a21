#pragma once
#include <cstdint>
#include <array>
#include <string>

#include "enc/params.hpp"

namespace xfer {

// Immutable description of one outgoing file.
struct Manifest {
  std::string name;   // final path component only
  uint64_t    size = 0;
  std::string hash;   // lowercase hex SHA-256 of exactly `size` bytes

  std::string to_json() const;
  // Rejects anything but {"name": plain name, "size": uint, "hash": 64 hex}.
  static int from_json(const std::string& text, Manifest& out);

  int hash_bytes(std::array<uint8_t,enc::HASH_SIZE>& out) const;
  std::string pretty() const;
};

// Single streaming pass over the file: size and SHA-256. 0 or -errno.
int build_manifest(const std::string& path, Manifest& out);

}
