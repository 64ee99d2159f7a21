#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

#include "params.hpp"

namespace enc {

// One AES-256-GCM session per file. Every seal/open consumes the next
// counter value; nonce = base[0..8) || be32(counter).
class Session {
public:
  Session(const std::array<uint8_t,KEY_SIZE>& key,
          const std::array<uint8_t,NONCE_SIZE>& base);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // out = ciphertext || tag
  int seal(const uint8_t* pt, size_t pt_len,
           const uint8_t* aad, size_t aad_len,
           std::vector<uint8_t>& out);

  // Returns -EBADMSG when the tag does not verify.
  int open(const uint8_t* ct, size_t ct_len,
           const uint8_t* aad, size_t aad_len,
           std::vector<uint8_t>& out);

  // Number of counter values consumed so far
  uint64_t used() const { return next_.load(); }
  const std::array<uint8_t,NONCE_SIZE>& base() const { return base_; }

protected:
  // Resumes the counter at `start`; lets tests reach the end of the range.
  Session(const std::array<uint8_t,KEY_SIZE>& key,
          const std::array<uint8_t,NONCE_SIZE>& base,
          uint64_t start);

private:
  // Claims the next counter value and writes its nonce. -ERANGE once exhausted.
  int next_nonce(uint8_t out[NONCE_SIZE]);

  std::array<uint8_t,KEY_SIZE>   key_;
  std::array<uint8_t,NONCE_SIZE> base_;
  std::atomic<uint64_t>          next_{0};
};

}
