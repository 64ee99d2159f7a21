#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

#include "params.hpp"

struct evp_pkey_st;

namespace enc {

// Receiver-side RSA key pair. Built once before any session starts and
// shared read-only by every Receiver afterwards.
class KeyPair {
public:
  static std::unique_ptr<KeyPair> generate(unsigned bits = RSA_BITS);
  ~KeyPair();

  KeyPair(const KeyPair&) = delete;
  KeyPair& operator=(const KeyPair&) = delete;

  // PKIX / SubjectPublicKeyInfo DER
  const std::vector<uint8_t>& public_der() const { return pub_der_; }
  unsigned bits() const { return bits_; }

  // RSA-OAEP (SHA-256) decrypt. Safe to call from several threads.
  int decrypt(const uint8_t* ct, size_t n, std::vector<uint8_t>& out) const;

private:
  KeyPair(evp_pkey_st* pkey, std::vector<uint8_t> pub_der, unsigned bits);

  evp_pkey_st* pkey_;
  std::vector<uint8_t> pub_der_;
  unsigned bits_;
};

}
