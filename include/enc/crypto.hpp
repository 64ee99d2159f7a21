#pragma once
#include <sys/types.h>
#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <vector>

#include "params.hpp"

struct evp_md_ctx_st;

namespace enc {

// AES-256-GCM primitives (bufs may alias)
int aesgcm_encrypt(const uint8_t key[KEY_SIZE],
                   const uint8_t nonce[NONCE_SIZE],
                   const uint8_t* pt, size_t pt_len,
                   const uint8_t* aad, size_t aad_len,
                   uint8_t* ct, uint8_t tag[TAG_SIZE]);

int aesgcm_decrypt(const uint8_t key[KEY_SIZE],
                   const uint8_t nonce[NONCE_SIZE],
                   const uint8_t* ct, size_t ct_len,
                   const uint8_t* aad, size_t aad_len,
                   const uint8_t tag[TAG_SIZE],
                   uint8_t* pt);

// Nonce for message i = base with the low 4 bytes replaced by be32(i)
void make_nonce(const std::array<uint8_t,NONCE_SIZE>& base,
                uint32_t counter,
                uint8_t out[NONCE_SIZE]);

// Streaming SHA-256
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  bool ok() const { return ctx_ != nullptr; }
  int update(const void* data, size_t n);
  int final(std::array<uint8_t,HASH_SIZE>& out);

private:
  evp_md_ctx_st* ctx_;
};

// RSA-OAEP (SHA-256 digest and MGF1) against a DER SubjectPublicKeyInfo.
// -EBADMSG when the DER is not a well-formed RSA public key.
int rsa_oaep_encrypt(const std::vector<uint8_t>& pub_der,
                     const uint8_t* data, size_t n,
                     std::vector<uint8_t>& out);

}
