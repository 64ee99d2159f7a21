#include <cstdio>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/crypto.h>

#include "enc/keypair.hpp"

namespace enc {

std::unique_ptr<KeyPair> KeyPair::generate(unsigned bits){
  if (bits < 2048) {
    std::fprintf(stderr, "[KEYX] refusing RSA key of %u bits\n", bits);
    return nullptr;
  }

  EVP_PKEY *pkey = nullptr;
  EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
  if (!pctx) return nullptr;
  do {
    if (EVP_PKEY_keygen_init(pctx) <= 0) break;
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(pctx, static_cast<int>(bits)) <= 0) break;
    if (EVP_PKEY_keygen(pctx, &pkey) <= 0) { pkey = nullptr; break; }
  } while(0);
  EVP_PKEY_CTX_free(pctx);
  if (!pkey) {
    std::fprintf(stderr, "[KEYX] RSA-%u key generation failed\n", bits);
    return nullptr;
  }

  int len = i2d_PUBKEY(pkey, nullptr);
  if (len <= 0) { EVP_PKEY_free(pkey); return nullptr; }
  std::vector<uint8_t> der(static_cast<size_t>(len));
  unsigned char *p = der.data();
  if (i2d_PUBKEY(pkey, &p) != len) { EVP_PKEY_free(pkey); return nullptr; }

  return std::unique_ptr<KeyPair>(new KeyPair(pkey, std::move(der), bits));
}

KeyPair::KeyPair(evp_pkey_st *pkey, std::vector<uint8_t> pub_der, unsigned bits)
  : pkey_(pkey), pub_der_(std::move(pub_der)), bits_(bits) {}

KeyPair::~KeyPair(){
  EVP_PKEY_free(pkey_);
}

int KeyPair::decrypt(const uint8_t *ct, size_t n, std::vector<uint8_t> &out) const {
  // Each call owns its own ctx; pkey_ itself is never mutated.
  EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new(pkey_, nullptr);
  if (!pctx) return -1;

  int rc = -1;
  do {
    if (EVP_PKEY_decrypt_init(pctx) <= 0) break;
    if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_OAEP_PADDING) <= 0) break;
    if (EVP_PKEY_CTX_set_rsa_oaep_md(pctx, EVP_sha256()) <= 0) break;
    if (EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) <= 0) break;

    size_t outlen = 0;
    if (EVP_PKEY_decrypt(pctx, nullptr, &outlen, ct, n) <= 0) break;
    std::vector<uint8_t> buf(outlen);
    if (EVP_PKEY_decrypt(pctx, buf.data(), &outlen, ct, n) <= 0) {
      OPENSSL_cleanse(buf.data(), buf.size());
      break;
    }
    out.assign(buf.begin(), buf.begin() + static_cast<long>(outlen));
    OPENSSL_cleanse(buf.data(), buf.size());
    rc = 0;
  } while(0);

  EVP_PKEY_CTX_free(pctx);
  return rc;
}

}
