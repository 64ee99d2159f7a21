#include <array>
#include <cerrno>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/crypto.h>

#include "enc/params.hpp"
#include "enc/crypto.hpp"

namespace enc {

int aesgcm_encrypt(const uint8_t key[KEY_SIZE],
                   const uint8_t nonce[NONCE_SIZE],
                   const uint8_t* pt, size_t pt_len,
                   const uint8_t* aad, size_t aad_len,
                   uint8_t* ct, uint8_t tag[TAG_SIZE]) {
  int ok=-1, outl=0, tmplen=0;
  EVP_CIPHER_CTX* c = EVP_CIPHER_CTX_new();
  if (!c) return -1;
  do {
    if (EVP_EncryptInit_ex(c, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1) break;
    if (EVP_EncryptInit_ex(c, nullptr, nullptr, key, nonce) != 1) break;

    if (aad_len > 0 && EVP_EncryptUpdate(c, nullptr, &tmplen, aad, (int)aad_len) != 1) break;

    if (pt_len > 0 && EVP_EncryptUpdate(c, ct, &outl, pt, (int)pt_len) != 1) break;
    if (EVP_EncryptFinal_ex(c, ct + outl, &tmplen) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_GET_TAG, TAG_SIZE, tag) != 1) break;
    ok = outl + tmplen;
  } while(0);
  EVP_CIPHER_CTX_free(c);
  return (ok == (int)pt_len) ? 0 : -1;
}

int aesgcm_decrypt(const uint8_t key[KEY_SIZE],
                   const uint8_t nonce[NONCE_SIZE],
                   const uint8_t* ct, size_t ct_len,
                   const uint8_t* aad, size_t aad_len,
                   const uint8_t tag[TAG_SIZE],
                   uint8_t* pt) {
  int outl=0, tmplen=0, ok=-1;
  EVP_CIPHER_CTX* c = EVP_CIPHER_CTX_new();
  if (!c) return -1;
  do {
    if (EVP_DecryptInit_ex(c, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1) break;
    if (EVP_DecryptInit_ex(c, nullptr, nullptr, key, nonce) != 1) break;

    if (aad_len > 0 && EVP_DecryptUpdate(c, nullptr, &tmplen, aad, (int)aad_len) != 1) break;

    if (ct_len > 0 && EVP_DecryptUpdate(c, pt, &outl, ct, (int)ct_len) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_GCM_SET_TAG, TAG_SIZE, (void*)tag) != 1) break;     // Verify the tag
    if (EVP_DecryptFinal_ex(c, pt + outl, &tmplen) != 1) break;
    ok = 0;
  } while(0);
  EVP_CIPHER_CTX_free(c);
  return ok;
}

void make_nonce(const std::array<uint8_t,NONCE_SIZE>& base, uint32_t counter, uint8_t out[NONCE_SIZE]){
  std::memcpy(out, base.data(), NONCE_SIZE);
  uint8_t *p = out + (NONCE_SIZE - COUNTER_SIZE);
  p[0] = static_cast<uint8_t>(counter >> 24);
  p[1] = static_cast<uint8_t>(counter >> 16);
  p[2] = static_cast<uint8_t>(counter >> 8);
  p[3] = static_cast<uint8_t>(counter);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1){
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
  }
}

Sha256::~Sha256(){
  EVP_MD_CTX_free(ctx_);
}

int Sha256::update(const void *data, size_t n){
  if (!ctx_) return -1;
  if (n == 0) return 0;
  return EVP_DigestUpdate(ctx_, data, n) == 1 ? 0 : -1;
}

int Sha256::final(std::array<uint8_t,HASH_SIZE> &out){
  if (!ctx_) return -1;
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != HASH_SIZE) return -1;
  return 0;
}

int rsa_oaep_encrypt(const std::vector<uint8_t> &pub_der, const uint8_t *data, size_t n, std::vector<uint8_t> &out){
  const unsigned char *p = pub_der.data();
  EVP_PKEY *pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(pub_der.size()));
  if (!pkey) return -EBADMSG;
  if (EVP_PKEY_get_base_id(pkey) != EVP_PKEY_RSA || p != pub_der.data() + pub_der.size()){
    EVP_PKEY_free(pkey);
    return -EBADMSG;
  }

  int rc = -EIO;
  EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new(pkey, nullptr);
  do {
    if (!pctx) break;
    if (EVP_PKEY_encrypt_init(pctx) <= 0) break;
    if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_OAEP_PADDING) <= 0) break;
    if (EVP_PKEY_CTX_set_rsa_oaep_md(pctx, EVP_sha256()) <= 0) break;
    if (EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) <= 0) break;

    size_t outlen = 0;
    if (EVP_PKEY_encrypt(pctx, nullptr, &outlen, data, n) <= 0) break;
    out.resize(outlen);
    if (EVP_PKEY_encrypt(pctx, out.data(), &outlen, data, n) <= 0) break;
    out.resize(outlen);
    rc = 0;
  } while(0);

  EVP_PKEY_CTX_free(pctx);
  EVP_PKEY_free(pkey);
  return rc;
}

}
