#include <cerrno>
#include <cstring>
#include <openssl/crypto.h>

#include "enc/crypto.hpp"
#include "enc/session.hpp"

namespace enc {

static constexpr uint64_t COUNTER_LIMIT = uint64_t{1} << 32;

Session::Session(const std::array<uint8_t,KEY_SIZE> &key, const std::array<uint8_t,NONCE_SIZE> &base)
  : key_(key), base_(base) {}

Session::Session(const std::array<uint8_t,KEY_SIZE> &key, const std::array<uint8_t,NONCE_SIZE> &base, uint64_t start)
  : key_(key), base_(base), next_(start) {}

Session::~Session(){
  OPENSSL_cleanse(key_.data(), key_.size());
  OPENSSL_cleanse(base_.data(), base_.size());
}

int Session::next_nonce(uint8_t out[NONCE_SIZE]){
  // fetch-and-increment is the single point where a counter value is claimed
  uint64_t cur = next_.load();
  do {
    if (cur >= COUNTER_LIMIT) return -ERANGE;
  } while (!next_.compare_exchange_weak(cur, cur + 1));
  make_nonce(base_, static_cast<uint32_t>(cur), out);
  return 0;
}

int Session::seal(const uint8_t *pt, size_t pt_len, const uint8_t *aad, size_t aad_len, std::vector<uint8_t> &out){
  uint8_t nonce[NONCE_SIZE];
  int rc = next_nonce(nonce);
  if (rc != 0) return rc;

  out.resize(pt_len + TAG_SIZE);
  uint8_t *ct = out.data();
  uint8_t *tag = ct + pt_len;
  if (aesgcm_encrypt(key_.data(), nonce, pt, pt_len, aad, aad_len, ct, tag) != 0){
    out.clear();
    return -EIO;
  }
  return 0;
}

int Session::open(const uint8_t *ct, size_t ct_len, const uint8_t *aad, size_t aad_len, std::vector<uint8_t> &out){
  // The counter is consumed even for short input so both sides stay in step
  uint8_t nonce[NONCE_SIZE];
  int rc = next_nonce(nonce);
  if (rc != 0) return rc;
  if (ct_len < TAG_SIZE) return -EBADMSG;

  const size_t plain = ct_len - TAG_SIZE;
  out.resize(plain);
  uint8_t scratch = 0;
  uint8_t *pt = plain ? out.data() : &scratch;
  if (aesgcm_decrypt(key_.data(), nonce, ct, plain, aad, aad_len, ct + plain, pt) != 0){
    OPENSSL_cleanse(out.data(), out.size());
    out.clear();
    return -EBADMSG;
  }
  return 0;
}

}
