#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <openssl/crypto.h>

#include "enc/crypto.hpp"
#include "util.hpp"
#include "xfer/keyx.hpp"
#include "xfer/wire.hpp"

using namespace sealdrop;

namespace xfer {

int announce_key(stream::ByteStream& s, const enc::KeyPair& kp, Error& err){
  const auto &der = kp.public_der();
  std::vector<uint8_t> msg(1 + 4 + der.size());
  msg[0] = TAG_PUBKEY;
  util::enc::put_be32(msg.data() + 1, static_cast<uint32_t>(der.size()));
  std::memcpy(msg.data() + 5, der.data(), der.size());
  return write_all(s, msg.data(), msg.size(), "write pubkey", err);
}

int accept_session(stream::ByteStream& s, const enc::KeyPair& kp,
                   std::unique_ptr<enc::Session>& out, Error& err){
  std::vector<uint8_t> enc_key;
  int rc = read_tagged(s, TAG_SESSION_KEY, MAX_ENCKEY_LEN, enc_key, "encKey", err);
  if (rc != 0) return rc;

  std::array<uint8_t,enc::NONCE_SIZE> base{};
  rc = read_exact(s, base.data(), base.size(), "read base nonce", err);
  if (rc != 0) return rc;

  std::vector<uint8_t> raw;
  if (kp.decrypt(enc_key.data(), enc_key.size(), raw) != 0)
    return err.set(ERR_AUTH, "rsa-oaep decrypt", 0, "session key does not decrypt under our key");
  if (raw.size() != enc::KEY_SIZE){
    size_t got = raw.size();
    OPENSSL_cleanse(raw.data(), raw.size());
    return err.set(ERR_FRAMING, "rsa-oaep decrypt", 0, "session key is " + std::to_string(got) + " bytes");
  }

  std::array<uint8_t,enc::KEY_SIZE> key{};
  std::memcpy(key.data(), raw.data(), key.size());
  OPENSSL_cleanse(raw.data(), raw.size());
  out.reset(new enc::Session(key, base));
  OPENSSL_cleanse(key.data(), key.size());
  return 0;
}

int await_peer_key(stream::ByteStream& s, std::vector<uint8_t>& pub_der, Error& err){
  return read_tagged(s, TAG_PUBKEY, MAX_PUBKEY_LEN, pub_der, "pubkey", err);
}

int deliver_session(stream::ByteStream& s, const std::vector<uint8_t>& pub_der,
                    std::unique_ptr<enc::Session>& out, Error& err){
  std::array<uint8_t,enc::KEY_SIZE> key{};
  std::array<uint8_t,enc::NONCE_SIZE> base{};
  if (util::enc::fill_rand(key.data(), key.size()) != 0 ||
      util::enc::fill_rand(base.data(), base.size()) != 0)
    return err.set(ERR_CRYPTO, "gen key", errno);

  std::vector<uint8_t> enc_key;
  int rc = enc::rsa_oaep_encrypt(pub_der, key.data(), key.size(), enc_key);
  if (rc != 0){
    OPENSSL_cleanse(key.data(), key.size());
    if (rc == -EBADMSG) return err.set(ERR_FRAMING, "parse pubkey", 0, "not a DER RSA public key");
    return err.set(ERR_CRYPTO, "rsa-oaep encrypt");
  }

  std::vector<uint8_t> msg(1 + 4 + enc_key.size() + base.size());
  msg[0] = TAG_SESSION_KEY;
  util::enc::put_be32(msg.data() + 1, static_cast<uint32_t>(enc_key.size()));
  std::memcpy(msg.data() + 5, enc_key.data(), enc_key.size());
  std::memcpy(msg.data() + 5 + enc_key.size(), base.data(), base.size());

  rc = write_all(s, msg.data(), msg.size(), "write session key", err);
  if (rc == 0) out.reset(new enc::Session(key, base));
  OPENSSL_cleanse(key.data(), key.size());
  return rc;
}

}
