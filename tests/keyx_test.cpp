#include <cassert>
#include <cerrno>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "enc/crypto.hpp"
#include "enc/keypair.hpp"
#include "test_util.hpp"
#include "xfer/keyx.hpp"
#include "xfer/wire.hpp"

using namespace sealdrop;
using testutil::BufStream;

namespace {

void TestHandshakeAgreesOnSession(const enc::KeyPair& kp){
  auto sp = testutil::socket_pair();

  std::unique_ptr<enc::Session> rx;
  int rrc = -1;
  Error rerr;
  std::thread receiver([&]{
    rrc = xfer::announce_key(*sp.b, kp, rerr);
    if (rrc == 0) rrc = xfer::accept_session(*sp.b, kp, rx, rerr);
  });

  std::vector<uint8_t> pub;
  std::unique_ptr<enc::Session> tx;
  Error serr;
  assert(xfer::await_peer_key(*sp.a, pub, serr) == 0);
  assert(pub == kp.public_der());
  assert(xfer::deliver_session(*sp.a, pub, tx, serr) == 0);
  receiver.join();
  assert(rrc == 0);
  assert(rx && tx);
  assert(rx->base() == tx->base());

  std::vector<uint8_t> pt = {'h', 'i'}, sealed, opened;
  const uint8_t aad[] = "manifest";
  assert(tx->seal(pt.data(), pt.size(), aad, 8, sealed) == 0);
  assert(rx->open(sealed.data(), sealed.size(), aad, 8, opened) == 0);
  assert(opened == pt);
}

void TestSessionKeysAreFresh(const enc::KeyPair& kp){
  std::unique_ptr<enc::Session> s1, s2;
  BufStream w1, w2;
  Error err;
  assert(xfer::deliver_session(w1, kp.public_der(), s1, err) == 0);
  assert(xfer::deliver_session(w2, kp.public_der(), s2, err) == 0);
  assert(s1->base() != s2->base());
  assert(w1.out != w2.out);

  // 0x02 | len | encKey | base nonce
  assert(w1.out[0] == xfer::TAG_SESSION_KEY);
  uint32_t len = util::enc::get_be32(w1.out.data() + 1);
  assert(len == kp.bits() / 8);
  assert(w1.out.size() == 1 + 4 + len + enc::NONCE_SIZE);
}

void TestPubkeyBounds(){
  std::vector<uint8_t> pub;

  BufStream zero({xfer::TAG_PUBKEY, 0, 0, 0, 0});
  Error e1;
  assert(xfer::await_peer_key(zero, pub, e1) == ERR_FRAMING);

  std::vector<uint8_t> huge = {xfer::TAG_PUBKEY};
  testutil::append_be32(huge, xfer::MAX_PUBKEY_LEN + 1);
  BufStream h(huge);
  Error e2;
  assert(xfer::await_peer_key(h, pub, e2) == ERR_FRAMING);
  assert(pub.empty());

  BufStream wrong({xfer::TAG_SESSION_KEY, 0, 0, 0, 1, 0});
  Error e3;
  assert(xfer::await_peer_key(wrong, pub, e3) == ERR_FRAMING);
  assert(e3.detail == "expected 0x01, got 0x02");
}

void TestGarbagePubkeyRejected(){
  std::unique_ptr<enc::Session> s;
  BufStream w;
  Error err;
  std::vector<uint8_t> junk = testutil::pattern(300, 4);
  assert(xfer::deliver_session(w, junk, s, err) == ERR_FRAMING);
  assert(err.step == "parse pubkey");
  assert(!s);
  assert(w.out.empty());
}

void TestEncKeyBounds(const enc::KeyPair& kp){
  std::unique_ptr<enc::Session> s;

  BufStream zero({xfer::TAG_SESSION_KEY, 0, 0, 0, 0});
  Error e1;
  assert(xfer::accept_session(zero, kp, s, e1) == ERR_FRAMING);

  std::vector<uint8_t> big = {xfer::TAG_SESSION_KEY};
  testutil::append_be32(big, xfer::MAX_ENCKEY_LEN + 1);
  BufStream b(big);
  Error e2;
  assert(xfer::accept_session(b, kp, s, e2) == ERR_FRAMING);

  // encKey present, base nonce cut short
  std::vector<uint8_t> cut = {xfer::TAG_SESSION_KEY};
  testutil::append_be32(cut, 4);
  cut.insert(cut.end(), {1, 2, 3, 4, 5, 6});
  BufStream c(cut);
  Error e3;
  assert(xfer::accept_session(c, kp, s, e3) == ERR_FRAMING);
  assert(!s);
}

void TestUndecryptableKeyIsAuth(const enc::KeyPair& kp){
  std::vector<uint8_t> msg = {xfer::TAG_SESSION_KEY};
  auto junk = testutil::pattern(kp.bits() / 8, 5);
  testutil::append_be32(msg, static_cast<uint32_t>(junk.size()));
  msg.insert(msg.end(), junk.begin(), junk.end());
  auto base = testutil::pattern(enc::NONCE_SIZE, 6);
  msg.insert(msg.end(), base.begin(), base.end());

  BufStream r(msg);
  std::unique_ptr<enc::Session> s;
  Error err;
  assert(xfer::accept_session(r, kp, s, err) == ERR_AUTH);
  assert(!s);
}

void TestWrongKeySizeIsFraming(const enc::KeyPair& kp){
  std::vector<uint8_t> short_key(16, 0x42), enc_key;
  assert(enc::rsa_oaep_encrypt(kp.public_der(), short_key.data(), short_key.size(), enc_key) == 0);

  std::vector<uint8_t> msg = {xfer::TAG_SESSION_KEY};
  testutil::append_be32(msg, static_cast<uint32_t>(enc_key.size()));
  msg.insert(msg.end(), enc_key.begin(), enc_key.end());
  msg.insert(msg.end(), enc::NONCE_SIZE, 0);

  BufStream r(msg);
  std::unique_ptr<enc::Session> s;
  Error err;
  assert(xfer::accept_session(r, kp, s, err) == ERR_FRAMING);
  assert(!s);
}

void TestKeyFromOtherReceiverFails(const enc::KeyPair& kp){
  auto other = enc::KeyPair::generate(2048);
  assert(other);

  BufStream w;
  std::unique_ptr<enc::Session> tx;
  Error err;
  assert(xfer::deliver_session(w, other->public_der(), tx, err) == 0);

  BufStream r(w.out);
  std::unique_ptr<enc::Session> rx;
  Error err2;
  assert(xfer::accept_session(r, kp, rx, err2) == ERR_AUTH);
}

void TestKeyPairLimits(){
  assert(enc::KeyPair::generate(1024) == nullptr);
}

}  // namespace

int main(){
  auto kp = enc::KeyPair::generate(2048);
  assert(kp);
  assert(kp->bits() == 2048);
  assert(!kp->public_der().empty());

  TestHandshakeAgreesOnSession(*kp);
  TestSessionKeysAreFresh(*kp);
  TestPubkeyBounds();
  TestGarbagePubkeyRejected();
  TestEncKeyBounds(*kp);
  TestUndecryptableKeyIsAuth(*kp);
  TestWrongKeySizeIsFraming(*kp);
  TestKeyFromOtherReceiverFails(*kp);
  TestKeyPairLimits();
  return 0;
}
