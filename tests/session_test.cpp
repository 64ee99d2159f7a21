#include <array>
#include <cassert>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "enc/crypto.hpp"
#include "enc/session.hpp"
#include "util.hpp"

using enc::Session;

namespace {

struct Keys {
  std::array<uint8_t,enc::KEY_SIZE> key{};
  std::array<uint8_t,enc::NONCE_SIZE> base{};
};

Keys fresh_keys(){
  Keys k;
  assert(util::enc::fill_rand(k.key.data(), k.key.size()) == 0);
  assert(util::enc::fill_rand(k.base.data(), k.base.size()) == 0);
  return k;
}

std::vector<uint8_t> bytes(const std::string& s){
  return std::vector<uint8_t>(s.begin(), s.end());
}

const uint8_t kAad[] = "aad";

void TestRoundTripInLockstep(){
  Keys k = fresh_keys();
  Session tx(k.key, k.base), rx(k.key, k.base);

  const char *msgs[] = {"first", "", "third message", "x"};
  for (const char *m : msgs){
    auto pt = bytes(m);
    std::vector<uint8_t> sealed, opened;
    assert(tx.seal(pt.data(), pt.size(), kAad, 3, sealed) == 0);
    assert(sealed.size() == pt.size() + enc::TAG_SIZE);
    assert(rx.open(sealed.data(), sealed.size(), kAad, 3, opened) == 0);
    assert(opened == pt);
  }
  assert(tx.used() == 4);
  assert(rx.used() == 4);
}

void TestTamperedCiphertextFails(){
  Keys k = fresh_keys();
  Session tx(k.key, k.base), rx(k.key, k.base);

  auto pt = bytes("attack at dawn");
  std::vector<uint8_t> sealed, opened;
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, sealed) == 0);
  sealed[2] ^= 0x01;
  assert(rx.open(sealed.data(), sealed.size(), kAad, 3, opened) == -EBADMSG);
  assert(opened.empty());

  // flipped tag byte
  Session tx2(k.key, k.base), rx2(k.key, k.base);
  assert(tx2.seal(pt.data(), pt.size(), kAad, 3, sealed) == 0);
  sealed.back() ^= 0x80;
  assert(rx2.open(sealed.data(), sealed.size(), kAad, 3, opened) == -EBADMSG);
}

void TestWrongAadFails(){
  Keys k = fresh_keys();
  Session tx(k.key, k.base), rx(k.key, k.base);

  auto pt = bytes("payload");
  std::vector<uint8_t> sealed, opened;
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, sealed) == 0);
  const uint8_t other[] = "aaX";
  assert(rx.open(sealed.data(), sealed.size(), other, 3, opened) == -EBADMSG);
}

void TestNonceIsBasePlusCounter(){
  Keys k = fresh_keys();

  uint8_t n[enc::NONCE_SIZE];
  enc::make_nonce(k.base, 0x01020304u, n);
  assert(std::memcmp(n, k.base.data(), enc::NONCE_SIZE - enc::COUNTER_SIZE) == 0);
  assert(n[8] == 0x01 && n[9] == 0x02 && n[10] == 0x03 && n[11] == 0x04);

  // The i-th sealed message opens with the raw primitive under nonce(base, i)
  Session tx(k.key, k.base);
  for (uint32_t i = 0; i < 5; i++){
    std::string m = "message " + std::to_string(i);
    auto pt = bytes(m);
    std::vector<uint8_t> sealed;
    assert(tx.seal(pt.data(), pt.size(), kAad, 3, sealed) == 0);

    uint8_t nonce[enc::NONCE_SIZE];
    enc::make_nonce(k.base, i, nonce);
    std::vector<uint8_t> out(pt.size());
    assert(enc::aesgcm_decrypt(k.key.data(), nonce, sealed.data(), pt.size(), kAad, 3,
                               sealed.data() + pt.size(), out.data()) == 0);
    assert(out == pt);

    // and not under any other counter value
    enc::make_nonce(k.base, i + 1, nonce);
    assert(enc::aesgcm_decrypt(k.key.data(), nonce, sealed.data(), pt.size(), kAad, 3,
                               sealed.data() + pt.size(), out.data()) != 0);
  }
}

void TestSameInputGivesDistinctCiphertexts(){
  Keys k = fresh_keys();
  Session tx(k.key, k.base);
  auto pt = bytes("same bytes every time");
  std::vector<uint8_t> a, b;
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, a) == 0);
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, b) == 0);
  assert(a != b);
}

void TestSkippedFrameDesynchronizes(){
  Keys k = fresh_keys();
  Session tx(k.key, k.base), rx(k.key, k.base);

  auto m0 = bytes("zero"), m1 = bytes("one");
  std::vector<uint8_t> s0, s1, out;
  assert(tx.seal(m0.data(), m0.size(), kAad, 3, s0) == 0);
  assert(tx.seal(m1.data(), m1.size(), kAad, 3, s1) == 0);

  // frame 0 lost: the receiver tries frame 1 under counter 0
  assert(rx.open(s1.data(), s1.size(), kAad, 3, out) == -EBADMSG);
  assert(rx.used() == 1);
}

void TestShortInputConsumesCounter(){
  Keys k = fresh_keys();
  Session tx(k.key, k.base), rx(k.key, k.base);

  uint8_t junk[5] = {1, 2, 3, 4, 5};
  std::vector<uint8_t> out;
  assert(rx.open(junk, sizeof(junk), kAad, 3, out) == -EBADMSG);
  assert(rx.used() == 1);

  // Both sides still agree on counter 1 afterwards
  std::vector<uint8_t> dummy, sealed;
  auto pt = bytes("after");
  assert(tx.seal(pt.data(), 0, kAad, 3, dummy) == 0);
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, sealed) == 0);
  assert(rx.open(sealed.data(), sealed.size(), kAad, 3, out) == 0);
  assert(out == pt);
}

void TestWrongKeyFails(){
  Keys k = fresh_keys();
  Keys other = fresh_keys();
  Session tx(k.key, k.base), rx(other.key, k.base);
  auto pt = bytes("secret");
  std::vector<uint8_t> sealed, out;
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, sealed) == 0);
  assert(rx.open(sealed.data(), sealed.size(), kAad, 3, out) == -EBADMSG);
}

class ResumedSession : public Session {
public:
  ResumedSession(const std::array<uint8_t,enc::KEY_SIZE>& key,
                 const std::array<uint8_t,enc::NONCE_SIZE>& base, uint64_t start)
    : Session(key, base, start) {}
};

void TestCounterExhaustion(){
  Keys k = fresh_keys();
  const uint64_t last = (uint64_t{1} << 32) - 1;
  ResumedSession tx(k.key, k.base, last), rx(k.key, k.base, last);

  // the final counter value is still usable
  auto pt = bytes("last one");
  std::vector<uint8_t> sealed, out;
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, sealed) == 0);
  assert(tx.used() == last + 1);

  uint8_t nonce[enc::NONCE_SIZE];
  enc::make_nonce(k.base, 0xffffffffu, nonce);
  std::vector<uint8_t> raw(pt.size());
  assert(enc::aesgcm_decrypt(k.key.data(), nonce, sealed.data(), pt.size(), kAad, 3,
                             sealed.data() + pt.size(), raw.data()) == 0);
  assert(rx.open(sealed.data(), sealed.size(), kAad, 3, out) == 0);
  assert(out == pt);

  // then both directions refuse instead of wrapping to counter 0
  std::vector<uint8_t> more;
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, more) == -ERANGE);
  assert(tx.seal(pt.data(), pt.size(), kAad, 3, more) == -ERANGE);
  assert(tx.used() == last + 1);
  assert(rx.open(sealed.data(), sealed.size(), kAad, 3, out) == -ERANGE);
  assert(rx.used() == last + 1);
}

void TestConcurrentSealNeverRepeatsNonce(){
  Keys k = fresh_keys();
  Session tx(k.key, k.base);

  const int kThreads = 4, kPer = 500;
  std::vector<std::vector<std::vector<uint8_t>>> out(kThreads);
  std::vector<std::thread> ts;
  for (int t = 0; t < kThreads; t++){
    ts.emplace_back([&, t]{
      uint8_t zero[16] = {0};
      for (int i = 0; i < kPer; i++){
        std::vector<uint8_t> sealed;
        assert(tx.seal(zero, sizeof(zero), kAad, 3, sealed) == 0);
        out[t].push_back(std::move(sealed));
      }
    });
  }
  for (auto &t : ts) t.join();
  assert(tx.used() == static_cast<uint64_t>(kThreads * kPer));

  // identical plaintext under distinct nonces never repeats
  std::set<std::vector<uint8_t>> seen;
  for (auto &v : out)
    for (auto &c : v) assert(seen.insert(c).second);
}

}  // namespace

int main(){
  TestRoundTripInLockstep();
  TestTamperedCiphertextFails();
  TestWrongAadFails();
  TestNonceIsBasePlusCounter();
  TestSameInputGivesDistinctCiphertexts();
  TestSkippedFrameDesynchronizes();
  TestShortInputConsumesCounter();
  TestWrongKeyFails();
  TestConcurrentSealNeverRepeatsNonce();
  TestCounterExhaustion();
  return 0;
}
