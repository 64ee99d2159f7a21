#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

#include "enc/crypto.hpp"
#include "util.hpp"
#include "xfer/keyx.hpp"
#include "xfer/sender.hpp"
#include "xfer/wire.hpp"

using namespace sealdrop;

namespace xfer {

const char* state_name(Sender::State st){
  switch (st){
    case Sender::State::AwaitPeerKey:       return "AwaitPeerKey";
    case Sender::State::SessionEstablished: return "SessionEstablished";
    case Sender::State::ManifestSent:       return "ManifestSent";
    case Sender::State::Streaming:          return "Streaming";
    case Sender::State::Done:               return "Done";
    case Sender::State::Failed:             return "Failed";
  }
  return "?";
}

Sender::Sender(stream::ByteStream& s) : Sender(s, Options{}) {}

Sender::Sender(stream::ByteStream& s, Options opt) : s_(s), opt_(std::move(opt)) {
  if (opt_.chunk_size == 0 || opt_.chunk_size > enc::CHUNK_SIZE) opt_.chunk_size = enc::CHUNK_SIZE;
}

int Sender::fail(int rc){
  std::fprintf(stderr, "[SEND] failed in %s\n", state_name(state_));
  state_ = State::Failed;
  return rc;
}

int Sender::send(const std::string& path, Error& err){
  if (state_ != State::AwaitPeerKey)
    return err.set(ERR_FRAMING, "send", EALREADY, "a sender carries exactly one file");

  // AwaitPeerKey -> SessionEstablished
  std::vector<uint8_t> pub_der;
  int rc = await_peer_key(s_, pub_der, err);
  if (rc == 0) rc = deliver_session(s_, pub_der, session_, err);
  if (rc != 0) return fail(rc);
  state_ = State::SessionEstablished;
  std::fprintf(stderr, "[SEND] session established (peer key %zu bytes)\n", pub_der.size());

  // SessionEstablished -> ManifestSent
  rc = build_manifest(path, man_);
  if (rc != 0) return fail(err.set(ERR_LOCAL_IO, "build manifest", -rc, path));

  std::string json = man_.to_json();
  std::vector<uint8_t> sealed;
  rc = session_->seal(reinterpret_cast<const uint8_t*>(json.data()), json.size(),
                      reinterpret_cast<const uint8_t*>(MANIFEST_AAD), MANIFEST_AAD_LEN, sealed);
  if (rc != 0) return fail(err.set(ERR_CRYPTO, "seal manifest", -rc));
  rc = write_frame(s_, sealed, "manifest", err);
  if (rc != 0) return fail(rc);
  state_ = State::ManifestSent;
  std::fprintf(stderr, "[SEND] manifest %s\n", man_.pretty().c_str());

  // ManifestSent -> Streaming -> Done
  state_ = State::Streaming;
  rc = stream_file(path, err);
  if (rc != 0) return fail(rc);
  state_ = State::Done;
  std::fprintf(stderr, "[SEND] done: %llu bytes in %llu chunks\n",
               (unsigned long long)man_.size, (unsigned long long)chunks_);
  return 0;
}

int Sender::stream_file(const std::string& path, Error& err){
  std::array<uint8_t,enc::HASH_SIZE> aad{};
  if (man_.hash_bytes(aad) != 0) return err.set(ERR_CRYPTO, "decode hash");

  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) return err.set(ERR_LOCAL_IO, "open source", errno, path);

  std::vector<uint8_t> buf(opt_.chunk_size);
  std::vector<uint8_t> sealed;
  uint64_t sent = 0;
  int rc = 0;
  // Exactly man_.size bytes go out, whatever happens to the file meanwhile
  while (sent < man_.size){
    size_t want = static_cast<size_t>(std::min<uint64_t>(opt_.chunk_size, man_.size - sent));
    ssize_t n = util::fs::full_read(fd, buf.data(), want);
    if (n < 0) { rc = err.set(ERR_LOCAL_IO, "read file", errno, path); break; }
    if (static_cast<size_t>(n) != want){
      rc = err.set(ERR_LOCAL_IO, "read file", 0, "source shrank during transfer");
      break;
    }

    rc = session_->seal(buf.data(), want, aad.data(), aad.size(), sealed);
    if (rc != 0) { rc = err.set(ERR_CRYPTO, "seal chunk", -rc); break; }
    rc = write_frame(s_, sealed, "chunk", err);
    if (rc != 0) break;

    sent += want;
    chunks_++;
    if (opt_.progress) opt_.progress(sent, man_.size);
  }
  close(fd);
  return rc;
}

}
