#include <array>
#include <cerrno>
#include <cstdio>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <vector>
#include <sys/stat.h>

#include "enc/crypto.hpp"
#include "util.hpp"
#include "xfer/keyx.hpp"
#include "xfer/receiver.hpp"
#include "xfer/wire.hpp"

using namespace sealdrop;

namespace xfer {

const char* state_name(Receiver::State st){
  switch (st){
    case Receiver::State::AnnouncingKey: return "AnnouncingKey";
    case Receiver::State::AwaitSession:  return "AwaitSession";
    case Receiver::State::AwaitManifest: return "AwaitManifest";
    case Receiver::State::Receiving:     return "Receiving";
    case Receiver::State::Verifying:     return "Verifying";
    case Receiver::State::Finalized:     return "Finalized";
    case Receiver::State::Failed:        return "Failed";
  }
  return "?";
}

Receiver::Receiver(stream::ByteStream& s, const enc::KeyPair& kp) : Receiver(s, kp, Options{}) {}

Receiver::Receiver(stream::ByteStream& s, const enc::KeyPair& kp, Options opt)
  : s_(s), kp_(kp), opt_(std::move(opt)) {
  opt_.out_dir = util::rstrip_slash(opt_.out_dir);
  if (opt_.out_dir.empty()) opt_.out_dir = ".";
}

int Receiver::fail(int rc){
  std::fprintf(stderr, "[RECV] failed in %s\n", state_name(state_));
  failed_at_ = state_;
  state_ = State::Failed;
  return rc;
}

int Receiver::receive(Result& out, Error& err){
  if (state_ != State::AnnouncingKey)
    return err.set(ERR_FRAMING, "receive", EALREADY, "a receiver carries exactly one file");

  // AnnouncingKey -> AwaitSession
  int rc = announce_key(s_, kp_, err);
  if (rc != 0) return fail(rc);
  state_ = State::AwaitSession;

  // AwaitSession -> AwaitManifest
  rc = accept_session(s_, kp_, session_, err);
  if (rc != 0) return fail(rc);
  state_ = State::AwaitManifest;
  std::fprintf(stderr, "[RECV] session established\n");

  std::vector<uint8_t> frame, plain;
  rc = read_frame(s_, enc::TAG_SIZE, MAX_MANIFEST_FRAME, frame, "manifest", err);
  if (rc != 0) return fail(rc);
  rc = session_->open(frame.data(), frame.size(),
                      reinterpret_cast<const uint8_t*>(MANIFEST_AAD), MANIFEST_AAD_LEN, plain);
  if (rc == -ERANGE) return fail(err.set(ERR_CRYPTO, "decrypt manifest", ERANGE, "nonce counter exhausted"));
  if (rc != 0) return fail(err.set(ERR_AUTH, "decrypt manifest", -rc));
  if (Manifest::from_json(std::string(plain.begin(), plain.end()), man_) != 0)
    return fail(err.set(ERR_FRAMING, "decode manifest", 0, "malformed or unsafe manifest"));
  std::fprintf(stderr, "[RECV] manifest %s\n", man_.pretty().c_str());

  // AwaitManifest -> Receiving
  rc = util::fs::make_dirs(opt_.out_dir);
  if (rc != 0) return fail(err.set(ERR_LOCAL_IO, "mkdir output dir", -rc, opt_.out_dir));
  int dirfd = util::fs::open_dir(opt_.out_dir);
  if (dirfd < 0) return fail(err.set(ERR_LOCAL_IO, "open output dir", -dirfd, opt_.out_dir));

  const std::string part = man_.name + ".part";
  bool created = false;
  state_ = State::Receiving;
  rc = receive_body(dirfd, part, created, err);
  if (rc != 0){
    // only remove what this receiver opened itself
    if (created) unlinkat(dirfd, part.c_str(), 0);
    close(dirfd);
    return fail(rc);
  }

  // Verifying -> Finalized: the only point the real name appears
  if (renameat(dirfd, part.c_str(), dirfd, man_.name.c_str()) == -1){
    int e = errno;
    unlinkat(dirfd, part.c_str(), 0);
    close(dirfd);
    return fail(err.set(ERR_LOCAL_IO, "finalize file", e, man_.name));
  }
  close(dirfd);
  state_ = State::Finalized;

  out.manifest = man_;
  out.path = opt_.out_dir + "/" + man_.name;
  std::fprintf(stderr, "[RECV] saved %s\n", out.path.c_str());
  return 0;
}

int Receiver::receive_body(int dirfd, const std::string& part, bool& created, Error& err){
  std::array<uint8_t,enc::HASH_SIZE> aad{};
  if (man_.hash_bytes(aad) != 0) return err.set(ERR_FRAMING, "decode hash");

  int fd = openat(dirfd, part.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, 0644);
  if (fd == -1) return err.set(ERR_LOCAL_IO, "create file", errno, part);
  created = true;

  enc::Sha256 h;
  if (!h.ok()) { close(fd); return err.set(ERR_CRYPTO, "sha256 init"); }

  std::vector<uint8_t> frame, plain;
  uint64_t written = 0;
  int rc = 0;
  while (written < man_.size){
    rc = read_frame(s_, enc::TAG_SIZE + 1, MAX_CHUNK_FRAME, frame, "chunk", err);
    if (rc != 0) break;

    rc = session_->open(frame.data(), frame.size(), aad.data(), aad.size(), plain);
    if (rc == -ERANGE) { rc = err.set(ERR_CRYPTO, "decrypt chunk", ERANGE, "nonce counter exhausted"); break; }
    if (rc != 0) { rc = err.set(ERR_AUTH, "decrypt chunk", -rc, "chunk " + std::to_string(chunks_)); break; }
    if (plain.size() > man_.size - written){
      rc = err.set(ERR_FRAMING, "read chunk", 0, "chunk runs past declared size " + std::to_string(man_.size));
      break;
    }

    if (util::fs::full_write(fd, plain.data(), plain.size()) != static_cast<ssize_t>(plain.size())){
      rc = err.set(ERR_LOCAL_IO, "write file", errno ? errno : EIO, part);
      break;
    }
    if (h.update(plain.data(), plain.size()) != 0) { rc = err.set(ERR_CRYPTO, "sha256 update"); break; }
    written += plain.size();
    chunks_++;
    if (opt_.progress) opt_.progress(written, man_.size);
  }

  if (rc != 0){
    close(fd);
    return rc;
  }

  // Receiving -> Verifying
  state_ = State::Verifying;
  int se = (fsync(fd) == -1) ? errno : 0;
  if (close(fd) == -1 && se == 0) se = errno;
  if (se != 0) return err.set(ERR_LOCAL_IO, "close output", se, part);

  std::array<uint8_t,enc::HASH_SIZE> digest{};
  if (h.final(digest) != 0) return err.set(ERR_CRYPTO, "sha256 final");
  std::string calc = util::enc::to_hex(digest.data(), digest.size());
  if (calc != man_.hash){
    std::fprintf(stderr, "[RECV] integrity FAILED for %s (expected %s, got %s)\n",
                 man_.name.c_str(), man_.hash.c_str(), calc.c_str());
    return err.set(ERR_INTEGRITY, "verify hash", 0, "expected " + man_.hash + ", got " + calc);
  }
  return 0;
}

}
