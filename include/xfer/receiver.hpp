#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "enc/keypair.hpp"
#include "enc/session.hpp"
#include "sealdrop/error.hpp"
#include "stream/stream.hpp"
#include "xfer/manifest.hpp"
#include "xfer/sender.hpp"

namespace xfer {

// Receives one file from one stream into out_dir. Output is written to
// <out_dir>/<name>.part and renamed to <out_dir>/<name> only after the
// SHA-256 of everything received matches the manifest; on any failure the
// .part file is removed.
class Receiver {
public:
  enum class State { AnnouncingKey, AwaitSession, AwaitManifest, Receiving, Verifying, Finalized, Failed };

  struct Options {
    std::string out_dir = "public";
    Progress progress;
  };

  struct Result {
    Manifest manifest;
    std::string path;
  };

  Receiver(stream::ByteStream& s, const enc::KeyPair& kp);
  Receiver(stream::ByteStream& s, const enc::KeyPair& kp, Options opt);

  int receive(Result& out, sealdrop::Error& err);

  State state() const { return state_; }
  // State the receiver was in when it failed
  State failed_at() const { return failed_at_; }
  uint64_t chunks_received() const { return chunks_; }

private:
  int fail(int rc);
  int receive_body(int dirfd, const std::string& part, bool& created, sealdrop::Error& err);

  stream::ByteStream& s_;
  const enc::KeyPair& kp_;
  Options opt_;
  State state_ = State::AnnouncingKey;
  State failed_at_ = State::AnnouncingKey;
  std::unique_ptr<enc::Session> session_;
  Manifest man_;
  uint64_t chunks_ = 0;
};

const char* state_name(Receiver::State st);

}
