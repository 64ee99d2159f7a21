#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "enc/session.hpp"
#include "sealdrop/error.hpp"
#include "stream/stream.hpp"
#include "xfer/manifest.hpp"

namespace xfer {

using Progress = std::function<void(uint64_t done, uint64_t total)>;

// Sends one file over one stream:
// AwaitPeerKey -> SessionEstablished -> ManifestSent -> Streaming -> Done
class Sender {
public:
  enum class State { AwaitPeerKey, SessionEstablished, ManifestSent, Streaming, Done, Failed };

  struct Options {
    uint32_t chunk_size = enc::CHUNK_SIZE;   // clamped to (0, CHUNK_SIZE]
    Progress progress;
  };

  explicit Sender(stream::ByteStream& s);
  Sender(stream::ByteStream& s, Options opt);

  // 0 or a sealdrop::ErrKind; err describes the failing step.
  int send(const std::string& path, sealdrop::Error& err);

  State state() const { return state_; }
  const Manifest& manifest() const { return man_; }
  uint64_t chunks_sent() const { return chunks_; }

private:
  int fail(int rc);
  int stream_file(const std::string& path, sealdrop::Error& err);

  stream::ByteStream& s_;
  Options opt_;
  State state_ = State::AwaitPeerKey;
  std::unique_ptr<enc::Session> session_;
  Manifest man_;
  uint64_t chunks_ = 0;
};

const char* state_name(Sender::State st);

}
