#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <vector>

namespace stream {

// Message-oriented, flow-controlled realtime data channel (the boundary a
// WebRTC-style transport must implement). Callbacks fire on the channel's
// own delivery thread.
class MessageChannel {
public:
  using OnMessage = std::function<void(std::vector<uint8_t>)>;
  using OnEvent   = std::function<void()>;

  virtual ~MessageChannel() = default;

  // Queues one message; 0 or -errno (-EMSGSIZE above the transport limit,
  // -EPIPE once closed)
  virtual int send(const uint8_t* data, size_t n) = 0;

  // Bytes accepted by send() but not yet delivered to the peer
  virtual uint64_t buffered_amount() const = 0;
  virtual void set_buffered_amount_low_threshold(uint64_t n) = 0;

  virtual void on_message(OnMessage cb) = 0;
  virtual void on_buffered_amount_low(OnEvent cb) = 0;
  virtual void on_close(OnEvent cb) = 0;

  virtual void close() = 0;
};

}
