#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "stream/channel.hpp"
#include "stream/stream.hpp"

namespace stream {

// Presents a MessageChannel as an ordered blocking ByteStream.
//  - inbound messages are queued in arrival order and drained by read()
//  - write() fragments and waits while the channel's buffered amount is
//    above the high-water mark
class ChannelStream : public ByteStream {
public:
  struct Options {
    size_t   fragment   = 32 * 1024;
    uint64_t low_water  = 1u << 20;
    uint64_t high_water = 4u << 20;
    std::chrono::milliseconds poll{50};
  };

  explicit ChannelStream(std::shared_ptr<MessageChannel> ch);
  ChannelStream(std::shared_ptr<MessageChannel> ch, Options opt);
  ~ChannelStream() override;

  ChannelStream(const ChannelStream&) = delete;
  ChannelStream& operator=(const ChannelStream&) = delete;

  ssize_t read(void* buf, size_t n) override;
  ssize_t write(const void* buf, size_t n) override;
  int close() override;

  // Number of times write() had to wait for the channel to drain
  uint64_t stalls() const;

private:
  // Shared with the channel callbacks, which may outlive this object.
  struct State {
    std::mutex mtx;
    std::condition_variable readable;
    std::condition_variable drained;
    std::deque<std::vector<uint8_t>> inbox;
    size_t head_off = 0;   // consumed bytes of inbox.front()
    bool closed = false;
    bool low_signal = false;
    uint64_t stalls = 0;
  };

  std::shared_ptr<MessageChannel> ch_;
  std::shared_ptr<State> st_;
  Options opt_;
};

}
