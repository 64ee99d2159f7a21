#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "stream/channel.hpp"

namespace stream {

// In-process MessageChannel pair. Each endpoint owns a delivery worker that
// hands queued messages to its on_message subscriber; the sender's
// buffered amount drops only once the peer's worker delivered the message.
// Messages wait in the inbox until an on_message subscriber is set; an
// on_close subscriber registered after the close still hears about it.
// Closing is graceful: the peer sees close after all earlier messages.
class MemChannel : public MessageChannel {
public:
  struct Options {
    size_t max_message = 64 * 1024;
    std::chrono::microseconds delivery_delay{0};   // per message, simulates a slow link
  };

  using Pair = std::pair<std::shared_ptr<MemChannel>, std::shared_ptr<MemChannel>>;
  static Pair make_pair();
  static Pair make_pair(Options opt);

  ~MemChannel() override;

  int send(const uint8_t* data, size_t n) override;
  uint64_t buffered_amount() const override { return ledger_->buffered.load(); }
  void set_buffered_amount_low_threshold(uint64_t n) override { ledger_->low_threshold = n; }

  void on_message(OnMessage cb) override;
  void on_buffered_amount_low(OnEvent cb) override;
  void on_close(OnEvent cb) override;

  void close() override;

  uint64_t peak_buffered() const { return ledger_->peak.load(); }
  uint64_t max_sent() const { return max_sent_.load(); }

private:
  // Sender-side accounting. Queued items point at it so the delivering
  // worker never needs a reference to the sending endpoint itself.
  struct Ledger {
    std::atomic<uint64_t> buffered{0};
    std::atomic<uint64_t> low_threshold{0};
    std::atomic<uint64_t> peak{0};
    std::mutex mtx;
    OnEvent on_low;

    void drained(size_t n);
  };

  struct Item {
    std::vector<uint8_t> data;
    std::shared_ptr<Ledger> from;
    bool close_marker = false;
  };

  explicit MemChannel(Options opt);

  void start();
  void run();
  void enqueue(Item it);
  void fire_close();

  Options opt_;
  std::weak_ptr<MemChannel> peer_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Item> inbox_;
  bool subscribed_ = false;
  bool stopping_ = false;
  std::thread worker_;

  std::mutex cb_mtx_;
  OnMessage on_message_;
  OnEvent on_close_;

  std::shared_ptr<Ledger> ledger_;
  std::atomic<uint64_t> max_sent_{0};
  std::atomic<bool> closed_{false};
  bool close_fired_ = false;   // guarded by cb_mtx_
};

}
