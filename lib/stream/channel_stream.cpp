#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include "stream/channel_stream.hpp"

namespace stream {

ChannelStream::ChannelStream(std::shared_ptr<MessageChannel> ch)
  : ChannelStream(std::move(ch), Options{}) {}

ChannelStream::ChannelStream(std::shared_ptr<MessageChannel> ch, Options opt)
  : ch_(std::move(ch)), st_(std::make_shared<State>()), opt_(opt) {
  if (opt_.fragment == 0) opt_.fragment = Options{}.fragment;
  if (opt_.low_water > opt_.high_water) opt_.low_water = opt_.high_water;

  ch_->set_buffered_amount_low_threshold(opt_.low_water);

  std::weak_ptr<State> w = st_;
  // close first: a close queued behind pending data must find its subscriber
  ch_->on_close([w]{
    auto st = w.lock();
    if (!st) return;
    {
      std::lock_guard<std::mutex> lk(st->mtx);
      st->closed = true;
    }
    st->readable.notify_all();
    st->drained.notify_all();
  });
  ch_->on_buffered_amount_low([w]{
    auto st = w.lock();
    if (!st) return;
    {
      std::lock_guard<std::mutex> lk(st->mtx);
      st->low_signal = true;
    }
    st->drained.notify_all();
  });
  ch_->on_message([w](std::vector<uint8_t> msg){
    auto st = w.lock();
    if (!st || msg.empty()) return;
    {
      std::lock_guard<std::mutex> lk(st->mtx);
      if (st->closed) return;
      st->inbox.push_back(std::move(msg));
    }
    st->readable.notify_one();
  });
}

ChannelStream::~ChannelStream(){
  close();
  ch_->on_message(nullptr);
  ch_->on_buffered_amount_low(nullptr);
  ch_->on_close(nullptr);
}

ssize_t ChannelStream::read(void *buf, size_t n){
  if (n == 0) return 0;
  std::unique_lock<std::mutex> lk(st_->mtx);
  st_->readable.wait(lk, [this]{ return !st_->inbox.empty() || st_->closed; });
  // Queued bytes are still handed out after close; EOF only once drained
  if (st_->inbox.empty()) return 0;

  uint8_t *out = static_cast<uint8_t*>(buf);
  size_t done = 0;
  while (done < n && !st_->inbox.empty()){
    auto &front = st_->inbox.front();
    size_t can = std::min(n - done, front.size() - st_->head_off);
    std::memcpy(out + done, front.data() + st_->head_off, can);
    done += can;
    st_->head_off += can;
    if (st_->head_off == front.size()){
      st_->inbox.pop_front();
      st_->head_off = 0;
    }
  }
  return static_cast<ssize_t>(done);
}

ssize_t ChannelStream::write(const void *buf, size_t n){
  const uint8_t *p = static_cast<const uint8_t*>(buf);
  size_t done = 0;
  while (done < n){
    size_t frag = std::min(opt_.fragment, n - done);

    // Backpressure: wait until the channel drained below the high-water mark
    {
      std::unique_lock<std::mutex> lk(st_->mtx);
      bool stalled = false;
      for (;;){
        if (st_->closed) return -EPIPE;
        if (ch_->buffered_amount() <= opt_.high_water) break;
        stalled = true;
        st_->low_signal = false;
        st_->drained.wait_for(lk, opt_.poll, [this]{ return st_->low_signal || st_->closed; });
      }
      if (stalled) st_->stalls++;
    }

    int rc = ch_->send(p + done, frag);
    if (rc != 0) return rc;
    done += frag;
  }
  return static_cast<ssize_t>(done);
}

int ChannelStream::close(){
  {
    std::lock_guard<std::mutex> lk(st_->mtx);
    if (st_->closed) return 0;
    st_->closed = true;
  }
  st_->readable.notify_all();
  st_->drained.notify_all();
  ch_->close();
  return 0;
}

uint64_t ChannelStream::stalls() const {
  std::lock_guard<std::mutex> lk(st_->mtx);
  return st_->stalls;
}

}
