#include <cerrno>
#include <cstdio>

#include "stream/mem_channel.hpp"

namespace stream {

MemChannel::Pair MemChannel::make_pair(){
  return make_pair(Options());
}

MemChannel::Pair MemChannel::make_pair(Options opt){
  std::shared_ptr<MemChannel> a(new MemChannel(opt));
  std::shared_ptr<MemChannel> b(new MemChannel(opt));
  a->peer_ = b;
  b->peer_ = a;
  a->start();
  b->start();
  return {a, b};
}

MemChannel::MemChannel(Options opt) : opt_(opt), ledger_(std::make_shared<Ledger>()) {}

MemChannel::~MemChannel(){
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void MemChannel::start(){
  worker_ = std::thread([this]{ run(); });
}

void MemChannel::run(){
  std::unique_lock<std::mutex> lk(mtx_);
  while (true){
    // Data is held back until someone subscribes; a bare close marker is not
    cv_.wait(lk, [this]{
      return stopping_ || (!inbox_.empty() && (subscribed_ || inbox_.front().close_marker));
    });
    if (stopping_) return;

    Item it = std::move(inbox_.front());
    inbox_.pop_front();
    lk.unlock();

    if (opt_.delivery_delay.count() > 0) std::this_thread::sleep_for(opt_.delivery_delay);

    if (it.close_marker){
      fire_close();
    } else {
      OnMessage cb;
      {
        std::lock_guard<std::mutex> cl(cb_mtx_);
        cb = on_message_;
      }
      if (!cb){
        // unsubscribed meanwhile: keep it for the next subscriber
        lk.lock();
        inbox_.push_front(std::move(it));
        continue;
      }
      size_t n = it.data.size();
      cb(std::move(it.data));
      if (it.from) it.from->drained(n);
    }
    lk.lock();
  }
}

void MemChannel::enqueue(Item it){
  {
    std::lock_guard<std::mutex> lk(mtx_);
    inbox_.push_back(std::move(it));
  }
  cv_.notify_one();
}

void MemChannel::Ledger::drained(size_t n){
  uint64_t prev = buffered.fetch_sub(n);
  uint64_t now = prev - n;
  uint64_t low = low_threshold.load();
  if (prev > low && now <= low){
    OnEvent cb;
    {
      std::lock_guard<std::mutex> lk(mtx);
      cb = on_low;
    }
    if (cb) cb();
  }
}

void MemChannel::fire_close(){
  closed_ = true;
  OnEvent cb;
  {
    std::lock_guard<std::mutex> cl(cb_mtx_);
    if (close_fired_) return;
    close_fired_ = true;
    cb = on_close_;
  }
  if (cb) cb();
}

int MemChannel::send(const uint8_t *data, size_t n){
  if (closed_) return -EPIPE;
  if (n > opt_.max_message){
    std::fprintf(stderr, "[CHAN] message of %zu bytes exceeds limit %zu\n", n, opt_.max_message);
    return -EMSGSIZE;
  }
  auto peer = peer_.lock();
  if (!peer) return -EPIPE;

  uint64_t now = ledger_->buffered.fetch_add(n) + n;
  uint64_t pk = ledger_->peak.load();
  while (now > pk && !ledger_->peak.compare_exchange_weak(pk, now)) {}
  uint64_t mx = max_sent_.load();
  while (n > mx && !max_sent_.compare_exchange_weak(mx, n)) {}

  Item it;
  it.data.assign(data, data + n);
  it.from = ledger_;
  peer->enqueue(std::move(it));
  return 0;
}

void MemChannel::on_message(OnMessage cb){
  bool sub = static_cast<bool>(cb);
  {
    std::lock_guard<std::mutex> cl(cb_mtx_);
    on_message_ = std::move(cb);
  }
  {
    std::lock_guard<std::mutex> lk(mtx_);
    subscribed_ = sub;
  }
  cv_.notify_one();
}

void MemChannel::on_buffered_amount_low(OnEvent cb){
  std::lock_guard<std::mutex> lk(ledger_->mtx);
  ledger_->on_low = std::move(cb);
}

void MemChannel::on_close(OnEvent cb){
  OnEvent late;
  {
    std::lock_guard<std::mutex> cl(cb_mtx_);
    on_close_ = std::move(cb);
    // close already happened before anyone listened
    if (close_fired_) late = on_close_;
  }
  if (late) late();
}

void MemChannel::close(){
  if (closed_.exchange(true)) return;
  if (auto peer = peer_.lock()){
    Item it;
    it.close_marker = true;
    peer->enqueue(std::move(it));
  }
  fire_close();
}

}
