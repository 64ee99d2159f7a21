#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "stream/stream.hpp"

namespace stream {

// ByteStream over a connected stream socket (TCP or AF_UNIX). Takes
// ownership of the descriptor.
class FdStream : public ByteStream {
public:
  explicit FdStream(int fd) : fd_(fd) {}
  ~FdStream() override;

  FdStream(const FdStream&) = delete;
  FdStream& operator=(const FdStream&) = delete;

  ssize_t read(void* buf, size_t n) override;
  ssize_t write(const void* buf, size_t n) override;
  int close() override;

  // Connection-level deadline: applied to every blocking send/recv.
  // Expiry surfaces as -EAGAIN from read/write. 0 disables.
  int set_timeout(int seconds);

  int fd() const { return fd_; }

private:
  int fd_;
  std::atomic<bool> closed_{false};
};

// Listening socket on all interfaces; returns fd or -errno
int tcp_listen(uint16_t port, int backlog = 4);
// Blocks for one connection; returns fd or -errno
int tcp_accept(int lfd, std::string* peer = nullptr);
// Resolves host and connects; returns fd or -errno (-EHOSTUNREACH on lookup failure)
int tcp_connect(const std::string& host, uint16_t port, int timeout_sec = 0);

}
