#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>

#include "stream/fd_stream.hpp"

namespace stream {

FdStream::~FdStream(){
  close();
}

ssize_t FdStream::read(void *buf, size_t n){
  if (n == 0) return 0;
  for (;;){
    ssize_t r = recv(fd_, buf, n, 0);
    if (r < 0){
      if (errno == EINTR) continue;
      return -errno;
    }
    return r;
  }
}

ssize_t FdStream::write(const void *buf, size_t n){
  const uint8_t *p = static_cast<const uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t w = send(fd_, p+done, n-done, MSG_NOSIGNAL);
    if (w < 0){
      if (errno == EINTR) continue;
      return -errno;
    }
    if (w == 0) return -EPIPE;
    done += (size_t)w;
  }
  return (ssize_t)done;
}

int FdStream::close(){
  if (closed_.exchange(true)) return 0;
  // shutdown first so a thread blocked in recv() on this fd returns
  shutdown(fd_, SHUT_RDWR);
  return ::close(fd_) == -1 ? -errno : 0;
}

int FdStream::set_timeout(int seconds){
  struct timeval tv{};
  tv.tv_sec = seconds;
  if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) return -errno;
  if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == -1) return -errno;
  return 0;
}

int tcp_listen(uint16_t port, int backlog){
  int fd = socket(AF_INET6, SOCK_STREAM | SOCK_CLOEXEC, 0);
  bool v6 = fd != -1;
  if (!v6) fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd == -1) return -errno;

  int one = 1, zero = 0;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == -1 ||
      (v6 && setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &zero, sizeof(zero)) == -1)){
    int e = errno;
    ::close(fd);
    return -e;
  }

  int rc;
  if (v6){
    struct sockaddr_in6 a{};
    a.sin6_family = AF_INET6;
    a.sin6_addr = in6addr_any;
    a.sin6_port = htons(port);
    rc = bind(fd, reinterpret_cast<sockaddr*>(&a), sizeof(a));
  } else {
    struct sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_addr.s_addr = htonl(INADDR_ANY);
    a.sin_port = htons(port);
    rc = bind(fd, reinterpret_cast<sockaddr*>(&a), sizeof(a));
  }
  if (rc == -1 || listen(fd, backlog) == -1){
    int e = errno;
    ::close(fd);
    return -e;
  }
  return fd;
}

int tcp_accept(int lfd, std::string *peer){
  struct sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  int fd;
  do {
    fd = accept4(lfd, reinterpret_cast<sockaddr*>(&ss), &len, SOCK_CLOEXEC);
  } while (fd == -1 && errno == EINTR);
  if (fd == -1) return -errno;

  if (peer){
    char host[NI_MAXHOST] = {0};
    char serv[NI_MAXSERV] = {0};
    if (getnameinfo(reinterpret_cast<sockaddr*>(&ss), len, host, sizeof(host), serv, sizeof(serv),
                    NI_NUMERICHOST | NI_NUMERICSERV) == 0)
      *peer = std::string(host) + ":" + serv;
  }
  int one = 1;
  if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) == -1)
    std::fprintf(stderr, "[NET] TCP_NODELAY: %s\n", std::strerror(errno));
  return fd;
}

static int connect_with_timeout(int fd, const sockaddr *sa, socklen_t len, int timeout_sec){
  if (timeout_sec <= 0)
    return connect(fd, sa, len) == -1 ? -errno : 0;

  int fl = fcntl(fd, F_GETFL);
  if (fl == -1 || fcntl(fd, F_SETFL, fl | O_NONBLOCK) == -1) return -errno;

  int rc = 0;
  if (connect(fd, sa, len) == -1){
    if (errno != EINPROGRESS){
      rc = -errno;
    } else {
      struct pollfd pfd{fd, POLLOUT, 0};
      int pr;
      do { pr = poll(&pfd, 1, timeout_sec * 1000); } while (pr == -1 && errno == EINTR);
      if (pr == 0) rc = -ETIMEDOUT;
      else if (pr < 0) rc = -errno;
      else {
        int soerr = 0;
        socklen_t sl = sizeof(soerr);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &sl) == -1) rc = -errno;
        else if (soerr != 0) rc = -soerr;
      }
    }
  }
  if (fcntl(fd, F_SETFL, fl) == -1 && rc == 0) rc = -errno;
  return rc;
}

int tcp_connect(const std::string& host, uint16_t port, int timeout_sec){
  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo *res = nullptr;
  std::string svc = std::to_string(port);
  int gai = getaddrinfo(host.c_str(), svc.c_str(), &hints, &res);
  if (gai != 0){
    std::fprintf(stderr, "[NET] resolve %s failed: %s\n", host.c_str(), gai_strerror(gai));
    return -EHOSTUNREACH;
  }

  int last = -ECONNREFUSED;
  for (auto *ai = res; ai; ai = ai->ai_next){
    int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd == -1) { last = -errno; continue; }
    int rc = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout_sec);
    if (rc == 0){
      int one = 1;
      if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) == -1)
        std::fprintf(stderr, "[NET] TCP_NODELAY: %s\n", std::strerror(errno));
      freeaddrinfo(res);
      return fd;
    }
    last = rc;
    ::close(fd);
  }
  freeaddrinfo(res);
  return last;
}

}
