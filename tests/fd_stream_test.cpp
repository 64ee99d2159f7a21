#include <arpa/inet.h>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "enc/keypair.hpp"
#include "sealdrop/error.hpp"
#include "stream/fd_stream.hpp"
#include "test_util.hpp"
#include "xfer/receiver.hpp"
#include "xfer/sender.hpp"

using namespace sealdrop;

namespace {

uint16_t bound_port(int lfd){
  struct sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  assert(getsockname(lfd, reinterpret_cast<sockaddr*>(&ss), &len) == 0);
  if (ss.ss_family == AF_INET6) return ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
  return ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
}

void TestSilentPeerTimesOut(const enc::KeyPair& kp, const std::string& dir){
  auto sp = testutil::socket_pair();
  assert(sp.b->set_timeout(1) == 0);

  // the sending end never says anything
  xfer::Receiver::Options ropt;
  ropt.out_dir = dir + "/out_timeout";
  xfer::Receiver r(*sp.b, kp, ropt);
  xfer::Receiver::Result res;
  Error err;
  auto t0 = std::chrono::steady_clock::now();
  assert(r.receive(res, err) == ERR_TRANSPORT);
  auto waited = std::chrono::steady_clock::now() - t0;

  assert(err.sys == EAGAIN || err.sys == EWOULDBLOCK);
  assert(err.step == "read encKey tag");
  assert(r.failed_at() == xfer::Receiver::State::AwaitSession);
  assert(waited >= std::chrono::milliseconds(900));
  assert(!testutil::exists(ropt.out_dir));
}

void TestTimeoutDisabled(){
  auto sp = testutil::socket_pair();
  assert(sp.a->set_timeout(0) == 0);

  char c = 0;
  ssize_t r = -1;
  std::thread reader([&]{ r = sp.a->read(&c, 1); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(sp.b->write("z", 1) == 1);
  reader.join();
  assert(r == 1 && c == 'z');
}

void TestCloseIsIdempotent(){
  auto sp = testutil::socket_pair();
  assert(sp.a->close() == 0);
  assert(sp.a->close() == 0);
  char c;
  assert(sp.b->read(&c, 1) == 0);
  // peer gone: write fails instead of raising SIGPIPE
  ssize_t w = 0;
  for (int i = 0; i < 4 && w >= 0; i++) w = sp.b->write("x", 1);
  assert(w == -EPIPE || w == -ECONNRESET);
}

void TestLoopbackTransfer(const enc::KeyPair& kp, const std::string& dir){
  int lfd = stream::tcp_listen(0);
  assert(lfd >= 0);
  uint16_t port = bound_port(lfd);
  assert(port != 0);

  std::string src = dir + "/over_tcp.bin";
  auto data = testutil::pattern(enc::CHUNK_SIZE + 4321, 41);
  testutil::write_file(src, data);

  int recv_rc = -1;
  Error recv_err;
  std::string peer;
  xfer::Receiver::Result res;
  std::thread rx([&]{
    int fd = stream::tcp_accept(lfd, &peer);
    assert(fd >= 0);
    stream::FdStream conn(fd);
    assert(conn.set_timeout(10) == 0);
    xfer::Receiver::Options ropt;
    ropt.out_dir = dir + "/out_tcp";
    xfer::Receiver r(conn, kp, ropt);
    recv_rc = r.receive(res, recv_err);
  });

  int fd = stream::tcp_connect("127.0.0.1", port, 5);
  assert(fd >= 0);
  int send_rc = -1;
  Error send_err;
  {
    stream::FdStream conn(fd);
    assert(conn.set_timeout(10) == 0);
    xfer::Sender s(conn);
    send_rc = s.send(src, send_err);
  }
  rx.join();
  close(lfd);

  assert(send_rc == 0);
  assert(recv_rc == 0);
  assert(!peer.empty());
  assert(testutil::read_file(res.path) == data);
}

void TestConnectRefused(){
  // grab a free port, then stop listening on it
  int lfd = stream::tcp_listen(0);
  assert(lfd >= 0);
  uint16_t port = bound_port(lfd);
  close(lfd);

  int fd = stream::tcp_connect("127.0.0.1", port, 2);
  assert(fd == -ECONNREFUSED);
}

}  // namespace

int main(){
  auto kp = enc::KeyPair::generate(2048);
  assert(kp);
  std::string dir = testutil::make_temp_dir();

  TestSilentPeerTimesOut(*kp, dir);
  TestTimeoutDisabled();
  TestCloseIsIdempotent();
  TestLoopbackTransfer(*kp, dir);
  TestConnectRefused();

  testutil::remove_tree(dir);
  return 0;
}
