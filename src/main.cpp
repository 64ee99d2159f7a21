#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

#include "enc/keypair.hpp"
#include "sealdrop/config.hpp"
#include "sealdrop/error.hpp"
#include "stream/fd_stream.hpp"
#include "xfer/receiver.hpp"
#include "xfer/sender.hpp"

using namespace sealdrop;

static void print_progress(const char* prefix, uint64_t done, uint64_t total){
  double pct = total ? (100.0 * static_cast<double>(done) / static_cast<double>(total)) : 100.0;
  std::fprintf(stderr, "\r%s %6.2f%%  %llu/%llu bytes", prefix, pct,
               (unsigned long long)done, (unsigned long long)total);
  if (done >= total) std::fputc('\n', stderr);
}

static int run_send(const Config& cfg){
  int fd = stream::tcp_connect(cfg.host, cfg.port, cfg.timeout_sec);
  if (fd < 0) {
    std::fprintf(stderr, "[NET] connect %s:%u failed: %s\n", cfg.host.c_str(), cfg.port, std::strerror(-fd));
    return 1;
  }
  stream::FdStream conn(fd);
  if (cfg.timeout_sec > 0 && conn.set_timeout(cfg.timeout_sec) != 0) {
    std::perror("set timeout");
    return 1;
  }

  xfer::Sender::Options opt;
  opt.progress = [](uint64_t d, uint64_t t){ print_progress("Sending", d, t); };
  xfer::Sender sender(conn, opt);
  Error err;
  if (sender.send(cfg.file, err) != 0) {
    std::fprintf(stderr, "send failed: %s\n", err.str().c_str());
    return 1;
  }
  std::printf("sent %s\n", sender.manifest().pretty().c_str());
  return 0;
}

static int run_recv(const Config& cfg){
  struct stat lst{};
  if (lstat(cfg.out_dir.c_str(), &lst) == 0) {
    if (S_ISLNK(lst.st_mode)) {
      std::fprintf(stderr, "Refusing symlink for --out: '%s'\n", cfg.out_dir.c_str());
      return 1;
    }
    if (!S_ISDIR(lst.st_mode)) {
      std::fprintf(stderr, "Invalid --out: '%s' is not a directory\n", cfg.out_dir.c_str());
      return 1;
    }
  }

  // Long-lived key, generated once before any session
  std::fprintf(stderr, "[KEYX] generating RSA-%u key...\n", cfg.rsa_bits);
  auto kp = enc::KeyPair::generate(cfg.rsa_bits);
  if (!kp) return 1;

  int lfd = stream::tcp_listen(cfg.port);
  if (lfd < 0) {
    std::fprintf(stderr, "[NET] listen on %u failed: %s\n", cfg.port, std::strerror(-lfd));
    return 1;
  }
  std::fprintf(stderr, "[NET] listening on port %u, saving into %s\n", cfg.port, cfg.out_dir.c_str());

  int status = 0;
  for (;;) {
    std::string peer;
    int fd = stream::tcp_accept(lfd, &peer);
    if (fd < 0) {
      std::fprintf(stderr, "[NET] accept failed: %s\n", std::strerror(-fd));
      status = 1;
      break;
    }
    std::fprintf(stderr, "[NET] connection from %s\n", peer.c_str());

    stream::FdStream conn(fd);
    if (cfg.timeout_sec > 0 && conn.set_timeout(cfg.timeout_sec) != 0) std::perror("set timeout");

    xfer::Receiver::Options opt;
    opt.out_dir = cfg.out_dir;
    opt.progress = [](uint64_t d, uint64_t t){ print_progress("Receiving", d, t); };
    xfer::Receiver receiver(conn, *kp, opt);
    xfer::Receiver::Result res;
    Error err;
    if (receiver.receive(res, err) != 0) {
      std::fprintf(stderr, "receive failed: %s\n", err.str().c_str());
      status = 1;
    } else {
      std::printf("received %s -> %s\n", res.manifest.pretty().c_str(), res.path.c_str());
      status = 0;
    }
    if (cfg.once) break;
  }
  close(lfd);
  return status;
}

int main(int argc, char* argv[]) {
  Config cfg;
  if (load_env(cfg) != 0) return 1;

  std::string why;
  if (parse_args(argc, argv, cfg, why) != 0) {
    std::fprintf(stderr, "%s\n", why.c_str());
    usage(argv[0]);
    return 1;
  }

  if (cfg.mode == Mode::Send) return run_send(cfg);
  return run_recv(cfg);
}
