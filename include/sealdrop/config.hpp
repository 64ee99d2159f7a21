#pragma once
#include <cstdint>
#include <string>

namespace sealdrop {

enum class Mode { None, Send, Recv };

struct Config {
  Mode        mode = Mode::None;
  std::string host;              // send
  std::string file;              // send
  uint16_t    port = 8000;
  std::string out_dir = "public"; // recv
  int         timeout_sec = 0;    // 0 = none
  unsigned    rsa_bits = 4096;    // recv
  bool        once = false;       // recv: exit after one transfer
};

// SEALDROP_PORT, SEALDROP_OUT_DIR. 0 or -EINVAL.
int load_env(Config& cfg);

// Flags override the environment. On failure `why` says what was wrong.
int parse_args(int argc, char* argv[], Config& cfg, std::string& why);

void usage(const char* argv0);

}
