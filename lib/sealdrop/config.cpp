#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#include "sealdrop/config.hpp"
#include "util.hpp"

namespace sealdrop {

static bool parse_uint(const std::string& s, unsigned long lo, unsigned long hi, unsigned long& out){
  if (s.empty() || s[0] == '-' || s[0] == '+') return false;
  errno = 0;
  char *end = nullptr;
  unsigned long v = std::strtoul(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || v < lo || v > hi) return false;
  out = v;
  return true;
}

int load_env(Config& cfg){
  if (const char *p = std::getenv("SEALDROP_PORT")){
    unsigned long v;
    if (!parse_uint(p, 1, 65535, v)) {
      std::fprintf(stderr, "[CFG] SEALDROP_PORT invalid: '%s'\n", p);
      return -EINVAL;
    }
    cfg.port = static_cast<uint16_t>(v);
  }
  if (const char *d = std::getenv("SEALDROP_OUT_DIR")){
    if (*d == '\0') {
      std::fprintf(stderr, "[CFG] SEALDROP_OUT_DIR is empty\n");
      return -EINVAL;
    }
    cfg.out_dir = util::rstrip_slash(util::expand_args(d));
  }
  return 0;
}

int parse_args(int argc, char* argv[], Config& cfg, std::string& why){
  if (argc < 2) { why = "missing command"; return -EINVAL; }

  std::string cmd = argv[1];
  if (cmd == "send") cfg.mode = Mode::Send;
  else if (cmd == "recv") cfg.mode = Mode::Recv;
  else { why = "unknown command '" + cmd + "'"; return -EINVAL; }

  std::vector<std::string> positional;
  int i = 2;
  while (i < argc){
    std::string a = argv[i];
    std::string key, val;
    bool has_val = false;

    if (a.rfind("--", 0) != 0) { positional.push_back(a); ++i; continue; }
    size_t eq = a.find('=');
    if (eq != std::string::npos) {
      key = a.substr(2, eq - 2);
      val = a.substr(eq + 1);
      has_val = true;
    } else {
      key = a.substr(2);
    }

    if (cfg.mode == Mode::Send && (key == "out" || key == "rsa-bits" || key == "once")) {
      why = "--" + key + " only applies to recv";
      return -EINVAL;
    }
    if (key == "once") {
      if (has_val) { why = "--once takes no value"; return -EINVAL; }
      cfg.once = true;
      ++i;
      continue;
    }
    if (!has_val){
      if (i + 1 >= argc) { why = "--" + key + " needs a value"; return -EINVAL; }
      val = argv[i + 1];
      i += 2;
    } else {
      ++i;
    }

    unsigned long v;
    if (key == "port") {
      if (!parse_uint(val, 1, 65535, v)) { why = "invalid --port '" + val + "'"; return -EINVAL; }
      cfg.port = static_cast<uint16_t>(v);
    } else if (key == "timeout") {
      if (!parse_uint(val, 0, 86400, v)) { why = "invalid --timeout '" + val + "'"; return -EINVAL; }
      cfg.timeout_sec = static_cast<int>(v);
    } else if (key == "out") {
      if (val.empty()) { why = "empty --out"; return -EINVAL; }
      cfg.out_dir = util::rstrip_slash(util::expand_args(val));
    } else if (key == "rsa-bits") {
      if (!parse_uint(val, 2048, 16384, v)) { why = "invalid --rsa-bits '" + val + "'"; return -EINVAL; }
      cfg.rsa_bits = static_cast<unsigned>(v);
    } else {
      why = "unknown option --" + key;
      return -EINVAL;
    }
  }

  if (cfg.mode == Mode::Send){
    if (positional.size() != 2) { why = "send needs <host> <file>"; return -EINVAL; }
    cfg.host = positional[0];
    cfg.file = util::expand_args(positional[1]);
  } else if (!positional.empty()) {
    why = "unexpected argument '" + positional[0] + "'";
    return -EINVAL;
  }
  return 0;
}

void usage(const char* argv0){
  std::fprintf(stderr,
    "Usage: %s recv [--port N] [--out DIR] [--timeout SEC] [--rsa-bits N] [--once]\n"
    "       %s send <host> <file> [--port N] [--timeout SEC]\n"
    "Environment: SEALDROP_PORT, SEALDROP_OUT_DIR\n", argv0, argv0);
}

}
