#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <pwd.h>
#include <sys/random.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>
#include <cstring>

#include "util.hpp"


namespace util {

std::string expand_args(const std::string& path) {
  if (path.empty() || path[0] != '~') return path;

  if (path.size() == 1 || path[1] == '/') {
      const char* h = std::getenv("HOME");
      if (!h) {
          if (auto* pw = getpwuid(getuid())) h = pw->pw_dir;
      }
      return (h ? std::string(h) : std::string()) + path.substr(1);
  }

  size_t slash = path.find('/');
  std::string user = path.substr(1, (slash == std::string::npos ? std::string::npos : slash - 1));
  if (auto* pw = getpwnam(user.c_str())) {
      std::string home = pw->pw_dir;
      return home + (slash == std::string::npos ? "" : path.substr(slash));
  }
  return path;
}

std::string rstrip_slash(std::string p) {
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

std::string base_name(const std::string& path){
  size_t i = path.find_last_of("/\\");
  return (i == std::string::npos) ? path : path.substr(i + 1);
}

bool is_plain_name(const std::string& name){
  if (name.empty() || name == "." || name == "..") return false;
  return name.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

}

namespace util::fs {

ssize_t full_read(int fd, void *buf, size_t n){
  uint8_t *p = static_cast<uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t r = read(fd, p+done, n-done);
    if (r < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (r == 0) break; // EOF
    done += (size_t)r;
  }
  return (ssize_t)done;
}

ssize_t full_write(int fd, const void *buf, size_t n){
  const uint8_t *p = static_cast<const uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t w = write(fd, p+done, n-done);
    if (w < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (w == 0) break;
    done += (size_t)w;
  }
  return (ssize_t)done;
}

int make_dirs(const std::string& path, mode_t mode){
  if (path.empty()) return -EINVAL;
  std::string cur;
  size_t pos = 0;
  while (pos <= path.size()){
    size_t next = path.find('/', pos);
    if (next == std::string::npos) next = path.size();
    cur = path.substr(0, next);
    pos = next + 1;
    if (cur.empty() || cur == "." || cur == "..") continue;  // leading '/' or relative prefix

    if (mkdir(cur.c_str(), mode) == -1){
      if (errno != EEXIST) return -errno;
      struct stat st{};
      if (stat(cur.c_str(), &st) == -1) return -errno;
      if (!S_ISDIR(st.st_mode)) return -ENOTDIR;
    }
  }
  return 0;
}

int open_dir(const std::string& path){
  int fd = open(path.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC);
  return fd == -1 ? -errno : fd;
}

}

namespace util::enc {

int fill_rand(void *p, size_t n){
  uint8_t *out = static_cast<uint8_t*>(p);
  size_t off = 0;
  while(off < n){
    ssize_t m = getrandom(out + off, n - off, 0);
    if (m < 0){
      if (errno == EINTR) continue;
      return -1;
    }
    off += static_cast<size_t>(m);
  }
  return 0;
}

uint32_t htobe_u32(uint32_t x){
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return __builtin_bswap32(x);
#else
  return x;
#endif

}

uint32_t be32toh_u32(uint32_t x){
  return htobe_u32(x);
}

void put_be32(uint8_t out[4], uint32_t v){
  uint32_t be = htobe_u32(v);
  std::memcpy(out, &be, 4);
}

uint32_t get_be32(const uint8_t in[4]){
  uint32_t be;
  std::memcpy(&be, in, 4);
  return be32toh_u32(be);
}

std::string to_hex(const uint8_t *p, size_t n){
  static const char digits[] = "0123456789abcdef";
  std::string s(n * 2, '0');
  for (size_t i = 0; i < n; i++){
    s[2*i]   = digits[p[i] >> 4];
    s[2*i+1] = digits[p[i] & 0x0f];
  }
  return s;
}

int from_hex(const std::string& hex, std::vector<uint8_t>& out){
  if (hex.size() % 2 != 0) return -1;
  auto hex2n = [](char c)->int{
    if ('0'<=c && c<='9') return c-'0';
    if ('a'<=c && c<='f') return 10 + c-'a';
    if ('A'<=c && c<='F') return 10 + c-'A';
    return -1;
  };
  out.resize(hex.size() / 2);
  for (size_t i=0;i<out.size();i++){
    int hi = hex2n(hex[2*i]);
    int lo = hex2n(hex[2*i+1]);
    if (hi<0||lo<0) { out.clear(); return -1; }
    out[i] = (uint8_t)((hi<<4)|lo);
  }
  return 0;
}

}
