#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <unistd.h>
#include <vector>
#include <nlohmann/json.hpp>

#include "enc/crypto.hpp"
#include "util.hpp"
#include "xfer/manifest.hpp"

namespace xfer {

static bool is_lower_hex(const std::string& s){
  for (char c : s){
    if (!(('0' <= c && c <= '9') || ('a' <= c && c <= 'f'))) return false;
  }
  return true;
}

std::string Manifest::to_json() const {
  nlohmann::json j;
  j["name"] = name;
  j["size"] = size;
  j["hash"] = hash;
  return j.dump();
}

int Manifest::from_json(const std::string& text, Manifest& out){
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return -EBADMSG;

  auto n = j.find("name");
  auto s = j.find("size");
  auto h = j.find("hash");
  if (n == j.end() || !n->is_string()) return -EBADMSG;
  if (s == j.end() || !s->is_number_unsigned()) return -EBADMSG;
  if (h == j.end() || !h->is_string()) return -EBADMSG;

  Manifest m;
  m.name = n->get<std::string>();
  m.size = s->get<uint64_t>();
  m.hash = h->get<std::string>();
  if (!util::is_plain_name(m.name)) return -EBADMSG;
  if (m.hash.size() != 2 * enc::HASH_SIZE || !is_lower_hex(m.hash)) return -EBADMSG;

  out = std::move(m);
  return 0;
}

int Manifest::hash_bytes(std::array<uint8_t,enc::HASH_SIZE>& out) const {
  std::vector<uint8_t> raw;
  if (util::enc::from_hex(hash, raw) != 0 || raw.size() != enc::HASH_SIZE) return -EINVAL;
  std::copy(raw.begin(), raw.end(), out.begin());
  return 0;
}

std::string Manifest::pretty() const {
  return name + " (" + std::to_string(size) + " bytes, sha256=" + hash + ")";
}

int build_manifest(const std::string& path, Manifest& out){
  std::string name = util::base_name(path);
  if (!util::is_plain_name(name)) return -EINVAL;

  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -errno;

  enc::Sha256 h;
  if (!h.ok()) { close(fd); return -ENOMEM; }

  std::vector<uint8_t> buf(enc::IO_BLOCK);
  uint64_t total = 0;
  for (;;){
    ssize_t r = read(fd, buf.data(), buf.size());
    if (r < 0){
      if (errno == EINTR) continue;
      int e = errno;
      close(fd);
      return -e;
    }
    if (r == 0) break;
    if (h.update(buf.data(), static_cast<size_t>(r)) != 0) { close(fd); return -EIO; }
    total += static_cast<uint64_t>(r);
  }
  close(fd);

  std::array<uint8_t,enc::HASH_SIZE> digest{};
  if (h.final(digest) != 0) return -EIO;

  out.name = name;
  out.size = total;
  out.hash = util::enc::to_hex(digest.data(), digest.size());
  return 0;
}

}
