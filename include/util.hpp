#pragma once
#include <cstddef>
#include <string>
#include <cstdint>
#include <vector>
#include <sys/types.h>
#include <unistd.h>

namespace util {

std::string expand_args(const std::string& path);

std::string rstrip_slash(std::string p);

// Final path component; both '/' and '\\' count as separators.
std::string base_name(const std::string& path);

// Single, non-special path component (no separators, NUL, "." or "..")
bool is_plain_name(const std::string& name);

namespace enc {

// Ensure randomness has enough size
int fill_rand(void* p, size_t n);

// Endian helpers
uint32_t htobe_u32(uint32_t x);
uint32_t be32toh_u32(uint32_t x);
void put_be32(uint8_t out[4], uint32_t v);
uint32_t get_be32(const uint8_t in[4]);

std::string to_hex(const uint8_t* p, size_t n);
// Lowercase or uppercase input; returns -1 on odd length or a non-hex digit.
int from_hex(const std::string& hex, std::vector<uint8_t>& out);

}


namespace fs {

ssize_t full_read(int fd, void *buf, size_t n);
ssize_t full_write(int fd, const void *buf, size_t n);

// mkdir -p; returns 0 or -errno
int make_dirs(const std::string& path, mode_t mode = 0755);

// O_PATH|O_DIRECTORY fd for an existing directory, or -errno
int open_dir(const std::string& path);

}

}
