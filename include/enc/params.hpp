#pragma once
#include <cstdint>
#include <cstddef>

namespace enc {
inline constexpr uint32_t CHUNK_SIZE      = 1024 * 1024; // 1 MiB plaintext per chunk frame
inline constexpr size_t   TAG_SIZE        = 16;          // GCM tag
inline constexpr size_t   KEY_SIZE        = 32;          // AES-256
inline constexpr size_t   NONCE_SIZE      = 12;          // GCM standard
inline constexpr size_t   COUNTER_SIZE    = 4;           // low bytes of the nonce
inline constexpr size_t   HASH_SIZE       = 32;          // SHA-256
inline constexpr unsigned RSA_BITS        = 4096;
inline constexpr size_t   IO_BLOCK        = 64 * 1024;   // hashing read block
} // namespace enc
