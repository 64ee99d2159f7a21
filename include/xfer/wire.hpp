#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "enc/params.hpp"
#include "sealdrop/error.hpp"
#include "stream/stream.hpp"

namespace xfer {

// All integers on the wire are big-endian.
//   receiver -> sender : 0x01 | u32 len | public key DER
//   sender -> receiver : 0x02 | u32 len | RSA-OAEP(session key) | base nonce(12)
//   sender -> receiver : u32 len | seal(manifest json, aad="manifest")
//   sender -> receiver : (u32 len | seal(chunk, aad=manifest hash))*
inline constexpr uint8_t  TAG_PUBKEY         = 0x01;
inline constexpr uint8_t  TAG_SESSION_KEY    = 0x02;
inline constexpr uint32_t MAX_PUBKEY_LEN     = 1000000;
inline constexpr uint32_t MAX_ENCKEY_LEN     = 10000;
inline constexpr uint32_t MAX_MANIFEST_FRAME = 64 * 1024;
inline constexpr uint32_t MAX_CHUNK_FRAME    = enc::CHUNK_SIZE + enc::TAG_SIZE;
inline constexpr char     MANIFEST_AAD[]     = "manifest";
inline constexpr size_t   MANIFEST_AAD_LEN   = sizeof(MANIFEST_AAD) - 1;

// Exactly n bytes or an error: TRANSPORT for stream failures, FRAMING when
// the stream ends first.
int read_exact(stream::ByteStream& s, void* buf, size_t n,
               const std::string& step, sealdrop::Error& err);

int write_all(stream::ByteStream& s, const void* buf, size_t n,
              const std::string& step, sealdrop::Error& err);

// u32 length prefix, bounded to [min_len, max_len] before anything is
// allocated. `what` names the frame in error steps ("read <what> len").
int read_frame(stream::ByteStream& s, uint32_t min_len, uint32_t max_len,
               std::vector<uint8_t>& out, const std::string& what,
               sealdrop::Error& err);

int write_frame(stream::ByteStream& s, const std::vector<uint8_t>& payload,
                const std::string& what, sealdrop::Error& err);

// Tag byte, u32 length bounded to [1, max_len], payload.
int read_tagged(stream::ByteStream& s, uint8_t tag, uint32_t max_len,
                std::vector<uint8_t>& out, const std::string& what,
                sealdrop::Error& err);

}
