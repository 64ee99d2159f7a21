#pragma once
#include <cstdint>
#include <memory>
#include <vector>

#include "enc/keypair.hpp"
#include "enc/session.hpp"
#include "sealdrop/error.hpp"
#include "stream/stream.hpp"

namespace xfer {

// Receiver role: announce the long-lived public key, then recover the
// sender's session key and base nonce.
int announce_key(stream::ByteStream& s, const enc::KeyPair& kp, sealdrop::Error& err);
int accept_session(stream::ByteStream& s, const enc::KeyPair& kp,
                   std::unique_ptr<enc::Session>& out, sealdrop::Error& err);

// Sender role: read the peer's key, then pick a fresh session key and base
// nonce and deliver them RSA-OAEP encrypted.
int await_peer_key(stream::ByteStream& s, std::vector<uint8_t>& pub_der, sealdrop::Error& err);
int deliver_session(stream::ByteStream& s, const std::vector<uint8_t>& pub_der,
                    std::unique_ptr<enc::Session>& out, sealdrop::Error& err);

}
