#pragma once
#include <cstdint>
#include <vector>

#include "key_pair.hpp"

namespace qdist
{
    // TLS client credentials presented during the QUIC handshake.
    struct ClientIdentity
    {
        std::vector<uint8_t> certificate_der; // X.509 v3, self-signed Ed25519
        std::vector<uint8_t> private_key_der; // PKCS#8 PrivateKeyInfo
    };

    // Minimal self-signed certificate over the pair's public key:
    // issuer CN=Solana node, empty subject, validity 1970..4096,
    // critical SAN DNS:localhost, critical empty basicConstraints.
    // Deterministic for a given key pair. Throws std::logic_error if the
    // fixed DER layout does not come out at the expected length.
    ClientIdentity build_client_identity(const KeyPair &keypair);
} // namespace qdist
