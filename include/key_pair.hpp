// ===================== include/key_pair.hpp =====================
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace qdist
{
    // Ed25519 signing key: 32-byte secret seed + the public key derived from it.
    class KeyPair
    {
    public:
        static constexpr std::size_t kKeyLen = 32;
        static constexpr std::size_t kSignatureLen = 64;
        using Bytes = std::array<uint8_t, kKeyLen>;

        static KeyPair generate();
        static KeyPair from_seed(const Bytes &seed);

        const Bytes &public_key() const { return public_; }
        const Bytes &secret_seed() const { return seed_; }

        std::vector<uint8_t> sign(const uint8_t *msg, std::size_t len) const;

    private:
        KeyPair(const Bytes &seed, const Bytes &pub) : seed_(seed), public_(pub) {}

        Bytes seed_;
        Bytes public_;
    };
} // namespace qdist
