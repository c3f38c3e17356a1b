#include "client_identity.hpp"

#include <array>
#include <stdexcept>

namespace qdist
{
    namespace
    {
        // PrivateKeyInfo { v0, id-Ed25519, OCTET STRING { OCTET STRING seed } }
        constexpr std::array<uint8_t, 16> kPkcs8Prefix = {
            0x30, 0x2e, 0x02, 0x01, 0x00, 0x30, 0x05, 0x06, 0x03, 0x2b, 0x65, 0x70, 0x04, 0x22, 0x04, 0x20,
        };

        // Certificate SEQUENCE header; the body is 0xf6 bytes.
        constexpr std::array<uint8_t, 3> kCertHeader = {0x30, 0x81, 0xf6};
        constexpr std::size_t kCertBodyLen = 0xf6;

        // TBSCertificate up to and including the BIT STRING header of the public key.
        constexpr std::array<uint8_t, 97> kTbsPrefix = {
            0x30, 0x81, 0xa9,                                     // TBSCertificate, 0xa9 bytes
            0xa0, 0x03, 0x02, 0x01, 0x02,                         // version v3
            0x02, 0x08, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, 0x01, // serial
            0x30, 0x05, 0x06, 0x03, 0x2b, 0x65, 0x70,             // signature: Ed25519
            0x30, 0x16, 0x31, 0x14, 0x30, 0x12, 0x06, 0x03, 0x55, 0x04, 0x03, 0x0c, 0x0b, // issuer CN
            'S', 'o', 'l', 'a', 'n', 'a', ' ', 'n', 'o', 'd', 'e',
            0x30, 0x20,                                           // validity
            0x17, 0x0d, '7', '0', '0', '1', '0', '1', '0', '0', '0', '0', '0', '0', 'Z',
            0x18, 0x0f, '4', '0', '9', '6', '0', '1', '0', '1', '0', '0', '0', '0', '0', '0', 'Z',
            0x30, 0x00,                                           // subject: empty
            0x30, 0x2a, 0x30, 0x05, 0x06, 0x03, 0x2b, 0x65, 0x70, // SubjectPublicKeyInfo
            0x03, 0x21, 0x00,
        };
        constexpr std::size_t kTbsBodyLen = 0xa9;

        // [3] extensions: critical SAN DNS:localhost, critical basicConstraints {}
        constexpr std::array<uint8_t, 43> kTbsExtensions = {
            0xa3, 0x29, 0x30, 0x27,
            0x30, 0x17, 0x06, 0x03, 0x55, 0x1d, 0x11, 0x01, 0x01, 0xff, 0x04, 0x0d,
            0x30, 0x0b, 0x82, 0x09, 'l', 'o', 'c', 'a', 'l', 'h', 'o', 's', 't',
            0x30, 0x0c, 0x06, 0x03, 0x55, 0x1d, 0x13, 0x01, 0x01, 0xff, 0x04, 0x02, 0x30, 0x00,
        };

        // signatureAlgorithm + signatureValue BIT STRING header (64 bytes follow)
        constexpr std::array<uint8_t, 10> kSignatureHeader = {
            0x30, 0x05, 0x06, 0x03, 0x2b, 0x65, 0x70, 0x03, 0x41, 0x00,
        };

        static_assert(kTbsPrefix.size() + KeyPair::kKeyLen + kTbsExtensions.size() == 3 + kTbsBodyLen,
                      "TBSCertificate layout does not match its DER header");

        template <std::size_t N>
        void append(std::vector<uint8_t> &out, const std::array<uint8_t, N> &bytes)
        {
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
    } // namespace

    ClientIdentity build_client_identity(const KeyPair &keypair)
    {
        ClientIdentity id;

        id.private_key_der.reserve(kPkcs8Prefix.size() + KeyPair::kKeyLen);
        append(id.private_key_der, kPkcs8Prefix);
        append(id.private_key_der, keypair.secret_seed());

        std::vector<uint8_t> tbs;
        tbs.reserve(3 + kTbsBodyLen);
        append(tbs, kTbsPrefix);
        append(tbs, keypair.public_key());
        append(tbs, kTbsExtensions);

        std::vector<uint8_t> sig = keypair.sign(tbs.data(), tbs.size());
        if (sig.size() != KeyPair::kSignatureLen)
            throw std::logic_error("unexpected Ed25519 signature length");

        id.certificate_der.reserve(kCertHeader.size() + kCertBodyLen);
        append(id.certificate_der, kCertHeader);
        id.certificate_der.insert(id.certificate_der.end(), tbs.begin(), tbs.end());
        append(id.certificate_der, kSignatureHeader);
        id.certificate_der.insert(id.certificate_der.end(), sig.begin(), sig.end());
        if (id.certificate_der.size() != kCertHeader.size() + kCertBodyLen)
            throw std::logic_error("certificate length does not match its DER header");

        return id;
    }
} // namespace qdist
