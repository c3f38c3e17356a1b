// ===================== src/key_pair.cpp =====================
#include "key_pair.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace qdist
{
    namespace
    {
        using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
        using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        [[noreturn]] void throw_openssl(const std::string &what)
        {
            char buf[256];
            ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
            throw std::runtime_error(what + ": " + buf);
        }

        PkeyPtr pkey_from_seed(const KeyPair::Bytes &seed)
        {
            PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
                         &EVP_PKEY_free);
            if (!pkey)
                throw_openssl("EVP_PKEY_new_raw_private_key failed");
            return pkey;
        }

        KeyPair::Bytes raw_public(EVP_PKEY *pkey)
        {
            KeyPair::Bytes pub{};
            size_t len = pub.size();
            if (EVP_PKEY_get_raw_public_key(pkey, pub.data(), &len) != 1 || len != pub.size())
                throw_openssl("EVP_PKEY_get_raw_public_key failed");
            return pub;
        }
    } // namespace

    KeyPair KeyPair::generate()
    {
        PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), &EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1)
            throw_openssl("Ed25519 keygen init failed");

        EVP_PKEY *raw = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw) != 1)
            throw_openssl("Ed25519 keygen failed");
        PkeyPtr pkey(raw, &EVP_PKEY_free);

        Bytes seed{};
        size_t len = seed.size();
        if (EVP_PKEY_get_raw_private_key(pkey.get(), seed.data(), &len) != 1 || len != seed.size())
            throw_openssl("EVP_PKEY_get_raw_private_key failed");
        return KeyPair(seed, raw_public(pkey.get()));
    }

    KeyPair KeyPair::from_seed(const Bytes &seed)
    {
        PkeyPtr pkey = pkey_from_seed(seed);
        return KeyPair(seed, raw_public(pkey.get()));
    }

    std::vector<uint8_t> KeyPair::sign(const uint8_t *msg, std::size_t len) const
    {
        PkeyPtr pkey = pkey_from_seed(seed_);
        MdCtxPtr md(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!md || EVP_DigestSignInit(md.get(), nullptr, nullptr, nullptr, pkey.get()) != 1)
            throw_openssl("EVP_DigestSignInit failed");

        std::vector<uint8_t> sig(kSignatureLen);
        size_t siglen = sig.size();
        if (EVP_DigestSign(md.get(), sig.data(), &siglen, msg, len) != 1)
            throw_openssl("EVP_DigestSign failed");
        sig.resize(siglen);
        return sig;
    }
} // namespace qdist
