// ===================== include/ssl_session.hpp =====================
#pragma once
#include <string>
#include <openssl/ssl.h>

namespace qdist
{
    // TLS client over an already connected socket. The server certificate is
    // checked against the system trust store and the requested host name.
    class SslSession
    {
        SSL_CTX *ctx_;
        SSL *ssl_;

    public:
        SslSession();
        ~SslSession();

        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        // Throws std::runtime_error with the OpenSSL error queue on failure.
        void handshake(int sockfd, const std::string &hostname);
        bool sendAll(const std::string &data) const;
        // Reads until the peer closes. Throws std::runtime_error on a TLS error.
        std::string recvAll() const;
    };
} // namespace qdist
