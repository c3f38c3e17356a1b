// ===================== src/ssl_session.cpp =====================
#include "ssl_session.hpp"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <stdexcept>

namespace qdist
{
    namespace
    {
        std::string tls_error(const std::string &what)
        {
            std::string msg = what;
            unsigned long e;
            while ((e = ERR_get_error()) != 0)
            {
                char buf[256];
                ERR_error_string_n(e, buf, sizeof(buf));
                msg += std::string(": ") + buf;
            }
            return msg;
        }
    } // namespace

    SslSession::SslSession() : ctx_(nullptr), ssl_(nullptr)
    {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_)
            throw std::runtime_error(tls_error("Failed to create SSL_CTX"));
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
        {
            SSL_CTX_free(ctx_);
            throw std::runtime_error(tls_error("Cannot load the system trust store"));
        }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
    }

    SslSession::~SslSession()
    {
        if (ssl_)
        {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    void SslSession::handshake(int sockfd, const std::string &hostname)
    {
        ssl_ = SSL_new(ctx_);
        if (!ssl_)
            throw std::runtime_error(tls_error("SSL_new failed"));
        if (SSL_set_fd(ssl_, sockfd) != 1)
            throw std::runtime_error(tls_error("SSL_set_fd failed"));
        if (SSL_set_tlsext_host_name(ssl_, hostname.c_str()) != 1 || SSL_set1_host(ssl_, hostname.c_str()) != 1)
            throw std::runtime_error(tls_error("Cannot set TLS host name " + hostname));
        if (SSL_connect(ssl_) <= 0)
        {
            long verify = SSL_get_verify_result(ssl_);
            std::string what = "TLS handshake with " + hostname + " failed";
            if (verify != X509_V_OK)
                what += std::string(" (") + X509_verify_cert_error_string(verify) + ")";
            throw std::runtime_error(tls_error(what));
        }
    }

    bool SslSession::sendAll(const std::string &data) const
    {
        if (!ssl_)
            return false;
        size_t sent = 0;
        while (sent < data.size())
        {
            int n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
            if (n <= 0)
                return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    std::string SslSession::recvAll() const
    {
        std::string response;
        response.reserve(65536);
        char buf[16384];
        while (true)
        {
            int bytes = SSL_read(ssl_, buf, sizeof(buf));
            if (bytes > 0)
            {
                response.append(buf, static_cast<size_t>(bytes));
                continue;
            }
            int err = SSL_get_error(ssl_, bytes);
            // Servers that drop the TCP connection without close_notify still
            // deliver a complete Connection: close response.
            if (err == SSL_ERROR_ZERO_RETURN || (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0))
                break;
            if (err == SSL_ERROR_SSL && ERR_GET_REASON(ERR_peek_error()) == SSL_R_UNEXPECTED_EOF_WHILE_READING)
            {
                ERR_clear_error();
                break;
            }
            throw std::runtime_error(tls_error("TLS read failed"));
        }
        return response;
    }
} // namespace qdist
