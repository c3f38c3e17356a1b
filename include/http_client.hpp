// ===================== include/http_client.hpp =====================
#pragma once
#include <string>

#include "diag_logger.hpp"

namespace qdist
{
    struct HttpResponse
    {
        int status = 0;
        std::string headers; // raw header block without the final blank line
        std::string body;    // chunked transfer coding already removed
    };

    // Splits a raw HTTP/1.1 response. Throws std::runtime_error when the
    // status line or the chunked body is malformed.
    HttpResponse parse_response(const std::string &raw);
    std::string decode_chunked(const std::string &body);

    // One-shot HTTP(S) requests, one connection per request.
    class HttpClient
    {
    public:
        explicit HttpClient(DiagLogger *diag = nullptr) : diag_(diag) {}

        // Both throw std::runtime_error on network, TLS or non-2xx responses.
        std::string get(const std::string &url) const;
        std::string post(const std::string &url, const std::string &body,
                         const std::string &content_type = "application/json") const;

    private:
        std::string exchange(const std::string &url, bool post, const std::string &body,
                             const std::string &content_type) const;

        DiagLogger *diag_;
    };
} // namespace qdist
