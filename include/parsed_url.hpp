// ===================== include/parsed_url.hpp =====================
#pragma once
#include <string>

namespace qdist
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "api.mainnet-beta.solana.com"
        int port = 0;       // explicit ":port" or the scheme default
        std::string path;   // path plus query, e.g., "/api/dz-validators?network=mainnet"

        // Throws std::invalid_argument for an empty host, a bad port or a scheme other than http/https.
        explicit ParsedURL(const std::string &url);

        bool secure() const { return scheme == "https"; }
        std::string hostHeader() const;
        std::string toGetRequestString() const;
        std::string toPostRequestString(const std::string &body, const std::string &content_type) const;
    };
} // namespace qdist
