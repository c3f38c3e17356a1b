// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"

#include <stdexcept>

namespace qdist
{
    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        size_t scheme_end = url.find("://");
        size_t host_start = 0;
        if (scheme_end != std::string::npos)
        {
            scheme = url.substr(0, scheme_end);
            host_start = scheme_end + 3;
        }
        if (scheme != "http" && scheme != "https")
            throw std::invalid_argument("Unsupported URL scheme: " + url);

        size_t authority_end = url.find_first_of("/?", host_start);
        std::string authority = url.substr(host_start, authority_end == std::string::npos
                                                            ? std::string::npos
                                                            : authority_end - host_start);
        if (authority_end != std::string::npos)
        {
            path = url.substr(authority_end);
            if (path[0] == '?')
                path = "/" + path;
        }

        port = secure() ? 443 : 80;
        size_t colon = authority.rfind(':');
        bool bracketed = !authority.empty() && authority[0] == '[';
        if (colon != std::string::npos && (!bracketed || authority[colon - 1] == ']'))
        {
            std::string port_str = authority.substr(colon + 1);
            authority.resize(colon);
            try
            {
                size_t used = 0;
                port = std::stoi(port_str, &used);
                if (used != port_str.size() || port <= 0 || port > 65535)
                    throw std::out_of_range(port_str);
            }
            catch (const std::logic_error &)
            {
                throw std::invalid_argument("Invalid port in URL: " + url);
            }
        }
        if (bracketed && authority.size() >= 2 && authority.back() == ']')
            authority = authority.substr(1, authority.size() - 2);

        host = authority;
        if (host.empty())
            throw std::invalid_argument("No host in URL: " + url);
    }

    std::string ParsedURL::hostHeader() const
    {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port != (secure() ? 443 : 80))
            h += ":" + std::to_string(port);
        return h;
    }

    std::string ParsedURL::toGetRequestString() const
    {
        return std::string("GET ") + path + " HTTP/1.1\r\n" +
               "Host: " + hostHeader() + "\r\n" +
               "Accept: application/json\r\n" +
               "Connection: close\r\n\r\n";
    }

    std::string ParsedURL::toPostRequestString(const std::string &body, const std::string &content_type) const
    {
        return std::string("POST ") + path + " HTTP/1.1\r\n" +
               "Host: " + hostHeader() + "\r\n" +
               "Content-Type: " + content_type + "\r\n" +
               "Content-Length: " + std::to_string(body.size()) + "\r\n" +
               "Accept: application/json\r\n" +
               "Connection: close\r\n\r\n" + body;
    }
} // namespace qdist
