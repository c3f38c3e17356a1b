// ===================== src/dns_resolver.cpp =====================
#include "dns_resolver.hpp"
#include <memory>
#include <stdexcept>

namespace qdist
{
    std::vector<ResolvedAddress> DNSResolver::resolve(const std::string &host, int port)
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_ADDRCONFIG;
        addrinfo *raw = nullptr;

        const std::string service = std::to_string(port);
        int status = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
        if (status != 0)
            throw std::runtime_error("Cannot resolve " + host + ": " + gai_strerror(status));
        std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> res(raw, &freeaddrinfo);

        std::vector<ResolvedAddress> results;
        for (const addrinfo *p = res.get(); p != nullptr; p = p->ai_next)
        {
            if (p->ai_addrlen > sizeof(sockaddr_storage))
                continue;
            results.push_back(ResolvedAddress{p->ai_family, p->ai_socktype, p->ai_protocol,
                                              SocketAddress::from_sockaddr(p->ai_addr,
                                                                           static_cast<socklen_t>(p->ai_addrlen))});
        }
        if (results.empty())
            throw std::runtime_error("No usable address for " + host);
        return results;
    }
} // namespace qdist
