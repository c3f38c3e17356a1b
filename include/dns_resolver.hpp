// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

#include "socket_address.hpp"

namespace qdist
{
    // One getaddrinfo() candidate: what socket() needs, and where to connect.
    struct ResolvedAddress
    {
        int family;
        int socktype;
        int protocol;
        SocketAddress address;
    };

    class DNSResolver
    {
    public:
        // Stream addresses for host:port in resolver order.
        // Throws std::runtime_error when the name does not resolve.
        static std::vector<ResolvedAddress> resolve(const std::string &host, int port);
    };
} // namespace qdist
