#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <netinet/in.h>

namespace qdist
{
    // IPv4 or IPv6 address + port, ordered and comparable so it can key a map.
    struct SocketAddress
    {
        sockaddr_storage addr{};
        socklen_t addrlen = 0;

        // Accepts "a.b.c.d:port" and "[v6]:port".
        static std::optional<SocketAddress> parse(const std::string &text);
        static SocketAddress from_sockaddr(const sockaddr *sa, socklen_t len);
        static SocketAddress any_ipv4(uint16_t port);

        int family() const { return addr.ss_family; }
        uint16_t port() const;
        std::string ip_string() const;
        std::string to_string() const;

        const sockaddr *sa() const { return reinterpret_cast<const sockaddr *>(&addr); }
        sockaddr *sa() { return reinterpret_cast<sockaddr *>(&addr); }
    };

    bool operator==(const SocketAddress &a, const SocketAddress &b);
    bool operator!=(const SocketAddress &a, const SocketAddress &b);
    bool operator<(const SocketAddress &a, const SocketAddress &b);

    // Placeholder host name "<ip>.<port>.sol". Never sent on the wire and never verified.
    std::string quic_server_name(const SocketAddress &peer);

} // namespace qdist
