#include "socket_address.hpp"

#include <arpa/inet.h>
#include <cstdlib>
#include <cstring>
#include <tuple>

namespace qdist {

namespace {

std::optional<uint16_t> parse_port(const std::string &s) {
    if (s.empty() || s.size() > 5)
        return std::nullopt;
    for (char c : s)
        if (c < '0' || c > '9')
            return std::nullopt;
    unsigned long v = std::strtoul(s.c_str(), nullptr, 10);
    if (v > 65535)
        return std::nullopt;
    return static_cast<uint16_t>(v);
}

// family, raw address bytes, port: the ordering key
std::tuple<int, std::string, uint16_t> key_of(const SocketAddress &a) {
    std::string raw;
    if (a.family() == AF_INET) {
        auto *sin = reinterpret_cast<const sockaddr_in *>(&a.addr);
        raw.assign(reinterpret_cast<const char *>(&sin->sin_addr), sizeof(sin->sin_addr));
    } else if (a.family() == AF_INET6) {
        auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(&a.addr);
        raw.assign(reinterpret_cast<const char *>(&sin6->sin6_addr), sizeof(sin6->sin6_addr));
    }
    return {a.family(), raw, a.port()};
}

} // namespace

std::optional<SocketAddress> SocketAddress::parse(const std::string &text) {
    SocketAddress out;
    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':')
            return std::nullopt;
        auto port = parse_port(text.substr(close + 2));
        if (!port)
            return std::nullopt;
        sockaddr_in6 sin6{};
        sin6.sin6_family = AF_INET6;
        sin6.sin6_port = htons(*port);
        if (inet_pton(AF_INET6, text.substr(1, close - 1).c_str(), &sin6.sin6_addr) != 1)
            return std::nullopt;
        std::memcpy(&out.addr, &sin6, sizeof(sin6));
        out.addrlen = sizeof(sin6);
        return out;
    }

    auto colon = text.rfind(':');
    if (colon == std::string::npos)
        return std::nullopt;
    auto port = parse_port(text.substr(colon + 1));
    if (!port)
        return std::nullopt;
    sockaddr_in sin{};
    sin.sin_family = AF_INET;
    sin.sin_port = htons(*port);
    if (inet_pton(AF_INET, text.substr(0, colon).c_str(), &sin.sin_addr) != 1)
        return std::nullopt;
    std::memcpy(&out.addr, &sin, sizeof(sin));
    out.addrlen = sizeof(sin);
    return out;
}

SocketAddress SocketAddress::from_sockaddr(const sockaddr *sa, socklen_t len) {
    SocketAddress out;
    if (len > sizeof(out.addr))
        len = sizeof(out.addr);
    std::memcpy(&out.addr, sa, len);
    out.addrlen = len;
    return out;
}

SocketAddress SocketAddress::any_ipv4(uint16_t port) {
    sockaddr_in sin{};
    sin.sin_family = AF_INET;
    sin.sin_port = htons(port);
    sin.sin_addr.s_addr = htonl(INADDR_ANY);
    return from_sockaddr(reinterpret_cast<const sockaddr *>(&sin), sizeof(sin));
}

uint16_t SocketAddress::port() const {
    if (family() == AF_INET)
        return ntohs(reinterpret_cast<const sockaddr_in *>(&addr)->sin_port);
    if (family() == AF_INET6)
        return ntohs(reinterpret_cast<const sockaddr_in6 *>(&addr)->sin6_port);
    return 0;
}

std::string SocketAddress::ip_string() const {
    char buf[INET6_ADDRSTRLEN];
    if (family() == AF_INET) {
        auto *sin = reinterpret_cast<const sockaddr_in *>(&addr);
        return inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) ? std::string(buf) : std::string();
    }
    if (family() == AF_INET6) {
        auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(&addr);
        return inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf)) ? std::string(buf) : std::string();
    }
    return std::string();
}

std::string SocketAddress::to_string() const {
    if (family() == AF_INET6)
        return "[" + ip_string() + "]:" + std::to_string(port());
    return ip_string() + ":" + std::to_string(port());
}

bool operator==(const SocketAddress &a, const SocketAddress &b) { return key_of(a) == key_of(b); }
bool operator!=(const SocketAddress &a, const SocketAddress &b) { return !(a == b); }
bool operator<(const SocketAddress &a, const SocketAddress &b) { return key_of(a) < key_of(b); }

std::string quic_server_name(const SocketAddress &peer) {
    return peer.ip_string() + "." + std::to_string(peer.port()) + ".sol";
}

} // namespace qdist
