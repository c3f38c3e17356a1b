// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <chrono>
#include <string>
#include "dns_resolver.hpp"

namespace qdist
{
    // Blocking TCP stream with send/receive timeouts.
    class TcpSocket
    {
        int sockfd_;

    public:
        explicit TcpSocket(std::chrono::seconds io_timeout = std::chrono::seconds(30));
        ~TcpSocket();

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        void closeSocket();
        bool connectTo(const ResolvedAddress &ra);
        bool sendAll(const std::string &data) const;
        // Reads until the peer closes. Throws std::runtime_error on a receive error or timeout.
        std::string recvAll() const;
        int fd() const { return sockfd_; }

    private:
        std::chrono::seconds io_timeout_;
    };
} // namespace qdist
