// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace qdist
{
    TcpSocket::TcpSocket(std::chrono::seconds io_timeout) : sockfd_(-1), io_timeout_(io_timeout) {}
    TcpSocket::~TcpSocket() { closeSocket(); }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    bool TcpSocket::connectTo(const ResolvedAddress &ra)
    {
        closeSocket();
        sockfd_ = ::socket(ra.family, ra.socktype | SOCK_CLOEXEC, ra.protocol);
        if (sockfd_ == -1)
            return false;

        timeval tv{};
        tv.tv_sec = static_cast<time_t>(io_timeout_.count());
        if (::setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
            ::setsockopt(sockfd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        {
            closeSocket();
            return false;
        }

        if (::connect(sockfd_, ra.address.sa(), ra.address.addrlen) == 0)
            return true;
        closeSocket();
        return false;
    }

    bool TcpSocket::sendAll(const std::string &data) const
    {
        if (sockfd_ == -1){
            return false;
        }
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    std::string TcpSocket::recvAll() const
    {
        std::string response;
        response.reserve(65536);
        char buf[16384];
        while (true)
        {
            ssize_t bytes = ::recv(sockfd_, buf, sizeof(buf), 0);
            if (bytes > 0)
            {
                response.append(buf, static_cast<size_t>(bytes));
                continue;
            }
            if (bytes == 0)
                break;
            if (errno == EINTR)
                continue;
            throw std::runtime_error(std::string("recv failed: ") + std::strerror(errno));
        }
        return response;
    }
} // namespace qdist
