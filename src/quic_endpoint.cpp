// ===================== src/quic_endpoint.cpp =====================
#include "quic_endpoint.hpp"
#include "quic_connection.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <sys/socket.h>
#include <unistd.h>

namespace qdist
{
    namespace
    {
        std::string cid_key(const uint8_t *data, std::size_t len)
        {
            return std::string(reinterpret_cast<const char *>(data), len);
        }

        gnutls_datum_t datum(const std::vector<uint8_t> &bytes)
        {
            gnutls_datum_t d{};
            d.data = const_cast<unsigned char *>(bytes.data());
            d.size = static_cast<unsigned int>(bytes.size());
            return d;
        }
    } // namespace

    QuicEndpoint::QuicEndpoint(event_base *base, const ClientIdentity &identity, uint16_t bind_port,
                               DiagLogger *diag)
        : base_(base), diag_(diag), rx_buf_(65536)
    {
        try
        {
            int rv = gnutls_certificate_allocate_credentials(&cred_);
            if (rv != GNUTLS_E_SUCCESS)
                throw std::runtime_error(std::string("Cannot allocate TLS credentials: ") + gnutls_strerror(rv));

            gnutls_datum_t cert = datum(identity.certificate_der);
            gnutls_datum_t key = datum(identity.private_key_der);
            rv = gnutls_certificate_set_x509_key_mem2(cred_, &cert, &key, GNUTLS_X509_FMT_DER, nullptr,
                                                      GNUTLS_PKCS_PLAIN);
            if (rv < 0)
                throw std::runtime_error(std::string("Client certificate rejected: ") + gnutls_strerror(rv));
            gnutls_certificate_set_verify_function(cred_, &QuicEndpoint::accept_any_certificate);

            const char *err_pos = nullptr;
            rv = gnutls_priority_init(&priority_, QuicTransportConfig::kPriority, &err_pos);
            if (rv != GNUTLS_E_SUCCESS)
                throw std::runtime_error(std::string("Bad TLS priority string at '") + (err_pos ? err_pos : "") +
                                         "': " + gnutls_strerror(rv));

            fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
            if (fd_ < 0)
                throw std::runtime_error(std::string("socket(AF_INET,SOCK_DGRAM) failed: ") + std::strerror(errno));

            SocketAddress bind_addr = SocketAddress::any_ipv4(bind_port);
            if (::bind(fd_, bind_addr.sa(), bind_addr.addrlen) < 0)
                throw std::runtime_error("Cannot bind UDP port " + std::to_string(bind_port) + ": " +
                                         std::strerror(errno));

            sockaddr_storage ss{};
            socklen_t len = sizeof(ss);
            if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&ss), &len) < 0)
                throw std::runtime_error(std::string("getsockname failed: ") + std::strerror(errno));
            local_ = SocketAddress::from_sockaddr(reinterpret_cast<sockaddr *>(&ss), len);

            read_event_ = EventPtr(event_new(base_, fd_, EV_READ | EV_PERSIST, &QuicEndpoint::on_readable, this),
                                   &event_free);
            reap_event_ = EventPtr(event_new(base_, -1, 0, &QuicEndpoint::on_reap, this), &event_free);
            if (!read_event_ || !reap_event_)
                throw std::runtime_error("event_new failed");
        }
        catch (...)
        {
            release();
            throw;
        }

        if (diag_)
            diag_->log("QUIC", "ENDPOINT bound=" + local_.to_string() + " alpn=" + QuicTransportConfig::kAlpn);
    }

    QuicEndpoint::~QuicEndpoint()
    {
        release();
    }

    void QuicEndpoint::release()
    {
        conns_.clear();
        cids_.clear();
        read_event_.reset();
        reap_event_.reset();
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
        if (priority_)
        {
            gnutls_priority_deinit(priority_);
            priority_ = nullptr;
        }
        if (cred_)
        {
            gnutls_certificate_free_credentials(cred_);
            cred_ = nullptr;
        }
    }

    // The remote node's certificate is never authenticated; only the
    // encrypted handshake and its timing matter.
    int QuicEndpoint::accept_any_certificate(gnutls_session_t)
    {
        return 0;
    }

    Pinger::PingId QuicEndpoint::ping(const SocketAddress &target, Callback done)
    {
        PingId id = next_id_++;
        auto conn = std::make_unique<QuicConnection>(*this, id, target);
        QuicConnection *raw = conn.get();
        conns_.emplace(id, Attempt{std::move(conn), std::move(done)});
        watch_socket();
        try
        {
            raw->connect();
        }
        catch (const std::exception &e)
        {
            if (diag_)
                diag_->log("QUIC", "CONNECT_ERR peer=" + target.to_string() + " " + e.what());
            conns_.erase(id);
            watch_socket();
            throw;
        }
        return id;
    }

    void QuicEndpoint::cancel(PingId id)
    {
        if (conns_.erase(id) > 0 && diag_)
            diag_->log("QUIC", "CANCEL id=" + std::to_string(id));
        watch_socket();
    }

    // The read event only stays registered while attempts are in flight, so an
    // idle endpoint does not keep the event loop alive.
    void QuicEndpoint::watch_socket()
    {
        bool pending = event_pending(read_event_.get(), EV_READ, nullptr) != 0;
        int rv = 0;
        if (!conns_.empty() && !pending)
            rv = event_add(read_event_.get(), nullptr);
        else if (conns_.empty() && pending)
            rv = event_del(read_event_.get());
        if (rv != 0 && diag_)
            diag_->log("QUIC", "cannot update UDP read event");
    }

    bool QuicEndpoint::send(const SocketAddress &to, const uint8_t *data, std::size_t len)
    {
        ssize_t n = ::sendto(fd_, data, len, 0, to.sa(), to.addrlen);
        if (n >= 0)
            return true;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS || errno == EINTR)
            return true;
        if (diag_)
            diag_->log("QUIC", "SEND_ERR peer=" + to.to_string() + " errno=" + std::to_string(errno) + " (" +
                                   std::strerror(errno) + ")");
        return false;
    }

    void QuicEndpoint::associate(const ngtcp2_cid &cid, PingId id)
    {
        cids_[cid_key(cid.data, cid.datalen)] = id;
    }

    void QuicEndpoint::dissociate(const ngtcp2_cid &cid)
    {
        cids_.erase(cid_key(cid.data, cid.datalen));
    }

    void QuicEndpoint::connection_finished(PingId id)
    {
        finished_.push_back(id);
        event_active(reap_event_.get(), EV_TIMEOUT, 1);
    }

    void QuicEndpoint::on_readable(evutil_socket_t, short, void *arg)
    {
        static_cast<QuicEndpoint *>(arg)->read_datagrams();
    }

    void QuicEndpoint::on_reap(evutil_socket_t, short, void *arg)
    {
        static_cast<QuicEndpoint *>(arg)->reap();
    }

    void QuicEndpoint::read_datagrams()
    {
        for (;;)
        {
            sockaddr_storage ss{};
            socklen_t len = sizeof(ss);
            ssize_t n = ::recvfrom(fd_, rx_buf_.data(), rx_buf_.size(), 0, reinterpret_cast<sockaddr *>(&ss), &len);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK && diag_)
                    diag_->log("QUIC", "RECV_ERR errno=" + std::to_string(errno) + " (" + std::strerror(errno) + ")");
                return;
            }

            ngtcp2_version_cid vc{};
            int rv = ngtcp2_pkt_decode_version_cid(&vc, rx_buf_.data(), static_cast<std::size_t>(n),
                                                   QuicTransportConfig::kScidLen);
            if (rv != 0)
            {
                if (diag_)
                    diag_->log("QUIC", std::string("DROP undecodable header: ") + ngtcp2_strerror(rv));
                continue;
            }

            auto cid = cids_.find(cid_key(vc.dcid, vc.dcidlen));
            if (cid == cids_.end())
                continue;
            auto it = conns_.find(cid->second);
            if (it == conns_.end())
                continue;
            SocketAddress from = SocketAddress::from_sockaddr(reinterpret_cast<sockaddr *>(&ss), len);
            it->second.conn->on_datagram(from, rx_buf_.data(), static_cast<std::size_t>(n));
        }
    }

    void QuicEndpoint::reap()
    {
        std::vector<PingId> ids;
        ids.swap(finished_);
        for (PingId id : ids)
        {
            auto it = conns_.find(id);
            if (it == conns_.end())
                continue;
            SampleResult rtt = it->second.conn->rtt_us();
            Callback done = std::move(it->second.done);
            conns_.erase(it);
            watch_socket();
            if (done)
                done(rtt);
        }
    }
} // namespace qdist
