// ===================== include/quic_endpoint.hpp =====================
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <gnutls/gnutls.h>
#include <ngtcp2/ngtcp2.h>

#include "client_identity.hpp"
#include "diag_logger.hpp"
#include "event_loop.hpp"
#include "pinger.hpp"
#include "socket_address.hpp"

namespace qdist
{
    class QuicConnection;

    // Fixed transport policy of the probing client.
    struct QuicTransportConfig
    {
        static constexpr const char *kAlpn = "solana-tpu";
        // TLS 1.3 only, one suite, one group, Ed25519 signatures only.
        static constexpr const char *kPriority =
            "NORMAL:-VERS-ALL:+VERS-TLS1.3:-CIPHER-ALL:+AES-128-GCM:-GROUP-ALL:+GROUP-X25519:"
            "-SIGN-ALL:+SIGN-EDDSA-ED25519:%DISABLE_TLS13_COMPAT_MODE";

        static constexpr std::chrono::milliseconds kMaxIdleTimeout{20000};
        static constexpr std::chrono::milliseconds kKeepAlive{1000};
        static constexpr std::size_t kMinMtu = 1280;
        static constexpr bool kMtuDiscovery = false;
        // A handshake-only connection opens no streams, so there is nothing to share fairly.
        static constexpr bool kSendFairness = false;
        static constexpr std::size_t kScidLen = 16;
        static constexpr std::size_t kDcidLen = 18;
    };

    // Client side of the QUIC transport: one UDP socket shared by every
    // connection attempt, datagrams routed to connections by destination CID.
    // Not copyable; hand out references to share it between samplers.
    class QuicEndpoint : public Pinger
    {
    public:
        // Binds 0.0.0.0:bind_port (0 = ephemeral). Throws std::runtime_error
        // when the socket cannot be bound or the TLS credentials are rejected.
        QuicEndpoint(event_base *base, const ClientIdentity &identity, uint16_t bind_port,
                     DiagLogger *diag = nullptr);
        ~QuicEndpoint() override;

        QuicEndpoint(const QuicEndpoint &) = delete;
        QuicEndpoint &operator=(const QuicEndpoint &) = delete;

        PingId ping(const SocketAddress &target, Callback done) override;
        void cancel(PingId id) override;

        uint16_t local_port() const { return local_.port(); }
        std::size_t in_flight() const { return conns_.size(); }

        // Used by QuicConnection.
        event_base *base() const { return base_; }
        gnutls_certificate_credentials_t credentials() const { return cred_; }
        gnutls_priority_t priority() const { return priority_; }
        const SocketAddress &local_address() const { return local_; }
        DiagLogger *diag() const { return diag_; }

        // false on a hard send error; transient errors count as packet loss.
        bool send(const SocketAddress &to, const uint8_t *data, std::size_t len);
        void associate(const ngtcp2_cid &cid, PingId id);
        void dissociate(const ngtcp2_cid &cid);
        void connection_finished(PingId id);

    private:
        struct Attempt
        {
            std::unique_ptr<QuicConnection> conn;
            Callback done;
        };

        static void on_readable(evutil_socket_t fd, short what, void *arg);
        static void on_reap(evutil_socket_t fd, short what, void *arg);
        static int accept_any_certificate(gnutls_session_t session);
        void read_datagrams();
        void reap();
        void release();
        void watch_socket();

        event_base *base_;
        DiagLogger *diag_;
        int fd_ = -1;
        SocketAddress local_;
        gnutls_certificate_credentials_t cred_ = nullptr;
        gnutls_priority_t priority_ = nullptr;
        EventPtr read_event_{nullptr, &event_free};
        EventPtr reap_event_{nullptr, &event_free};
        std::unordered_map<PingId, Attempt> conns_;
        std::unordered_map<std::string, PingId> cids_;
        std::vector<PingId> finished_;
        std::vector<uint8_t> rx_buf_;
        PingId next_id_ = 1;
    };
} // namespace qdist
