#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <gnutls/gnutls.h>
#include <ngtcp2/ngtcp2.h>
#include <ngtcp2/ngtcp2_crypto.h>

#include "event_loop.hpp"
#include "pinger.hpp"
#include "socket_address.hpp"

namespace qdist
{
    class QuicEndpoint;

    // One handshake-only QUIC client connection. Completes once the TLS
    // handshake is done (RTT read, CONNECTION_CLOSE sent) or has failed, and
    // reports either way to QuicEndpoint::connection_finished().
    class QuicConnection
    {
    public:
        enum class State
        {
            Idle,
            Handshaking,
            Done,
            Failed
        };

        QuicConnection(QuicEndpoint &endpoint, Pinger::PingId id, const SocketAddress &remote);
        ~QuicConnection();

        QuicConnection(const QuicConnection &) = delete;
        QuicConnection &operator=(const QuicConnection &) = delete;

        // Sends the first Initial. Throws std::runtime_error if ngtcp2 or
        // GnuTLS refuse the configuration.
        void connect();
        void on_datagram(const SocketAddress &from, const uint8_t *data, std::size_t len);

        State state() const { return state_; }
        // Smoothed handshake RTT in microseconds; kUnreachable unless Done.
        SampleResult rtt_us() const { return rtt_us_; }

    private:
        static ngtcp2_conn *get_conn(ngtcp2_crypto_conn_ref *ref);
        static int on_handshake_completed(ngtcp2_conn *conn, void *user_data);
        static int on_new_connection_id(ngtcp2_conn *conn, ngtcp2_cid *cid, uint8_t *token,
                                        size_t cidlen, void *user_data);
        static void on_rand(uint8_t *dest, size_t destlen, const ngtcp2_rand_ctx *rand_ctx);
        static void on_expiry(evutil_socket_t fd, short what, void *arg);

        void setup_tls();
        bool flush();
        void schedule_expiry();
        void handle_expiry();
        void complete();
        void fail(const std::string &why);
        void add_cid(const ngtcp2_cid &cid);

        QuicEndpoint &endpoint_;
        Pinger::PingId id_;
        SocketAddress remote_;
        std::string server_name_;
        State state_ = State::Idle;
        bool handshake_done_ = false;
        SampleResult rtt_us_ = kUnreachable;

        ngtcp2_crypto_conn_ref conn_ref_{};
        ngtcp2_conn *conn_ = nullptr;
        gnutls_session_t session_ = nullptr;
        EventPtr expiry_{nullptr, &event_free};
        std::vector<ngtcp2_cid> cids_;
    };
} // namespace qdist
