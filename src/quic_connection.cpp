// ===================== src/quic_connection.cpp =====================
#include "quic_connection.hpp"
#include "quic_endpoint.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <stdexcept>

#include <gnutls/crypto.h>
#include <ngtcp2/ngtcp2_crypto_gnutls.h>

namespace qdist
{
    namespace
    {
        using Buffer = std::array<uint8_t, QuicTransportConfig::kMinMtu>;

        ngtcp2_tstamp timestamp()
        {
            using namespace std::chrono;
            return static_cast<ngtcp2_tstamp>(
                duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count());
        }

        ngtcp2_duration to_ngtcp2(std::chrono::milliseconds d)
        {
            return static_cast<ngtcp2_duration>(d.count()) * NGTCP2_MILLISECONDS;
        }

        void random_cid(ngtcp2_cid &cid, std::size_t len)
        {
            cid.datalen = len;
            if (gnutls_rnd(GNUTLS_RND_RANDOM, cid.data, len) != 0)
                throw std::runtime_error("gnutls_rnd failed");
        }

        ngtcp2_path make_path(const SocketAddress &local, const SocketAddress &remote)
        {
            ngtcp2_path path{};
            path.local.addr = const_cast<ngtcp2_sockaddr *>(local.sa());
            path.local.addrlen = local.addrlen;
            path.remote.addr = const_cast<ngtcp2_sockaddr *>(remote.sa());
            path.remote.addrlen = remote.addrlen;
            return path;
        }
    } // namespace

    QuicConnection::QuicConnection(QuicEndpoint &endpoint, Pinger::PingId id, const SocketAddress &remote)
        : endpoint_(endpoint), id_(id), remote_(remote), server_name_(quic_server_name(remote))
    {
        conn_ref_.get_conn = &QuicConnection::get_conn;
        conn_ref_.user_data = this;
    }

    QuicConnection::~QuicConnection()
    {
        for (const auto &cid : cids_)
            endpoint_.dissociate(cid);
        if (conn_)
            ngtcp2_conn_del(conn_);
        if (session_)
            gnutls_deinit(session_);
    }

    void QuicConnection::setup_tls()
    {
        int rv = gnutls_init(&session_, GNUTLS_CLIENT | GNUTLS_ENABLE_EARLY_DATA | GNUTLS_NO_END_OF_EARLY_DATA);
        if (rv != GNUTLS_E_SUCCESS)
            throw std::runtime_error(std::string("gnutls_init failed: ") + gnutls_strerror(rv));

        if (ngtcp2_crypto_gnutls_configure_client_session(session_) != 0)
            throw std::runtime_error("ngtcp2_crypto_gnutls_configure_client_session failed");

        rv = gnutls_priority_set(session_, endpoint_.priority());
        if (rv != GNUTLS_E_SUCCESS)
            throw std::runtime_error(std::string("gnutls_priority_set failed: ") + gnutls_strerror(rv));

        rv = gnutls_credentials_set(session_, GNUTLS_CRD_CERTIFICATE, endpoint_.credentials());
        if (rv != GNUTLS_E_SUCCESS)
            throw std::runtime_error(std::string("gnutls_credentials_set failed: ") + gnutls_strerror(rv));

        gnutls_datum_t alpn{};
        alpn.data = reinterpret_cast<unsigned char *>(const_cast<char *>(QuicTransportConfig::kAlpn));
        alpn.size = static_cast<unsigned int>(std::strlen(QuicTransportConfig::kAlpn));
        rv = gnutls_alpn_set_protocols(session_, &alpn, 1, 0);
        if (rv != GNUTLS_E_SUCCESS)
            throw std::runtime_error(std::string("gnutls_alpn_set_protocols failed: ") + gnutls_strerror(rv));

        // No gnutls_server_name_set(): SNI stays off, server_name_ only labels the connection.
        gnutls_session_set_ptr(session_, &conn_ref_);
    }

    void QuicConnection::connect()
    {
        if (state_ != State::Idle)
            throw std::logic_error("QuicConnection::connect called twice");

        setup_tls();

        ngtcp2_cid dcid{}, scid{};
        random_cid(dcid, QuicTransportConfig::kDcidLen);
        random_cid(scid, QuicTransportConfig::kScidLen);

        ngtcp2_callbacks callbacks{};
        callbacks.client_initial = ngtcp2_crypto_client_initial_cb;
        callbacks.recv_crypto_data = ngtcp2_crypto_recv_crypto_data_cb;
        callbacks.encrypt = ngtcp2_crypto_encrypt_cb;
        callbacks.decrypt = ngtcp2_crypto_decrypt_cb;
        callbacks.hp_mask = ngtcp2_crypto_hp_mask_cb;
        callbacks.recv_retry = ngtcp2_crypto_recv_retry_cb;
        callbacks.update_key = ngtcp2_crypto_update_key_cb;
        callbacks.delete_crypto_aead_ctx = ngtcp2_crypto_delete_crypto_aead_ctx_cb;
        callbacks.delete_crypto_cipher_ctx = ngtcp2_crypto_delete_crypto_cipher_ctx_cb;
        callbacks.get_path_challenge_data = ngtcp2_crypto_get_path_challenge_data_cb;
        callbacks.version_negotiation = ngtcp2_crypto_version_negotiation_cb;
        callbacks.handshake_completed = &QuicConnection::on_handshake_completed;
        callbacks.get_new_connection_id = &QuicConnection::on_new_connection_id;
        callbacks.rand = &QuicConnection::on_rand;

        ngtcp2_settings settings;
        ngtcp2_settings_default(&settings);
        settings.initial_ts = timestamp();
        settings.max_tx_udp_payload_size = QuicTransportConfig::kMinMtu;
        settings.no_pmtud = QuicTransportConfig::kMtuDiscovery ? 0 : 1;

        ngtcp2_transport_params params;
        ngtcp2_transport_params_default(&params);
        params.max_idle_timeout = to_ngtcp2(QuicTransportConfig::kMaxIdleTimeout);

        ngtcp2_path path = make_path(endpoint_.local_address(), remote_);
        int rv = ngtcp2_conn_client_new(&conn_, &dcid, &scid, &path, NGTCP2_PROTO_VER_V1, &callbacks, &settings,
                                        &params, nullptr, this);
        if (rv != 0)
            throw std::runtime_error(std::string("ngtcp2_conn_client_new failed: ") + ngtcp2_strerror(rv));

        ngtcp2_conn_set_tls_native_handle(conn_, session_);
        ngtcp2_conn_set_keep_alive_timeout(conn_, to_ngtcp2(QuicTransportConfig::kKeepAlive));
        add_cid(scid);

        expiry_ = make_timer(endpoint_.base(), &QuicConnection::on_expiry, this);
        state_ = State::Handshaking;
        if (auto *diag = endpoint_.diag())
            diag->log("QUIC", "CONNECT id=" + std::to_string(id_) + " peer=" + remote_.to_string() +
                                  " name=" + server_name_);

        if (!flush())
            return;
        schedule_expiry();
    }

    void QuicConnection::on_datagram(const SocketAddress &from, const uint8_t *data, std::size_t len)
    {
        if (state_ != State::Handshaking)
            return;

        ngtcp2_path path = make_path(endpoint_.local_address(), from);
        ngtcp2_pkt_info pi{};
        int rv = ngtcp2_conn_read_pkt(conn_, &path, &pi, data, len, timestamp());
        if (rv != 0)
        {
            fail(std::string("read_pkt: ") + ngtcp2_strerror(rv));
            return;
        }
        if (!flush())
            return;
        if (handshake_done_)
        {
            complete();
            return;
        }
        schedule_expiry();
    }

    bool QuicConnection::flush()
    {
        Buffer buf;
        ngtcp2_path_storage ps;
        ngtcp2_path_storage_zero(&ps);
        ngtcp2_pkt_info pi{};
        ngtcp2_tstamp ts = timestamp();

        for (;;)
        {
            ngtcp2_ssize n = ngtcp2_conn_write_pkt(conn_, &ps.path, &pi, buf.data(), buf.size(), ts);
            if (n < 0)
            {
                fail(std::string("write_pkt: ") + ngtcp2_strerror(static_cast<int>(n)));
                return false;
            }
            if (n == 0)
                break;
            if (!endpoint_.send(remote_, buf.data(), static_cast<std::size_t>(n)))
            {
                fail("send failed");
                return false;
            }
        }
        ngtcp2_conn_update_pkt_tx_time(conn_, ts);
        return true;
    }

    void QuicConnection::schedule_expiry()
    {
        ngtcp2_tstamp expiry = ngtcp2_conn_get_expiry(conn_);
        if (expiry == UINT64_MAX)
        {
            evtimer_del(expiry_.get());
            return;
        }
        ngtcp2_tstamp now = timestamp();
        ngtcp2_duration wait = expiry > now ? expiry - now : 0;
        try
        {
            arm_timer(expiry_.get(), std::chrono::microseconds(wait / NGTCP2_MICROSECONDS));
        }
        catch (const std::runtime_error &e)
        {
            fail(e.what());
        }
    }

    void QuicConnection::handle_expiry()
    {
        if (state_ != State::Handshaking)
            return;
        int rv = ngtcp2_conn_handle_expiry(conn_, timestamp());
        if (rv != 0)
        {
            fail(std::string("expiry: ") + ngtcp2_strerror(rv));
            return;
        }
        if (!flush())
            return;
        schedule_expiry();
    }

    void QuicConnection::complete()
    {
        ngtcp2_conn_info info;
        ngtcp2_conn_get_conn_info(conn_, &info);
        rtt_us_ = info.smoothed_rtt / NGTCP2_MICROSECONDS;

        Buffer buf;
        ngtcp2_path_storage ps;
        ngtcp2_path_storage_zero(&ps);
        ngtcp2_pkt_info pi{};
        ngtcp2_ccerr ccerr;
        ngtcp2_ccerr_default(&ccerr);
        ngtcp2_ssize n = ngtcp2_conn_write_connection_close(conn_, &ps.path, &pi, buf.data(), buf.size(), &ccerr,
                                                            timestamp());
        bool closed = n > 0 && endpoint_.send(remote_, buf.data(), static_cast<std::size_t>(n));

        state_ = State::Done;
        evtimer_del(expiry_.get());
        if (auto *diag = endpoint_.diag())
            diag->log("QUIC", "DONE id=" + std::to_string(id_) + " peer=" + remote_.to_string() +
                                  " rtt_us=" + std::to_string(rtt_us_) + (closed ? "" : " (close not sent)"));
        endpoint_.connection_finished(id_);
    }

    void QuicConnection::fail(const std::string &why)
    {
        if (state_ == State::Done || state_ == State::Failed)
            return;
        state_ = State::Failed;
        rtt_us_ = kUnreachable;
        if (expiry_)
            evtimer_del(expiry_.get());
        if (auto *diag = endpoint_.diag())
            diag->log("QUIC", "FAILED id=" + std::to_string(id_) + " peer=" + remote_.to_string() + " " + why);
        endpoint_.connection_finished(id_);
    }

    void QuicConnection::add_cid(const ngtcp2_cid &cid)
    {
        cids_.push_back(cid);
        endpoint_.associate(cid, id_);
    }

    ngtcp2_conn *QuicConnection::get_conn(ngtcp2_crypto_conn_ref *ref)
    {
        return static_cast<QuicConnection *>(ref->user_data)->conn_;
    }

    int QuicConnection::on_handshake_completed(ngtcp2_conn *, void *user_data)
    {
        // Packets cannot be written from inside read_pkt; on_datagram finishes the job.
        static_cast<QuicConnection *>(user_data)->handshake_done_ = true;
        return 0;
    }

    int QuicConnection::on_new_connection_id(ngtcp2_conn *, ngtcp2_cid *cid, uint8_t *token, size_t cidlen,
                                             void *user_data)
    {
        auto *self = static_cast<QuicConnection *>(user_data);
        cid->datalen = cidlen;
        if (gnutls_rnd(GNUTLS_RND_RANDOM, cid->data, cidlen) != 0 ||
            gnutls_rnd(GNUTLS_RND_RANDOM, token, NGTCP2_STATELESS_RESET_TOKENLEN) != 0)
            return NGTCP2_ERR_CALLBACK_FAILURE;
        self->add_cid(*cid);
        return 0;
    }

    void QuicConnection::on_rand(uint8_t *dest, size_t destlen, const ngtcp2_rand_ctx *)
    {
        // Only used for padding and packet-number noise.
        if (gnutls_rnd(GNUTLS_RND_NONCE, dest, destlen) != 0)
            std::fill(dest, dest + destlen, 0);
    }

    void QuicConnection::on_expiry(evutil_socket_t, short, void *arg)
    {
        static_cast<QuicConnection *>(arg)->handle_expiry();
    }
} // namespace qdist
