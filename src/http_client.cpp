// ===================== src/http_client.cpp =====================
#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "dns_resolver.hpp"
#include "parsed_url.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"

using namespace std;

namespace qdist {

namespace {

string lower(string s) {
    transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return s;
}

bool is_chunked(const string& headers) {
    string h = lower(headers);
    size_t pos = h.find("\r\ntransfer-encoding:");
    if (pos == string::npos) return false;
    size_t end = h.find("\r\n", pos + 2);
    return h.substr(pos, end == string::npos ? string::npos : end - pos).find("chunked") != string::npos;
}

} // namespace

string decode_chunked(const string& body) {
    string decoded;
    size_t pos = 0;
    while (pos < body.size()) {
        size_t line_end = body.find("\r\n", pos);
        if (line_end == string::npos) throw runtime_error("Truncated chunk header");
        string size_str = body.substr(pos, line_end - pos);
        size_t ext = size_str.find(';');
        if (ext != string::npos) size_str.resize(ext);

        size_t chunk_size = 0;
        try {
            size_t used = 0;
            chunk_size = stoul(size_str, &used, 16);
            if (used == 0) throw invalid_argument(size_str);
        } catch (const logic_error&) {
            throw runtime_error("Bad chunk size '" + size_str + "'");
        }
        pos = line_end + 2;
        if (chunk_size == 0) return decoded;
        if (chunk_size > body.size() - pos) throw runtime_error("Truncated chunk");
        decoded.append(body, pos, chunk_size);
        pos += chunk_size + 2; // skip CRLF
    }
    throw runtime_error("Missing last chunk");
}

HttpResponse parse_response(const string& raw) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == string::npos) throw runtime_error("Malformed HTTP response (no header end)");

    HttpResponse resp;
    resp.headers = raw.substr(0, header_end);
    resp.body = raw.substr(header_end + 4);

    // "HTTP/1.1 200 OK"
    size_t sp = resp.headers.find(' ');
    if (resp.headers.compare(0, 5, "HTTP/") != 0 || sp == string::npos || sp + 4 > resp.headers.size())
        throw runtime_error("Malformed HTTP status line");
    const string code = resp.headers.substr(sp + 1, 3);
    if (!all_of(code.begin(), code.end(), [](unsigned char c) { return isdigit(c) != 0; }))
        throw runtime_error("Malformed HTTP status code '" + code + "'");
    resp.status = stoi(code);

    if (is_chunked(resp.headers)) resp.body = decode_chunked(resp.body);
    return resp;
}

string HttpClient::get(const string& url) const {
    return exchange(url, false, string(), string());
}

string HttpClient::post(const string& url, const string& body, const string& content_type) const {
    return exchange(url, true, body, content_type);
}

string HttpClient::exchange(const string& url, bool post, const string& body, const string& content_type) const {
    ParsedURL parsed(url);
    const string req = post ? parsed.toPostRequestString(body, content_type) : parsed.toGetRequestString();
    auto addrs = DNSResolver::resolve(parsed.host, parsed.port);

    TcpSocket tcp;
    bool connected = false;
    for (const auto& ra : addrs) {
        if (tcp.connectTo(ra)) {
            connected = true;
            if (diag_) diag_->log("HTTP", "CONNECTED " + ra.address.to_string());
            break;
        }
    }
    if (!connected)
        throw runtime_error("Connect failed for all resolved addresses of " + parsed.host);
    if (diag_) diag_->log("HTTP", string(post ? "POST " : "GET ") + url);

    string raw;
    if (parsed.secure()) {
        SslSession tls;
        tls.handshake(tcp.fd(), parsed.host);
        if (!tls.sendAll(req)) throw runtime_error("TLS send to " + parsed.host + " failed");
        raw = tls.recvAll();
    } else {
        if (!tcp.sendAll(req)) throw runtime_error("TCP send to " + parsed.host + " failed");
        raw = tcp.recvAll();
    }

    HttpResponse resp = parse_response(raw);
    if (diag_)
        diag_->log("HTTP", "STATUS " + to_string(resp.status) + " bytes=" + to_string(resp.body.size()));
    if (resp.status < 200 || resp.status > 299)
        throw runtime_error("HTTP " + to_string(resp.status) + " from " + parsed.host);
    return resp.body;
}

} // namespace qdist
