// Linux HTTP/HTTPS POST client using POSIX sockets + OpenSSL.
// Embedding requests are small request/response exchanges, so only
// buffered POST is supported; reads run in one-second slices so a
// CancelToken can abort a hung transfer.
#ifdef __linux__

#include "http.hpp"
#include "cancel.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace curbench {

void http_init() {}
void http_cleanup() {}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static bool parse_url(const std::string& url, ParsedUrl& out) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return false;
    out.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty()) return false;

    out.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        out.host = host_port.substr(0, colon);
        out.port = host_port.substr(colon + 1);
    } else {
        out.host = host_port;
        out.port = out.tls ? "443" : "80";
    }
    return true;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    Connection(const CancelToken* cancel, long timeout_secs)
        : cancel_(cancel)
        , deadline_(CancelToken::Clock::now() + std::chrono::seconds(timeout_secs))
    {}

    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd_ < 0) continue;
            connected = connect_nonblocking(ai, timeout_secs);
            if (!connected) { ::close(fd_); fd_ = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return false;

        if (url.tls && !start_tls(url.host, timeout_secs)) return false;

        // 1-second slices for body I/O so the cancel token is polled.
        set_socket_timeout(1);
        return true;
    }

    // >0 bytes read, 0 on EOF, -1 on I/O error, kAborted on cancellation or deadline.
    static constexpr ssize_t kAborted = -2;

    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (aborted()) return kAborted;

            ssize_t n;
            if (ssl_) {
                n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                return -1;
            }
            n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return -1;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (aborted()) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    return false;
                }
            } else {
                n = ::send(fd_, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool aborted() const {
        if (cancel_ && cancel_->cancelled()) return true;
        return CancelToken::Clock::now() >= deadline_;
    }

    bool connect_nonblocking(const struct addrinfo* ai, long timeout_secs) {
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            fcntl(fd_, F_SETFL, flags);
            return true;
        }
        if (errno != EINPROGRESS) return false;

        fd_set wset;
        FD_ZERO(&wset);
        FD_SET(fd_, &wset);
        struct timeval tv{timeout_secs, 0};
        if (select(fd_ + 1, nullptr, &wset, nullptr, &tv) <= 0) return false;

        int err = 0;
        socklen_t elen = sizeof(err);
        getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
        if (err != 0) return false;
        fcntl(fd_, F_SETFL, flags);
        return true;
    }

    bool start_tls(const std::string& host, long timeout_secs) {
        set_socket_timeout(timeout_secs);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, host.c_str()); // SNI
        return SSL_connect(ssl_) == 1;
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
    const CancelToken* cancel_;
    CancelToken::Clock::time_point deadline_;
};

// ── Request / response ─────────────────────────────────────────

static std::string build_post(const ParsedUrl& url,
                              const std::string& body,
                              const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// Read the whole response (Connection: close), then split head from body.
// Servers that drop TLS without close_notify surface as an I/O error after
// the data arrived; that still counts as a complete response.
static bool read_response(Connection& conn, std::string& raw) {
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == Connection::kAborted) return false;
        if (n < 0) return !raw.empty();
        if (n == 0) return true;
        raw.append(buf, static_cast<size_t>(n));
    }
}

static std::string dechunk(const std::string& data) {
    std::string out;
    size_t pos = 0;
    while (pos < data.size()) {
        size_t eol = data.find("\r\n", pos);
        if (eol == std::string::npos) break;
        // Chunk size is hex, may have extensions after ';'
        size_t chunk_size = std::strtoul(data.c_str() + pos, nullptr, 16);
        if (chunk_size == 0) break;
        pos = eol + 2;
        out.append(data, pos, std::min(chunk_size, data.size() - pos));
        pos += chunk_size + 2; // trailing \r\n
    }
    return out;
}

static HttpResponse parse_response(const std::string& raw) {
    size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) return {};

    std::string head = raw.substr(0, head_end);
    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = head.find(' ');
    if (sp1 == std::string::npos || sp1 + 4 > head.size()) return {};
    long status = std::strtol(head.c_str() + sp1 + 1, nullptr, 10);
    if (status < 100 || status > 599) return {};

    std::string lower_head = head;
    for (auto& c : lower_head) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    bool chunked = lower_head.find("transfer-encoding: chunked") != std::string::npos;

    HttpResponse resp;
    resp.status_code = status;
    std::string payload = raw.substr(head_end + 4);
    resp.body = chunked ? dechunk(payload) : std::move(payload);
    return resp;
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds,
                                    const CancelToken* cancel) {
    ParsedUrl parsed;
    if (!parse_url(url, parsed)) return {};

    Connection conn(cancel, timeout_seconds);
    if (!conn.open(parsed, timeout_seconds)) return {};

    std::string request = build_post(parsed, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    std::string raw;
    if (!read_response(conn, raw)) return {};
    return parse_response(raw);
}

} // namespace curbench

#endif // __linux__
