// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Same public API as http_curl.cpp; http_init/cleanup are no-ops
// (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

namespace autoship {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

static bool abort_requested() {
    return g_socket_abort_flag &&
           g_socket_abort_flag->load(std::memory_order_relaxed);
}

// ── URL parsing ────────────────────────────────────────────────

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target; // path + query, always starts with '/'
};

static std::optional<Endpoint> parse_endpoint(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    Endpoint ep;
    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https") {
        ep.tls = true;
    } else if (scheme != "http") {
        return std::nullopt;
    }

    size_t authority_start = scheme_end + 3;
    size_t slash = url.find('/', authority_start);
    std::string authority = url.substr(authority_start,
        slash == std::string::npos ? std::string::npos : slash - authority_start);
    ep.target = slash == std::string::npos ? "/" : url.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = ep.tls ? "443" : "80";
    }
    if (ep.host.empty()) return std::nullopt;
    return ep;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const Endpoint& ep, long timeout_secs) {
        if (!open_tcp(ep, timeout_secs)) return false;
        if (ep.tls && !start_tls(ep, timeout_secs)) return false;
        // 1-second slices from here on so the abort flag is polled.
        set_io_timeout(1);
        return true;
    }

    // >0 bytes read, 0 on EOF, -1 on error or abort
    ssize_t read_some(char* buf, size_t len) {
        while (!abort_requested()) {
            if (ssl_) {
                int n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) continue;
                if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                return -1;
            }
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return n;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return -1;
        }
        return -1;
    }

    bool write_all(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            if (abort_requested()) return false;
            ssize_t n;
            if (ssl_) {
                n = SSL_write(ssl_, p, static_cast<int>(left));
                if (n <= 0) {
                    int err = SSL_get_error(ssl_, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) continue;
                    return false;
                }
            } else {
                n = ::send(fd_, p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool open_tcp(const Endpoint& ep, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(ep.host.c_str(), ep.port.c_str(), &hints, &res) != 0)
            return false;

        for (auto* ai = res; ai && fd_ < 0; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            if (connect_with_timeout(fd, ai, timeout_secs)) {
                fd_ = fd;
            } else {
                ::close(fd);
            }
        }
        freeaddrinfo(res);
        return fd_ >= 0;
    }

    static bool connect_with_timeout(int fd, const struct addrinfo* ai, long timeout_secs) {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0) {
            if (errno != EINPROGRESS) return false;
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd, &wset);
            struct timeval tv{timeout_secs, 0};
            if (select(fd + 1, nullptr, &wset, nullptr, &tv) <= 0) return false;
            int err = 0;
            socklen_t elen = sizeof(err);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
            if (err != 0) return false;
        }
        fcntl(fd, F_SETFL, flags);
        return true;
    }

    bool start_tls(const Endpoint& ep, long timeout_secs) {
        set_io_timeout(timeout_secs);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, ep.host.c_str()); // SNI
        SSL_set1_host(ssl_, ep.host.c_str());
        return SSL_connect(ssl_) == 1;
    }

    void set_io_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

// ── Request ────────────────────────────────────────────────────

static std::string serialize_request(const std::string& method,
                                     const Endpoint& ep,
                                     const std::string& body,
                                     const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + ep.target + " HTTP/1.1\r\n";
    req += "Host: " + ep.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response ───────────────────────────────────────────────────

// Buffered reader over a Connection; leftover bytes carry between calls.
class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Status line + headers. Returns 0 when no valid status line arrived.
    long read_head() {
        std::string status_line;
        if (!read_line(status_line)) return 0;
        size_t sp = status_line.find(' ');
        if (sp == std::string::npos || status_line.size() < sp + 4) return 0;
        long status = std::strtol(status_line.c_str() + sp + 1, nullptr, 10);

        std::string line;
        while (read_line(line) && !line.empty()) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = lowercase(line.substr(0, colon));
            std::string value = lowercase(line.substr(colon + 1));
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "transfer-encoding") {
                chunked_ = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                content_length_ = std::strtoul(value.c_str(), nullptr, 10);
                has_length_ = true;
            }
        }
        return status;
    }

    std::string read_body() {
        std::string body;
        if (chunked_) {
            std::string size_line;
            while (read_line(size_line)) {
                size_t chunk = std::strtoul(size_line.c_str(), nullptr, 16);
                if (chunk == 0) break;
                if (!read_exact(chunk, body)) break;
                std::string crlf;
                read_exact(2, crlf);
            }
        } else if (has_length_) {
            read_exact(content_length_, body);
        } else {
            body.swap(buffer_);
            char buf[4096];
            ssize_t n;
            while ((n = conn_.read_some(buf, sizeof(buf))) > 0) {
                body.append(buf, static_cast<size_t>(n));
            }
        }
        return body;
    }

private:
    static std::string lowercase(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        buffer_.append(buf, static_cast<size_t>(n));
        return true;
    }

    bool read_line(std::string& out) {
        size_t pos;
        while ((pos = buffer_.find('\n')) == std::string::npos) {
            if (!fill()) return false;
        }
        out = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        return true;
    }

    bool read_exact(size_t n, std::string& out) {
        while (buffer_.size() < n) {
            if (!fill()) {
                out += buffer_;
                buffer_.clear();
                return false;
            }
        }
        out.append(buffer_, 0, n);
        buffer_.erase(0, n);
        return true;
    }

    Connection& conn_;
    std::string buffer_;
    bool chunked_ = false;
    bool has_length_ = false;
    size_t content_length_ = 0;
};

static HttpResponse do_request(const std::string& method,
                               const std::string& url,
                               const std::string& body,
                               const std::vector<Header>& headers,
                               long timeout_secs) {
    auto ep = parse_endpoint(url);
    if (!ep) return {};

    Connection conn;
    if (!conn.open(*ep, timeout_secs)) return {};
    if (!conn.write_all(serialize_request(method, *ep, body, headers))) return {};

    ResponseReader reader(conn);
    HttpResponse resp;
    resp.status_code = reader.read_head();
    if (resp.status_code == 0) return {};
    resp.body = reader.read_body();
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

} // namespace autoship

#endif // __linux__
