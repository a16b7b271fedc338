// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Same public API as http.cpp (libcurl); http_init/cleanup are no-ops
// because OpenSSL 1.1+ initialises itself.
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
#include <string>

namespace graphmem {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

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
    out.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos) {
        out.host = host_port.substr(0, colon);
        out.port = host_port.substr(colon + 1);
    } else {
        out.host = host_port;
        out.port = out.tls ? "443" : "80";
    }
    return !out.host.empty();
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
            return false;

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            connected = connect_with_timeout(ai, timeout_secs);
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) return false;

        // Whole request budget for the handshake and the (non-streamed)
        // response; reads still wake every second to honour the abort flag.
        set_socket_timeout(1);
        deadline_slices_ = timeout_secs;

        if (url.tls) {
            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) return false;
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) return false;
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            set_socket_timeout(timeout_secs);
            if (SSL_connect(ssl) != 1) return false;
            set_socket_timeout(1);
        }
        return true;
    }

    // Returns >0 on data, 0 on EOF, -1 on error, abort or timeout.
    ssize_t read_some(char* buf, size_t len) {
        long idle = 0;
        while (true) {
            if (g_socket_abort_flag &&
                g_socket_abort_flag->load(std::memory_order_relaxed))
                return -1;

            ssize_t n;
            bool would_block = false;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                would_block = err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE ||
                              (err == SSL_ERROR_SYSCALL &&
                               (errno == EAGAIN || errno == EWOULDBLOCK));
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                would_block = errno == EAGAIN || errno == EWOULDBLOCK;
            }
            if (!would_block) return -1;
            if (++idle > deadline_slices_) return -1;
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
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
    long deadline_slices_ = 120;

    bool connect_with_timeout(const struct addrinfo* ai, long timeout_secs) {
        // Non-blocking connect so we can honour timeout_secs.
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            fcntl(fd, F_SETFL, flags);
            return true;
        }
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
        fcntl(fd, F_SETFL, flags);
        return true;
    }

    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
    }
    if (method == "POST")
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response reading ───────────────────────────────────────────

class ResponseReader {
public:
    explicit ResponseReader(Connection& conn) : conn_(conn) {}

    // Status line + headers. Returns 0 if the response is unreadable.
    long read_head() {
        std::string status_line;
        if (!read_line(status_line) || status_line.empty()) return 0;

        // "HTTP/1.1 200 OK": the three-digit code follows the first space
        size_t sp = status_line.find(' ');
        if (sp == std::string::npos || sp + 4 > status_line.size()) return 0;
        long status = std::strtol(status_line.c_str() + sp + 1, nullptr, 10);
        if (status < 100 || status > 599) return 0;

        std::string line;
        while (read_line(line) && !line.empty()) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = lower(line.substr(0, colon));
            std::string value = lower(line.substr(colon + 1));
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "transfer-encoding")
                chunked_ = value.find("chunked") != std::string::npos;
            else if (name == "content-length")
                content_length_ = std::strtoul(value.c_str(), nullptr, 10);
        }
        return status;
    }

    // Full body: chunked, content-length, or read-to-close.
    std::string read_body() {
        std::string body;
        if (chunked_) {
            std::string size_line;
            while (read_line(size_line) && !size_line.empty()) {
                // Chunk size is hex, may have extensions after ';'
                size_t chunk = std::strtoul(size_line.c_str(), nullptr, 16);
                if (chunk == 0) break;
                if (!read_exactly(chunk, body)) break;
                std::string crlf;
                read_exactly(2, crlf);
            }
        } else if (content_length_ > 0) {
            read_exactly(content_length_, body);
        } else {
            body += leftover_;
            leftover_.clear();
            char buf[4096];
            ssize_t n;
            while ((n = conn_.read_some(buf, sizeof(buf))) > 0)
                body.append(buf, static_cast<size_t>(n));
        }
        return body;
    }

private:
    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    bool fill() {
        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover_.append(buf, static_cast<size_t>(n));
        return true;
    }

    bool read_line(std::string& line) {
        size_t pos;
        while ((pos = leftover_.find('\n')) == std::string::npos) {
            if (!fill()) return false;
        }
        line = leftover_.substr(0, pos);
        leftover_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    bool read_exactly(size_t n, std::string& out) {
        while (leftover_.size() < n) {
            if (!fill()) {
                out += leftover_;
                leftover_.clear();
                return false;
            }
        }
        out.append(leftover_, 0, n);
        leftover_.erase(0, n);
        return true;
    }

    Connection& conn_;
    std::string leftover_;
    bool chunked_ = false;
    size_t content_length_ = 0;
};

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                long timeout_secs) {
    ParsedUrl url;
    if (!parse_url(url_str, url)) return {};

    Connection conn;
    if (!conn.connect(url, timeout_secs)) return {};

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    ResponseReader reader(conn);
    long status = reader.read_head();
    if (status == 0) return {};

    HttpResponse resp;
    resp.status_code = status;
    resp.body = reader.read_body();
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds);
}

} // namespace graphmem

#endif // __linux__
