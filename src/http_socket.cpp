// HTTP/HTTPS POST over POSIX sockets + OpenSSL (1.1+ initialises itself).
// Every request runs against a single deadline so a stalled model server
// surfaces as a failed response instead of a hung build.
#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace slidesearch {

using Clock = std::chrono::steady_clock;

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("invalid URL (no host): " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    Clock::time_point deadline;
    bool timed_out = false;
    std::string error;

    explicit Connection(Clock::time_point d) : deadline(d) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    long remaining_ms() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        return left > 0 ? static_cast<long>(left) : 0;
    }

    bool expired() {
        if (remaining_ms() == 0) timed_out = true;
        return timed_out;
    }

    bool connect(const ParsedUrl& url) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "cannot resolve " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected && !expired(); ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so the deadline applies.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                long ms = remaining_ms();
                struct timeval tv{ms / 1000, (ms % 1000) * 1000};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            if (expired()) error = "timed out connecting to " + url.host;
            else error = "cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        if (url.tls) {
            set_socket_timeout(remaining_ms());

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "SSL_CTX_new failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "SSL_new failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                unsigned long code = ERR_get_error();
                char buf[256] = "unknown error";
                if (code != 0) ERR_error_string_n(code, buf, sizeof(buf));
                error = expired() ? "timed out during TLS handshake with " + url.host
                                  : std::string("TLS handshake failed: ") + buf;
                return false;
            }
        }

        // Short I/O slices so read_some() can re-check the deadline.
        set_socket_timeout(std::min(remaining_ms(), 1000L));
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error or deadline.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (expired()) return -1;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // slice expired
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (expired()) return false;
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
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    void set_socket_timeout(long ms) {
        if (ms <= 0) ms = 1;
        struct timeval tv{ms / 1000, (ms % 1000) * 1000};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

// Parse status line + headers; populates is_chunked / content_length.
// Returns 0 if no valid status line arrived.
static long parse_response_headers(Connection& conn, std::string& leftover,
                                    bool& is_chunked, size_t& content_length) {
    is_chunked     = false;
    content_length = 0;

    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return 0;

    // "HTTP/1.1 200 OK" -> 200
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || sp1 + 4 > status_line.size()) return 0;
    long status = std::strtol(status_line.substr(sp1 + 1, 3).c_str(), nullptr, 10);
    if (status < 100) return 0;

    std::string line;
    while (read_line(conn, leftover, line)) {
        if (line.empty()) break; // blank line -> end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding")
            is_chunked = (value.find("chunked") != std::string::npos);
        else if (name == "content-length")
            content_length = std::strtoul(value.c_str(), nullptr, 10);
    }
    return status;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

// Accumulate full body (handles chunked + content-length + read-to-close).
// Returns false if the connection failed before the body was complete.
static bool read_body(Connection& conn, std::string& leftover,
                       bool is_chunked, size_t content_length, std::string& body) {
    if (is_chunked) {
        std::string size_line;
        while (read_line(conn, leftover, size_line)) {
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return true;
            if (!read_exactly(conn, leftover, chunk_size, body)) return false;
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) return false;
        }
        return false;
    }
    if (content_length > 0) {
        return read_exactly(conn, leftover, content_length, body);
    }

    body += leftover;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) return true;
        if (n < 0) return false;
        body.append(buf, static_cast<size_t>(n));
    }
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url_str,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    HttpResponse resp;

    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::runtime_error& e) {
        resp.error = e.what();
        return resp;
    }

    Connection conn(Clock::now() + std::chrono::seconds(std::max(timeout_seconds, 1L)));
    if (!conn.connect(url)) {
        resp.error = conn.error;
        return resp;
    }

    std::string request = build_request(url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.error = conn.timed_out ? "timed out sending request to " + url.host
                                    : "failed sending request to " + url.host;
        return resp;
    }

    std::string leftover;
    bool   is_chunked     = false;
    size_t content_length = 0;
    long status = parse_response_headers(conn, leftover, is_chunked, content_length);
    if (status == 0) {
        resp.error = conn.timed_out ? "timed out waiting for " + url.host
                                    : "invalid HTTP response from " + url.host;
        return resp;
    }

    std::string payload;
    if (!read_body(conn, leftover, is_chunked, content_length, payload)) {
        resp.error = conn.timed_out ? "timed out reading response from " + url.host
                                    : "connection closed mid-response by " + url.host;
        return resp;
    }

    resp.status_code = status;
    resp.body = std::move(payload);
    return resp;
}

} // namespace slidesearch
