#include <catch2/catch.hpp>
#include "http.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <string>
#include <thread>

using namespace slidesearch;

// Accepts one connection on 127.0.0.1, captures the request headers and
// replies with a canned response (or holds the socket open without replying).
struct OneShotServer {
    int listen_fd = -1;
    int port = 0;
    std::string reply;
    bool silent = false;
    std::string request;
    std::thread worker;

    explicit OneShotServer(std::string canned, bool stay_silent = false)
        : reply(std::move(canned)), silent(stay_silent) {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(listen_fd, 1);
        socklen_t len = sizeof(addr);
        getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);

        worker = std::thread([this] { serve(); });
    }

    ~OneShotServer() {
        if (worker.joinable()) worker.join();
        if (listen_fd >= 0) close(listen_fd);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }

private:
    void serve() {
        int fd = accept(listen_fd, nullptr, nullptr);
        if (fd < 0) return;
        char buf[4096];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            request.append(buf, static_cast<size_t>(n));
        }
        if (silent) {
            // hold the connection until the client gives up
            while (recv(fd, buf, sizeof(buf), 0) > 0) {}
        } else {
            send(fd, reply.data(), reply.size(), MSG_NOSIGNAL);
            // drain the request body so close() does not reset the connection
            shutdown(fd, SHUT_WR);
            while (recv(fd, buf, sizeof(buf), 0) > 0) {}
        }
        close(fd);
    }
};

TEST_CASE("SocketHttpClient: reads status and content-length body", "[http]") {
    OneShotServer server("HTTP/1.1 200 OK\r\n"
                         "Content-Type: application/json\r\n"
                         "Content-Length: 16\r\n"
                         "\r\n"
                         "{\"embeddings\":1}");
    SocketHttpClient client;

    auto resp = client.post(server.url("/api/embed"), "{\"input\":[]}",
                            {{"Content-Type", "application/json"}}, 5);

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "{\"embeddings\":1}");
    REQUIRE(resp.error.empty());

    server.worker.join();
    REQUIRE(server.request.rfind("POST /api/embed HTTP/1.1\r\n", 0) == 0);
    REQUIRE(server.request.find("Content-Type: application/json\r\n") != std::string::npos);
}

TEST_CASE("SocketHttpClient: decodes chunked bodies", "[http]") {
    OneShotServer server("HTTP/1.1 200 OK\r\n"
                         "Transfer-Encoding: chunked\r\n"
                         "\r\n"
                         "5\r\nhello\r\n"
                         "6\r\n world\r\n"
                         "0\r\n\r\n");
    SocketHttpClient client;

    auto resp = client.post(server.url("/"), "", {}, 5);
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "hello world");
}

TEST_CASE("SocketHttpClient: error status is returned, not thrown", "[http]") {
    OneShotServer server("HTTP/1.1 503 Service Unavailable\r\n"
                         "Content-Length: 4\r\n"
                         "\r\n"
                         "busy");
    SocketHttpClient client;

    auto resp = client.post(server.url("/v1/embeddings"), "{}", {}, 5);
    REQUIRE(resp.status_code == 503);
    REQUIRE(resp.body == "busy");
}

TEST_CASE("SocketHttpClient: silent server times out", "[http]") {
    OneShotServer server("", true);
    SocketHttpClient client;

    auto start = std::chrono::steady_clock::now();
    auto resp = client.post(server.url("/"), "{}", {}, 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(resp.status_code == 0);
    REQUIRE(resp.error.find("timed out") != std::string::npos);
    REQUIRE(elapsed < std::chrono::seconds(5));
}

TEST_CASE("SocketHttpClient: bad URLs fail without a request", "[http]") {
    SocketHttpClient client;

    auto resp = client.post("ftp://example.com/x", "", {}, 1);
    REQUIRE(resp.status_code == 0);
    REQUIRE(resp.error.find("unsupported URL scheme") != std::string::npos);

    resp = client.post("not a url", "", {}, 1);
    REQUIRE(resp.status_code == 0);
    REQUIRE_FALSE(resp.error.empty());
}
