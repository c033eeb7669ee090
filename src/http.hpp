#pragma once
#include <string>
#include <vector>
#include <utility>

namespace slidesearch {

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = transport failure, see error
    std::string body;
    std::string error;      // why the request failed before a status arrived
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // POST body to url. The whole exchange (connect, TLS handshake, send,
    // receive) must finish within timeout_seconds; on expiry the response
    // has status_code 0 and error set.
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;
};

// POSIX sockets + OpenSSL. Each call opens its own connection, so one
// instance may be shared between threads.
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
};

} // namespace slidesearch
