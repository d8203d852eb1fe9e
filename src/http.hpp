#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace autoship {

// Process-wide setup and teardown, called once from main().
void http_init();
void http_cleanup();

// While *flag is true, in-flight requests give up within about a second
// and return status 0. Wired to SIGINT/SIGTERM by the CLI.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0: no response (connect, TLS, timeout or abort)
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }

    // Timeout, conflict, rate limit and server errors are worth another try.
    bool transient() const {
        return status_code == 408 || status_code == 409 || status_code == 429 ||
               (status_code >= 500 && status_code < 600);
    }
};

// Seam between the model provider and the network; tests inject a mock.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 300) = 0;
};

#ifdef __linux__

// POSIX sockets + OpenSSL.
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 300) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 300) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace autoship
