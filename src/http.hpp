#pragma once
#include <string>
#include <vector>
#include <utility>

namespace curbench {

class CancelToken; // forward declare

using Header = std::pair<std::string, std::string>;

// status_code == 0 means the request never produced a response
// (bad URL, connect/TLS failure, timeout or cancellation).
struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // When `cancel` is non-null the transfer aborts within ~1s of it firing.
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30,
                              const CancelToken* cancel = nullptr) = 0;
};

// Initialize / cleanup the HTTP subsystem (call once at startup / shutdown).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();
void http_cleanup();

// Platform-specific concrete implementations.
// Only one is compiled per build (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30,
                      const CancelToken* cancel = nullptr) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30,
                      const CancelToken* cancel = nullptr) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace curbench
