#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace http {

/**
 * @brief RAII helper managing global libcurl initialization.
 *
 * Instantiate once in `main` before any request is issued.
 */
struct CurlInitGuard {
    CurlInitGuard();  ///< Calls `curl_global_init(CURL_GLOBAL_DEFAULT)`
    ~CurlInitGuard(); ///< Calls `curl_global_cleanup()`
    CurlInitGuard(const CurlInitGuard&) = delete;
    CurlInitGuard& operator=(const CurlInitGuard&) = delete;
};

// RAII wrappers for libcurl resources
template <typename T, void (*Free)(T*)> struct CurlHandle {
    T* h;
    explicit CurlHandle(T* h_ = nullptr) : h(h_) {}
    ~CurlHandle() {
        if (h)
            Free(h);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    T* get() const { return h; }
};

using easy_ptr = CurlHandle<CURL, curl_easy_cleanup>;

/**
 * @brief Raised when a request could not complete at the transport level.
 */
class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Status and body of a completed request.
 */
struct Response {
    long status = 0;
    std::string body;

    /** @return `true` for 2xx status codes. */
    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Description of one request.
 */
struct Request {
    std::string url;
    std::vector<std::string> headers; ///< Raw "Name: value" lines
    std::string body;                 ///< Sent as POST body when @ref post is true
    bool post = false;
    std::string proxy; ///< Optional proxy URL, empty for none
};

/**
 * @brief Perform a single blocking request.
 *
 * Redirects are followed and TLS peers are verified. There is no retry.
 *
 * @throws TransportError when libcurl reports a failure before an HTTP
 *         status is available.
 */
Response perform(const Request& req);

/**
 * @brief Percent-encode @p s for use inside a URL path segment.
 */
std::string escape(const std::string& s);

} // namespace http

#endif // HTTP_UTILS_HPP
