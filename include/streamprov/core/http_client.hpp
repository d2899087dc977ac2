// StreamProv - Dedicated stream provisioning service
// HTTP client abstraction
//
// Responsibilities:
// - Narrow request/response interface used by the streaming-server adapter
// - Boost.Beast implementation, one connection per request
// - URL parsing and query-string encoding helpers

#ifndef STREAMPROV_CORE_HTTP_CLIENT_HPP
#define STREAMPROV_CORE_HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "streamprov/core/result.hpp"

namespace streamprov {
namespace core {

// =============================================================================
// HTTP Client Types
// =============================================================================

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpResponse {
    int statusCode = 0;
    std::string contentType;
    std::string body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

struct HttpError {
    enum class Code {
        None,
        InvalidUrl,
        ConnectionFailed,
        Timeout,
        InvalidResponse
    };

    Code code = Code::None;
    std::string message;

    HttpError() = default;
    HttpError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
};

/**
 * @brief Components of an http:// URL.
 */
struct ParsedUrl {
    std::string host;
    uint16_t port = 80;
    std::string target = "/";  ///< Path plus query string
};

/**
 * @brief Parse an absolute http:// URL.
 *
 * Only plain HTTP is accepted; the admin interfaces this talks to do not
 * serve TLS.
 */
Result<ParsedUrl, HttpError> parseUrl(const std::string& url);

/**
 * @brief Percent-encode a query component (RFC 3986 unreserved set kept).
 */
std::string urlEncode(const std::string& value);

/**
 * @brief Build "k1=v1&k2=v2" with both keys and values encoded.
 */
std::string buildQueryString(const QueryParams& params);

// =============================================================================
// HTTP Client Interface
// =============================================================================

/**
 * @brief Interface for HTTP client operations.
 *
 * Allows replacing the transport in tests.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Perform an HTTP GET.
     *
     * @param request Target URL and extra headers
     * @param timeout Deadline for the whole exchange
     * @return Response for any HTTP status, or a transport error
     */
    virtual Result<HttpResponse, HttpError> get(
        const HttpRequest& request,
        std::chrono::milliseconds timeout
    ) = 0;
};

/**
 * @brief Synchronous HTTP/1.1 client on Boost.Beast.
 *
 * Each call resolves, connects, writes, reads and closes. Stateless and
 * safe to share between threads.
 */
class BeastHttpClient : public IHttpClient {
public:
    explicit BeastHttpClient(std::string userAgent = "streamprov/1.0");

    Result<HttpResponse, HttpError> get(
        const HttpRequest& request,
        std::chrono::milliseconds timeout
    ) override;

private:
    std::string userAgent_;
};

} // namespace core
} // namespace streamprov

#endif // STREAMPROV_CORE_HTTP_CLIENT_HPP
