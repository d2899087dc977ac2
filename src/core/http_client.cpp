// StreamProv - Dedicated stream provisioning service
// HTTP client implementation

#include "streamprov/core/http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace streamprov {
namespace core {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

// =============================================================================
// URL helpers
// =============================================================================

Result<ParsedUrl, HttpError> parseUrl(const std::string& url) {
    const std::string scheme = "http://";
    std::string lowerPrefix = url.substr(0, std::min(url.size(), scheme.size()));
    std::transform(lowerPrefix.begin(), lowerPrefix.end(), lowerPrefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowerPrefix != scheme) {
        return Result<ParsedUrl, HttpError>::error(
            HttpError(HttpError::Code::InvalidUrl, "Only http:// URLs are supported: " + url));
    }

    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash);

    ParsedUrl parsed;
    if (slash != std::string::npos) {
        parsed.target = rest.substr(slash);
        if (parsed.target.front() == '?') {
            parsed.target = "/" + parsed.target;
        }
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        if (portText.empty() || portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Result<ParsedUrl, HttpError>::error(
                HttpError(HttpError::Code::InvalidUrl, "Invalid port in URL: " + url));
        }
        unsigned long port = std::stoul(portText);
        if (port == 0 || port > 65535) {
            return Result<ParsedUrl, HttpError>::error(
                HttpError(HttpError::Code::InvalidUrl, "Port out of range in URL: " + url));
        }
        parsed.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return Result<ParsedUrl, HttpError>::error(
            HttpError(HttpError::Code::InvalidUrl, "Missing host in URL: " + url));
    }
    parsed.host = authority;

    return Result<ParsedUrl, HttpError>::success(std::move(parsed));
}

std::string urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string buildQueryString(const QueryParams& params) {
    std::string query;
    for (const auto& param : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += urlEncode(param.first);
        query += '=';
        query += urlEncode(param.second);
    }
    return query;
}

// =============================================================================
// BeastHttpClient
// =============================================================================

BeastHttpClient::BeastHttpClient(std::string userAgent)
    : userAgent_(std::move(userAgent))
{
}

Result<HttpResponse, HttpError> BeastHttpClient::get(
    const HttpRequest& request,
    std::chrono::milliseconds timeout)
{
    auto urlResult = parseUrl(request.url);
    if (urlResult.isError()) {
        return Result<HttpResponse, HttpError>::error(urlResult.error());
    }
    const ParsedUrl& url = urlResult.value();

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::empty_body> req{http::verb::get, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, userAgent_);
    req.set(http::field::connection, "close");
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    bool done = false;
    bool transportOk = false;
    HttpError failure;

    auto fail = [&](HttpError::Code code, const std::string& what, const beast::error_code& ec) {
        done = true;
        if (ec == beast::error::timeout || ec == asio::error::operation_aborted) {
            failure = HttpError(HttpError::Code::Timeout, what + " timed out");
        } else {
            failure = HttpError(code, what + " failed: " + ec.message());
        }
    };

    // Connect, write and read are bounded by the stream expiry; the
    // resolver is bounded by run_for below.
    stream.expires_after(timeout);

    resolver.async_resolve(url.host, std::to_string(url.port),
        [&](const beast::error_code& ec, tcp::resolver::results_type results) {
            if (ec) {
                fail(HttpError::Code::ConnectionFailed, "Resolve " + url.host, ec);
                return;
            }
            stream.async_connect(results,
                [&](const beast::error_code& ec, const tcp::endpoint&) {
                    if (ec) {
                        fail(HttpError::Code::ConnectionFailed, "Connect", ec);
                        return;
                    }
                    http::async_write(stream, req,
                        [&](const beast::error_code& ec, std::size_t) {
                            if (ec) {
                                fail(HttpError::Code::ConnectionFailed, "Write", ec);
                                return;
                            }
                            http::async_read(stream, buffer, res,
                                [&](const beast::error_code& ec, std::size_t) {
                                    if (ec) {
                                        fail(HttpError::Code::InvalidResponse, "Read", ec);
                                        return;
                                    }
                                    done = true;
                                    transportOk = true;
                                });
                        });
                });
        });

    ioc.run_for(timeout);

    if (!done) {
        // Deadline hit while resolving or before the stream timer fired;
        // cancel and drain so every handler runs before locals go away.
        resolver.cancel();
        beast::error_code ignored;
        stream.socket().close(ignored);
        ioc.restart();
        ioc.run();
        failure = HttpError(HttpError::Code::Timeout,
                            "Request to " + url.host + " timed out");
        transportOk = false;
    }

    if (!transportOk) {
        return Result<HttpResponse, HttpError>::error(failure);
    }

    beast::error_code shutdownEc;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdownEc);

    HttpResponse response;
    response.statusCode = static_cast<int>(res.result_int());
    auto contentType = res[http::field::content_type];
    response.contentType.assign(contentType.data(), contentType.size());
    response.body = std::move(res.body());
    return Result<HttpResponse, HttpError>::success(std::move(response));
}

} // namespace core
} // namespace streamprov
