#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace shipyard {

// ============================================================================
// HTTP Transport
// ============================================================================

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    long timeout_seconds = 300;          // whole exchange, 0 for no limit
    long stall_timeout_seconds = 60;     // abort below 1 byte/s for this long
};

struct HttpResponse {
    bool ok = false;            // transport succeeded (any status)
    std::string error;          // transport failure message
    long status = 0;
    std::string content_type;
    std::vector<uint8_t> body;

    bool success() const { return ok && status >= 200 && status < 300; }
    std::string body_text() const { return std::string(body.begin(), body.end()); }
};

/**
 * Performs one HTTP exchange.
 *
 * Implementations must be safe to call from several threads at once;
 * the upload engine shares one transport between its workers.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

struct CurlTransportOptions {
    std::string ca_bundle_path;          // empty: system default
    long connect_timeout_seconds = 30;
    std::string user_agent = "shipyard/1.0";
};

// libcurl transport; one easy handle per request
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(CurlTransportOptions options = {});

    HttpResponse perform(const HttpRequest& request) override;

private:
    CurlTransportOptions options_;
};

// RFC 3986 percent-encoding of everything but unreserved characters
std::string url_encode(const std::string& value);

} // namespace shipyard
