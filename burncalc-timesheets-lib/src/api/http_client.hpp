#pragma once

#include <string>
#include <map>
#include <memory>
#include <stdexcept>
#include <chrono>

namespace burncalc {
namespace timesheets {

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds duration;
};

/**
 * HTTP client error
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * Ordered query parameters; std::map keeps the encoded order stable
 */
using QueryParams = std::map<std::string, std::string>;

/**
 * HTTP GET client with retry logic and timeout support
 *
 * Features:
 * - Exponential backoff retry (1s, 2s, 4s max 3 retries) on 408, 429 and 5xx
 * - Configurable timeout (default 30s)
 * - Percent-encoded query strings
 * - Request/response logging to stderr in debug mode, with the
 *   Authorization header redacted
 */
class HttpClient {
public:
    /**
     * Constructor
     * @param base_url Base URL for all requests (e.g., "https://rest.tsheets.com/api/v1")
     * @param timeout_ms Timeout in milliseconds (default: 30000)
     */
    explicit HttpClient(const std::string& base_url, int timeout_ms = 30000);

    /**
     * Destructor
     */
    ~HttpClient();

    /**
     * GET request with automatic retry
     * @param path Path relative to base_url (e.g., "/timesheets")
     * @param params Query parameters, percent-encoded onto the URL
     * @param headers Additional headers (e.g., {"Authorization": "Bearer TOKEN"})
     * @return HttpResponse
     * @throws HttpClientError on transport failure or a status >= 400 after retries
     */
    HttpResponse get(const std::string& path,
                     const QueryParams& params = {},
                     const std::map<std::string, std::string>& headers = {});

    /**
     * Set debug mode (logs requests/responses, redacts tokens)
     */
    void set_debug(bool debug) { debug_ = debug; }

    const std::string& base_url() const { return base_url_; }

    /**
     * Percent-encode everything except RFC 3986 unreserved characters
     */
    static std::string url_encode(const std::string& value);

    /**
     * "?a=1&b=2", or "" for no parameters
     */
    static std::string build_query_string(const QueryParams& params);

    /**
     * Whether a status code is retried (408, 429, 5xx)
     */
    static bool should_retry(int status_code);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string base_url_;
    int timeout_ms_;
    bool debug_;

    // Retry logic
    static constexpr int MAX_RETRIES = 3;
    static constexpr int RETRY_DELAYS_MS[MAX_RETRIES] = {1000, 2000, 4000};

    HttpResponse execute_with_retry(
        const std::string& url,
        const std::map<std::string, std::string>& headers
    );
};

} // namespace timesheets
} // namespace burncalc
