#ifndef GEOSPLIT_HTTP_CLIENT_HPP
#define GEOSPLIT_HTTP_CLIENT_HPP

#include <memory>
#include <string>
#include "core/source_metrics.hpp"

namespace geosplit {
namespace io {

/**
 * Result of an HTTP GET
 */
struct HttpResponse {
    int status;          // HTTP status code
    std::string body;
    std::string error;   // Transport or server error message, empty on success

    HttpResponse() : status(0) {}
    HttpResponse(int code, std::string content, std::string message = "")
        : status(code), body(std::move(content)), error(std::move(message)) {}

    bool isSuccess() const { return status >= 200 && status < 300; }
    bool isRetryable() const { return status == 429 || status >= 500; }
};

/**
 * Minimal HTTP interface used by the feature service source
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * Issue a GET request
     * @param url Absolute URL
     * @return Response for any HTTP status
     * @throws core::TransientIOError on transport failures (DNS, connection, timeout)
     */
    virtual HttpResponse get(const std::string& url) = 0;
};

/**
 * HttpClient backed by GDAL's CPLHTTPFetch (libcurl)
 */
class CplHttpClient : public HttpClient {
public:
    /**
     * @param timeout_seconds Request timeout
     */
    explicit CplHttpClient(int timeout_seconds = 60);

    HttpResponse get(const std::string& url) override;

private:
    int timeout_seconds_;
};

/**
 * Retry budget for page fetches
 */
struct RetryPolicy {
    int max_retries;
    int initial_backoff_ms;
    double backoff_multiplier;
    int max_backoff_ms;

    RetryPolicy()
        : max_retries(5),
          initial_backoff_ms(500),
          backoff_multiplier(2.0),
          max_backoff_ms(30000) {}

    /**
     * Delay before a retry attempt (1-based)
     */
    int backoffMs(int attempt) const;
};

/**
 * GET with exponential backoff on transport errors, 429 and 5xx
 * @param client HTTP client
 * @param url URL to fetch
 * @param policy Retry budget
 * @param metrics Counters to update, may be null
 * @return Last response; non-retryable statuses such as 404 are returned as-is
 * @throws core::RangeFailure when the retry budget is exhausted
 */
HttpResponse fetchWithRetry(HttpClient& client, const std::string& url, const RetryPolicy& policy,
                            core::SourceMetrics* metrics);

} // namespace io
} // namespace geosplit

#endif // GEOSPLIT_HTTP_CLIENT_HPP
