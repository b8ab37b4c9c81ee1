#include "io/http_client.hpp"
#include "core/errors.hpp"
#include <cpl_http.h>
#include <cpl_string.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>
#include <thread>

namespace geosplit {
namespace io {

namespace {

// Releases a CPLHTTPResult
struct HttpResultDeleter {
    void operator()(CPLHTTPResult* result) const {
        CPLHTTPDestroyResult(result);
    }
};

// CPLHTTPFetch reports HTTP errors as "HTTP error code : <n>" in the error buffer
int parseHttpErrorCode(const char* error_buffer) {
    if (!error_buffer) {
        return 0;
    }
    const char* marker = strstr(error_buffer, "HTTP error code");
    if (!marker) {
        return 0;
    }
    const char* colon = strchr(marker, ':');
    return colon ? atoi(colon + 1) : 0;
}

} // namespace

CplHttpClient::CplHttpClient(int timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
}

HttpResponse CplHttpClient::get(const std::string& url) {
    CPLStringList options;
    options.SetNameValue("TIMEOUT", std::to_string(timeout_seconds_).c_str());
    options.SetNameValue("MAX_RETRY", "0");

    std::unique_ptr<CPLHTTPResult, HttpResultDeleter> result(CPLHTTPFetch(url.c_str(), options.List()));
    if (!result) {
        throw core::TransientIOError("HTTP request failed: " + url);
    }

    std::string body;
    if (result->pabyData && result->nDataLen > 0) {
        body.assign(reinterpret_cast<const char*>(result->pabyData), static_cast<size_t>(result->nDataLen));
    }

    if (result->nStatus != 0) {
        std::string message = result->pszErrBuf ? result->pszErrBuf : "unknown transport error";
        int code = parseHttpErrorCode(result->pszErrBuf);
        if (code == 0) {
            throw core::TransientIOError("HTTP request to " + url + " failed: " + message);
        }
        return HttpResponse(code, body, message);
    }

    return HttpResponse(200, body);
}

int RetryPolicy::backoffMs(int attempt) const {
    double delay = initial_backoff_ms * std::pow(backoff_multiplier, std::max(attempt - 1, 0));
    return static_cast<int>(std::min(delay, static_cast<double>(max_backoff_ms)));
}

HttpResponse fetchWithRetry(HttpClient& client, const std::string& url, const RetryPolicy& policy,
                            core::SourceMetrics* metrics) {
    std::string last_error;

    for (int attempt = 0; attempt <= policy.max_retries; ++attempt) {
        if (attempt > 0) {
            if (metrics) {
                metrics->http_retries++;
            }
            int delay = policy.backoffMs(attempt);
            std::cerr << "Warning: Retrying " << url << " in " << delay << " ms (attempt " << attempt
                      << " of " << policy.max_retries << "): " << last_error << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }

        try {
            HttpResponse response = client.get(url);
            if (!response.isRetryable()) {
                return response;
            }
            last_error = "HTTP " + std::to_string(response.status) +
                         (response.error.empty() ? std::string() : ": " + response.error);
        } catch (const core::TransientIOError& e) {
            last_error = e.what();
        }
    }

    throw core::RangeFailure("Giving up on " + url + " after " + std::to_string(policy.max_retries) +
                             " retries: " + last_error);
}

} // namespace io
} // namespace geosplit
