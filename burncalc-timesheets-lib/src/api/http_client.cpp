#include "api/http_client.hpp"
#include <curl/curl.h>
#include <thread>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <cctype>

namespace burncalc {
namespace timesheets {

// Static initialization
constexpr int HttpClient::RETRY_DELAYS_MS[];

// CURL write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// CURL header callback
static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    // Parse header line: "Name: Value\r\n"
    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = header.substr(0, colon_pos);
        std::string value = header.substr(colon_pos + 1);

        // Trim whitespace
        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        headers->insert({name, value});
    }

    return total_size;
}

struct HttpClient::Impl {
    CURL* curl;

    Impl() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl = curl_easy_init();
        if (!curl) {
            throw HttpClientError("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
        curl_global_cleanup();
    }
};

HttpClient::HttpClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , debug_(false)
{
    // Remove trailing slash from base_url
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

bool HttpClient::should_retry(int status_code) {
    // Retry on: timeout (408), rate limit (429), server errors (500-599)
    // Don't retry on: auth (401), forbidden (403), not found (404)
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    if (status_code >= 500 && status_code < 600) {
        return true;
    }
    return false;
}

std::string HttpClient::url_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string HttpClient::build_query_string(const QueryParams& params) {
    if (params.empty()) {
        return "";
    }

    std::string query = "?";
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) query += "&";
        query += url_encode(key) + "=" + url_encode(value);
        first = false;
    }
    return query;
}

HttpResponse HttpClient::execute_with_retry(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
{
    int attempt = 0;

    while (true) {
        auto start = std::chrono::steady_clock::now();

        // Reset CURL handle
        curl_easy_reset(impl_->curl);
        curl_easy_setopt(impl_->curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
        curl_easy_setopt(impl_->curl, CURLOPT_HTTPGET, 1L);

        // Set headers
        struct curl_slist* curl_headers = nullptr;
        for (const auto& [key, value] : headers) {
            // Redact token in debug logs
            if (debug_) {
                if (key == "Authorization") {
                    std::cerr << "[HttpClient] Header: " << key << ": [REDACTED]" << std::endl;
                } else {
                    std::cerr << "[HttpClient] Header: " << key << ": " << value << std::endl;
                }
            }

            std::string header_line = key + ": " + value;
            curl_headers = curl_slist_append(curl_headers, header_line.c_str());
        }

        if (curl_headers) {
            curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, curl_headers);
        }

        // Set callbacks
        std::string response_body;
        std::map<std::string, std::string> response_headers;

        curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &response_body);
        curl_easy_setopt(impl_->curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(impl_->curl, CURLOPT_HEADERDATA, &response_headers);

        if (debug_) {
            std::cerr << "[HttpClient] GET " << url << std::endl;
        }

        // Execute request
        CURLcode res = curl_easy_perform(impl_->curl);

        // Free headers
        if (curl_headers) {
            curl_slist_free_all(curl_headers);
        }

        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        // Check for CURL errors; these are never retried
        if (res != CURLE_OK) {
            std::string error_msg = "CURL error: ";
            error_msg += curl_easy_strerror(res);
            throw HttpClientError(error_msg);
        }

        // Get status code
        long status_code = 0;
        curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &status_code);

        if (debug_) {
            std::cerr << "[HttpClient] Status: " << status_code
                      << " (" << duration.count() << "ms)" << std::endl;
        }

        // Wait and retry transient failures
        if (should_retry(static_cast<int>(status_code)) && attempt < MAX_RETRIES - 1) {
            if (debug_) {
                std::cerr << "[HttpClient] Retrying in "
                          << RETRY_DELAYS_MS[attempt] << "ms..." << std::endl;
            }
            std::this_thread::sleep_for(
                std::chrono::milliseconds(RETRY_DELAYS_MS[attempt])
            );
            attempt++;
            continue;
        }

        // Check for error status codes
        if (status_code >= 400) {
            std::ostringstream oss;
            if (status_code == 401) {
                oss << "Authentication failed - check API_TOKEN";
            } else if (status_code == 403) {
                oss << "Access denied - the token cannot read this resource";
            } else if (status_code == 404) {
                oss << "Resource not found: " << url;
            } else if (status_code == 429) {
                oss << "Rate limited by timesheet API - please try again later";
            } else if (status_code >= 500) {
                oss << "Timesheet API server error - please try again later";
            } else {
                oss << "HTTP " << status_code << ": " << response_body;
            }
            throw HttpClientError(oss.str(), static_cast<int>(status_code));
        }

        // Build response
        HttpResponse response;
        response.status_code = static_cast<int>(status_code);
        response.body = response_body;
        response.headers = response_headers;
        response.duration = duration;
        return response;
    }
}

HttpResponse HttpClient::get(
    const std::string& path,
    const QueryParams& params,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry(base_url_ + path + build_query_string(params), headers);
}

} // namespace timesheets
} // namespace burncalc
