#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mpupload::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_server_error_status(int status);

// Statuses the transport retries on its own (rate limiting, gateway errors).
bool is_retryable_status(int status);

// Single-valued header map; names compare case-insensitively and iterate
// in lowercase sorted order, which is the order SigV4 signs them in.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    const std::map<std::string, std::string>& all() const { return fields_; }

    void set_content_type(const std::string& content_type);
    std::optional<uint64_t> content_length() const;

private:
    std::map<std::string, std::string> fields_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds connect_timeout{60000};
    // Abort when no bytes move for this long (0 disables)
    std::chrono::milliseconds stall_timeout{60000};

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put(const std::string& url, std::vector<uint8_t>&& body);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Set when the request never produced an HTTP status
    std::string error;
    bool is_network_error = false;
    bool is_timeout = false;
};

struct HttpClientConfig {
    size_t max_idle_connections = 10;
    size_t max_response_size = 16 * 1024 * 1024;  // 0 = unlimited
    bool verify_ssl = true;
    std::string ca_bundle;                        // empty = system default
    std::string user_agent = "mpupload/1.0";
};

// libcurl client. Easy handles are pooled and reused so keep-alive
// connections survive between requests; execute() is thread-safe.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    // Retries connection failures and is_retryable_status() responses up to
    // max_retries extra times. Timeouts are returned to the caller untouched.
    HttpResponse execute_with_retry(const HttpRequest& request, int max_retries);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS Signature Version 4 (header-based)
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id,
                   std::string secret_access_key,
                   std::string region,
                   std::string service);

    void sign(HttpRequest& request) const;

    // Sign with an STS session token
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

    // Sign as if the clock read amz_date (yyyymmddThhmmssZ)
    void sign_at(HttpRequest& request, const std::string& amz_date) const;

private:
    std::string scope(const std::string& date) const;
    std::vector<uint8_t> signing_key(const std::string& date) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;     // includes ":port" when the URL names a non-default one
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// RFC 3986 encoding. Keeps '/' when encode_slash is false (object keys).
std::string url_encode(const std::string& str, bool encode_slash = true);

} // namespace mpupload::net
