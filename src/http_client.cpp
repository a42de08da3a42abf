#include "mpupload/http.hpp"
#include "mpupload/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <mutex>
#include <thread>
#include <utility>

namespace mpupload::net {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status / 100 == 2;
}

bool is_server_error_status(int status) {
    return status / 100 == 5;
}

bool is_retryable_status(int status) {
    // 507 and 524 are left to the caller
    switch (status) {
        case 429:
        case 502:
        case 503:
        case 504:
            return true;
        default:
            return false;
    }
}

std::string url_encode(const std::string& str, bool encode_slash) {
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        bool unreserved = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(static_cast<char>(std::toupper(HEX_DIGITS[c >> 4])));
            out.push_back(static_cast<char>(std::toupper(HEX_DIGITS[c & 0x0f])));
        }
    }
    return out;
}

// --- HttpHeaders ---

void HttpHeaders::set(const std::string& name, const std::string& value) {
    fields_[lowercase(name)] = value;
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = fields_.find(lowercase(name));
    if (it == fields_.end()) return std::nullopt;
    return it->second;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value || value->empty()) return std::nullopt;
    uint64_t n = 0;
    for (char c : *value) {
        if (c < '0' || c > '9') return std::nullopt;
        n = n * 10 + static_cast<uint64_t>(c - '0');
    }
    return n;
}

// --- Request / response ---

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t>&& body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = std::move(body);
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// --- ParsedUrl ---

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    auto sep = url.find("://");
    if (sep == std::string::npos || sep == 0) return std::nullopt;

    ParsedUrl parsed;
    parsed.scheme = url.substr(0, sep);

    std::string rest = url.substr(sep + 3);
    if (auto hash = rest.find('#'); hash != std::string::npos) {
        rest.resize(hash);
    }

    auto authority_end = rest.find_first_of("/?");
    parsed.host = rest.substr(0, authority_end);
    if (parsed.host.empty()) return std::nullopt;

    // curl leaves the default port out of Host; signing must agree
    const std::string default_port = parsed.scheme == "https" ? ":443" : ":80";
    if (parsed.host.ends_with(default_port)) {
        parsed.host.resize(parsed.host.size() - default_port.size());
    }

    if (authority_end == std::string::npos) return parsed;

    std::string target = rest.substr(authority_end);
    auto q = target.find('?');
    parsed.path = target.substr(0, q);
    if (q != std::string::npos) {
        parsed.query = target.substr(q + 1);
    }
    return parsed;
}

// --- HttpClient ---

namespace {

// Per-transfer state shared with the curl callbacks
struct Transfer {
    const std::vector<uint8_t>* upload = nullptr;
    size_t upload_offset = 0;

    std::vector<uint8_t> received;
    size_t receive_limit = 0;
    bool over_limit = false;

    HttpHeaders* response_headers = nullptr;
};

size_t on_body(char* data, size_t size, size_t count, void* user) {
    auto* t = static_cast<Transfer*>(user);
    size_t n = size * count;
    if (t->receive_limit > 0 && t->received.size() + n > t->receive_limit) {
        t->over_limit = true;
        return 0;
    }
    t->received.insert(t->received.end(), data, data + n);
    return n;
}

size_t on_header(char* data, size_t size, size_t count, void* user) {
    auto* t = static_cast<Transfer*>(user);
    size_t n = size * count;
    std::string line(data, n);

    // Each status line (100-continue, redirects) begins a fresh header block
    if (line.rfind("HTTP/", 0) == 0) {
        *t->response_headers = HttpHeaders{};
        return n;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        t->response_headers->set(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    return n;
}

size_t on_upload_read(char* buffer, size_t size, size_t count, void* user) {
    auto* t = static_cast<Transfer*>(user);
    size_t left = t->upload->size() - t->upload_offset;
    size_t n = std::min(size * count, left);
    if (n > 0) {
        std::memcpy(buffer, t->upload->data() + t->upload_offset, n);
        t->upload_offset += n;
    }
    return n;
}

// Lets curl rewind the body when it must resend it
int on_upload_seek(void* user, curl_off_t offset, int origin) {
    auto* t = static_cast<Transfer*>(user);
    if (origin != SEEK_SET || offset < 0 ||
        static_cast<uint64_t>(offset) > t->upload->size()) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    t->upload_offset = static_cast<size_t>(offset);
    return CURL_SEEKFUNC_OK;
}

long whole_seconds_ceil(std::chrono::milliseconds ms) {
    return std::max<long>(1, static_cast<long>((ms.count() + 999) / 1000));
}

}  // namespace

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });

        if (!config_.verify_ssl) {
            log_warn("TLS certificate verification is disabled; connections can be intercepted");
        }
    }

    ~Impl() {
        std::lock_guard lock(mutex_);
        for (CURL* h : idle_) curl_easy_cleanup(h);
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = checkout();
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }

        Transfer transfer;
        transfer.upload = &request.body;
        transfer.receive_limit = config_.max_response_size;
        transfer.response_headers = &response.headers;

        curl_slist* header_list = build_header_list(request.headers);
        configure(curl, request, transfer, header_list);

        CURLcode rc = curl_easy_perform(curl);
        if (rc == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(transfer.received);
        } else {
            response.is_network_error = true;
            response.is_timeout = (rc == CURLE_OPERATION_TIMEDOUT);
            response.error = transfer.over_limit
                ? "response body larger than " + std::to_string(config_.max_response_size) + " bytes"
                : std::string(curl_easy_strerror(rc));
        }

        curl_slist_free_all(header_list);
        checkin(curl);
        return response;
    }

    HttpResponse execute_with_retry(const HttpRequest& request, int max_retries) {
        auto delay = std::chrono::seconds(1);
        for (int retry = 0;; ++retry) {
            HttpResponse response = execute(request);
            bool again = response.is_network_error ? !response.is_timeout
                                                   : is_retryable_status(response.status_code);
            if (!again || retry >= max_retries) {
                return response;
            }
            log_debug("%s %s: transport retry %d/%d after %s",
                      http_method_to_string(request.method), request.url.c_str(),
                      retry + 1, max_retries,
                      response.is_network_error ? response.error.c_str()
                                                : std::to_string(response.status_code).c_str());
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }

private:
    static curl_slist* build_header_list(const HttpHeaders& headers) {
        curl_slist* list = nullptr;
        for (const auto& [name, value] : headers.all()) {
            list = curl_slist_append(list, (name + ": " + value).c_str());
        }
        // No 100-continue round trip before part bodies
        return curl_slist_append(list, "Expect:");
    }

    void configure(CURL* curl, const HttpRequest& request, Transfer& transfer,
                   curl_slist* header_list) const {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::POST:
                // POSTFIELDS must be non-null even for an empty body
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                                 request.body.empty() ? ""
                                     : reinterpret_cast<const char*>(request.body.data()));
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
            case HttpMethod::PUT:
                // The body is streamed from the request; a zero-length PUT
                // still sends Content-Length: 0
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_upload_read);
                curl_easy_setopt(curl, CURLOPT_READDATA, &transfer);
                curl_easy_setopt(curl, CURLOPT_SEEKFUNCTION, on_upload_seek);
                curl_easy_setopt(curl, CURLOPT_SEEKDATA, &transfer);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        if (request.stall_timeout.count() > 0) {
            // Under 1 byte/s for the whole window counts as a timeout
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, whole_seconds_ceil(request.stall_timeout));
        }

        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 60L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);

        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }
    }

    CURL* checkout() {
        {
            std::lock_guard lock(mutex_);
            if (!idle_.empty()) {
                CURL* h = idle_.back();
                idle_.pop_back();
                return h;
            }
        }
        return curl_easy_init();
    }

    void checkin(CURL* curl) {
        curl_easy_reset(curl);
        std::lock_guard lock(mutex_);
        if (idle_.size() < config_.max_idle_connections) {
            idle_.push_back(curl);
        } else {
            curl_easy_cleanup(curl);
        }
    }

    const HttpClientConfig config_;
    std::mutex mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request, int max_retries) {
    return impl_->execute_with_retry(request, max_retries);
}

// --- SigV4 ---

namespace {

std::string hex_encode(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX_DIGITS[data[i] >> 4];
        out[2 * i + 1] = HEX_DIGITS[data[i] & 0x0f];
    }
    return out;
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(data, len, digest);
    return hex_encode(digest, sizeof(digest));
}

std::vector<uint8_t> hmac(const std::vector<uint8_t>& key, const std::string& msg) {
    uint8_t out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const uint8_t*>(msg.data()), msg.size(), out, &out_len);
    return {out, out + out_len};
}

std::string utc_amz_date() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

// The URL already carries encoded values; sort by name and give bare
// names an explicit '='
std::string canonical_query(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> params;
    size_t start = 0;
    while (start < query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string item = query.substr(start, end - start);
        if (!item.empty()) {
            auto eq = item.find('=');
            if (eq == std::string::npos) {
                params.emplace_back(item, "");
            } else {
                params.emplace_back(item.substr(0, eq), item.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (const auto& [name, value] : params) {
        if (!out.empty()) out += '&';
        out += name + '=' + value;
    }
    return out;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id,
                               std::string secret_access_key,
                               std::string region,
                               std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

std::string AwsSigV4Signer::scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::vector<uint8_t> AwsSigV4Signer::signing_key(const std::string& date) const {
    std::string secret = "AWS4" + secret_access_key_;
    std::vector<uint8_t> key(secret.begin(), secret.end());
    for (const std::string& step : {date, region_, service_, std::string("aws4_request")}) {
        key = hmac(key, step);
    }
    return key;
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    sign_at(request, utc_amz_date());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

void AwsSigV4Signer::sign_at(HttpRequest& request, const std::string& amz_date) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) {
        log_error("sigv4: cannot sign malformed URL %s", request.url.c_str());
        return;
    }
    const std::string date = amz_date.substr(0, 8);

    request.headers.set("Host", url->host);
    request.headers.set("X-Amz-Date", amz_date);

    // A caller-provided hash (UNSIGNED-PAYLOAD) wins over hashing the body
    std::string payload_hash = request.headers.get("X-Amz-Content-Sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.body.data(), request.body.size());
        request.headers.set("X-Amz-Content-Sha256", payload_hash);
    }

    std::string header_block;
    std::string signed_headers;
    for (const auto& [name, value] : request.headers.all()) {
        header_block += name + ':' + trim(value) + '\n';
        signed_headers += (signed_headers.empty() ? "" : ";") + name;
    }

    std::string canonical = std::string(http_method_to_string(request.method)) + '\n' +
        (url->path.empty() ? "/" : url->path) + '\n' +
        canonical_query(url->query) + '\n' +
        header_block + '\n' +
        signed_headers + '\n' +
        payload_hash;

    std::string to_sign = "AWS4-HMAC-SHA256\n" + amz_date + '\n' + scope(date) + '\n' +
        sha256_hex(reinterpret_cast<const uint8_t*>(canonical.data()), canonical.size());

    auto signature = hmac(signing_key(date), to_sign);

    request.headers.set("Authorization",
        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope(date) +
        ", SignedHeaders=" + signed_headers +
        ", Signature=" + hex_encode(signature.data(), signature.size()));
}

} // namespace mpupload::net
