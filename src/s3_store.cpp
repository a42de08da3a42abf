#include "mpupload/s3_store.hpp"
#include "mpupload/constants.hpp"
#include "mpupload/errors.hpp"
#include "mpupload/log.hpp"
#include "mpupload/s3_xml.hpp"

#include <chrono>
#include <utility>

namespace mpupload {

namespace {

std::chrono::milliseconds to_ms(std::chrono::seconds s) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(s);
}

}  // namespace

void throw_request_error(const std::string& operation, const net::HttpResponse& response) {
    if (response.is_network_error) {
        auto kind = response.is_timeout ? RequestError::Kind::Timeout
                                        : RequestError::Kind::Network;
        throw TransientNetworkError(operation, kind, 0, "", response.error);
    }

    int status = response.status_code;
    auto err = s3::parse_error(response.body_string());

    if (status == constants::HTTP_INSUFFICIENT_STORAGE) {
        throw StorageExhaustedError(operation + ": server reported insufficient storage (HTTP 507)" +
                                    (err.message.empty() ? "" : ": " + err.message));
    }
    if (net::is_server_error_status(status) || status == 429) {
        throw TransientNetworkError(operation, RequestError::Kind::Http, status,
                                    err.code, err.message);
    }
    // HEAD responses carry no body
    std::string code = err.code;
    if (code.empty() && status == 404) code = "NotFound";
    throw RequestError(operation, RequestError::Kind::Http, status, code, err.message);
}

S3ObjectStore::S3ObjectStore(const Config& config)
    : config_(config)
    , signer_(config.access_key, config.secret_key, config.region, "s3") {
    net::HttpClientConfig http_config;
    http_config.user_agent = "mpupload-s3/1.0";
    http_config.verify_ssl = config_.verify_ssl;
    http_config.ca_bundle = config_.ca_bundle_path;
    http_config.max_idle_connections = config_.max_connections;
    http_client_ = std::make_unique<net::HttpClient>(http_config);
}

std::string S3ObjectStore::build_url(const std::string& bucket, const std::string& key) const {
    std::string url;
    if (!config_.endpoint.empty()) {
        url = config_.endpoint;
        while (!url.empty() && url.back() == '/') url.pop_back();
        if (config_.use_path_style) {
            url += "/" + bucket;
        } else {
            // Virtual-hosted style against a custom endpoint: bucket.host
            auto scheme_end = url.find("://");
            if (scheme_end != std::string::npos) {
                url.insert(scheme_end + 3, bucket + ".");
            } else {
                url = "https://" + bucket + "." + url;
            }
        }
    } else if (config_.use_path_style) {
        url = "https://s3." + config_.region + ".amazonaws.com/" + bucket;
    } else {
        url = "https://" + bucket + ".s3." + config_.region + ".amazonaws.com";
    }
    url += "/" + net::url_encode(key, false);
    return url;
}

void S3ObjectStore::sign_request(net::HttpRequest& request) const {
    if (!config_.session_token.empty()) {
        signer_.sign_with_token(request, config_.session_token);
    } else {
        signer_.sign(request);
    }
}

net::HttpResponse S3ObjectStore::send(net::HttpRequest& request, const RequestTimeouts& timeouts) {
    request.connect_timeout = to_ms(timeouts.connect);
    request.stall_timeout = to_ms(timeouts.read);
    sign_request(request);
    return http_client_->execute_with_retry(request, config_.max_retries);
}

std::string S3ObjectStore::create_multipart_upload(
    const std::string& bucket,
    const std::string& key,
    const std::optional<std::string>& content_type) {
    auto request = net::HttpRequest::post(build_url(bucket, key) + "?uploads", "");
    if (content_type && !content_type->empty()) {
        request.headers.set_content_type(*content_type);
    }

    auto response = send(request, config_.default_timeouts);
    if (!response.ok()) {
        throw_request_error("create_multipart_upload", response);
    }

    std::string upload_id = s3::parse_upload_id(response.body_string());
    if (upload_id.empty()) {
        throw RequestError("create_multipart_upload", RequestError::Kind::Http,
                           response.status_code, "", "response carried no UploadId");
    }
    return upload_id;
}

std::string S3ObjectStore::upload_part(const UploadSession& session,
                                       uint32_t part_number,
                                       std::vector<uint8_t>&& body) {
    std::string url = build_url(session.bucket, session.key) +
        "?partNumber=" + std::to_string(part_number) +
        "&uploadId=" + net::url_encode(session.upload_id);

    auto request = net::HttpRequest::put(url, std::move(body));

    auto response = send(request, config_.default_timeouts);
    if (!response.ok()) {
        throw_request_error("upload_part", response);
    }

    // ETag from header comes quoted - preserve quotes for CompleteMultipartUpload
    std::string etag = response.headers.get("ETag").value_or("");
    if (etag.empty()) {
        throw RequestError("upload_part", RequestError::Kind::Http,
                           response.status_code, "", "response carried no ETag");
    }
    return s3::ensure_etag_quotes(etag);
}

std::vector<RecordedPart> S3ObjectStore::list_parts(const UploadSession& session) {
    std::vector<RecordedPart> parts;
    uint32_t marker = 0;

    while (true) {
        std::string url = build_url(session.bucket, session.key) +
            "?uploadId=" + net::url_encode(session.upload_id) +
            "&max-parts=" + std::to_string(constants::LIST_PARTS_PAGE_SIZE);
        if (marker > 0) {
            url += "&part-number-marker=" + std::to_string(marker);
        }

        auto request = net::HttpRequest::get(url);
        auto response = send(request, config_.default_timeouts);
        if (!response.ok()) {
            throw_request_error("list_parts", response);
        }

        auto page = s3::parse_list_parts(response.body_string());
        parts.insert(parts.end(), page.parts.begin(), page.parts.end());

        if (!page.truncated) break;
        if (page.next_marker <= marker) {
            // Server claims more pages but did not advance; stop rather than loop
            log_warn("list_parts: truncated page without a new marker (marker=%u)", marker);
            break;
        }
        marker = page.next_marker;
    }

    return parts;
}

void S3ObjectStore::complete_multipart_upload(const UploadSession& session,
                                              const std::vector<PartReceipt>& parts,
                                              const RequestTimeouts& timeouts) {
    std::string url = build_url(session.bucket, session.key) +
        "?uploadId=" + net::url_encode(session.upload_id);

    auto request = net::HttpRequest::post(url, s3::build_complete_body(parts));
    request.headers.set_content_type("application/xml");

    auto response = send(request, timeouts);
    if (!response.ok()) {
        throw_request_error("complete_multipart_upload", response);
    }

    // S3 may answer 200 and report the failure in the body
    auto err = s3::parse_error(response.body_string());
    if (!err.code.empty()) {
        bool transient = (err.code == "InternalError" || err.code == "SlowDown" ||
                          err.code == "ServiceUnavailable");
        if (transient) {
            throw TransientNetworkError("complete_multipart_upload", RequestError::Kind::Http,
                                        response.status_code, err.code, err.message);
        }
        throw RequestError("complete_multipart_upload", RequestError::Kind::Http,
                           response.status_code, err.code, err.message);
    }
}

ObjectMetadata S3ObjectStore::head_object(const std::string& bucket, const std::string& key) {
    auto request = net::HttpRequest::head(build_url(bucket, key));

    auto response = send(request, config_.default_timeouts);
    if (!response.ok()) {
        throw_request_error("head_object", response);
    }

    ObjectMetadata meta;
    meta.content_length = response.headers.content_length().value_or(0);
    meta.etag = response.headers.get("ETag").value_or("");
    return meta;
}

} // namespace mpupload
