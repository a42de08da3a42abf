#pragma once

#include "mpupload/http.hpp"
#include "mpupload/object_store.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace mpupload {

/// ObjectStore backed by any S3-compatible HTTP endpoint, signed with SigV4.
class S3ObjectStore : public ObjectStore {
public:
    struct Config {
        std::string region = "us-east-1";
        std::string endpoint;          // Empty for AWS, custom for MinIO/RunPod/etc
        std::string access_key;
        std::string secret_key;
        std::string session_token;     // STS/temporary credentials
        bool use_path_style = false;
        bool verify_ssl = true;
        std::string ca_bundle_path;
        // Transport-level automatic retries, layered below the core's policy
        int max_retries = 5;
        // Idle connections kept for reuse
        size_t max_connections = 10;
        RequestTimeouts default_timeouts;
    };

    explicit S3ObjectStore(const Config& config);

    std::string type_name() const override { return "s3"; }

    std::string create_multipart_upload(
        const std::string& bucket,
        const std::string& key,
        const std::optional<std::string>& content_type) override;

    std::string upload_part(const UploadSession& session,
                            uint32_t part_number,
                            std::vector<uint8_t>&& body) override;

    std::vector<RecordedPart> list_parts(const UploadSession& session) override;

    void complete_multipart_upload(const UploadSession& session,
                                   const std::vector<PartReceipt>& parts,
                                   const RequestTimeouts& timeouts) override;

    ObjectMetadata head_object(const std::string& bucket,
                               const std::string& key) override;

    /// Object URL for bucket/key honoring endpoint and addressing style.
    std::string build_url(const std::string& bucket, const std::string& key) const;

private:
    net::HttpResponse send(net::HttpRequest& request, const RequestTimeouts& timeouts);
    void sign_request(net::HttpRequest& request) const;

    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

/// Translate a failed response into the matching exception and throw it.
/// Timeouts, connection failures, 5xx and 429 raise TransientNetworkError;
/// 507 raises StorageExhaustedError; anything else raises RequestError.
[[noreturn]] void throw_request_error(const std::string& operation,
                                      const net::HttpResponse& response);

} // namespace mpupload
