#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mpupload {

// Server-side handle for one multipart upload attempt
struct UploadSession {
    std::string upload_id;
    std::string bucket;
    std::string key;
    std::optional<std::string> content_type;
};

// Produced by a successful part upload; submitted to finalize in part order
struct PartReceipt {
    uint32_t part_number = 0;
    std::string etag;
};

// A part as recorded by the server (ListParts)
struct RecordedPart {
    uint32_t part_number = 0;
    std::string etag;
    uint64_t size = 0;
};

struct ObjectMetadata {
    uint64_t content_length = 0;
    std::string etag;
};

// Per-call transport timeouts
struct RequestTimeouts {
    std::chrono::seconds connect{60};
    std::chrono::seconds read{60};
};

// Abstract S3-compatible object store exposing the multipart operations the
// uploader needs. Implementations throw RequestError (or a subclass) on a
// failed request and StorageExhaustedError on HTTP 507.
// All methods must be safe to call concurrently.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Backend type name (for logging)
    virtual std::string type_name() const = 0;

    // Returns the new upload id
    virtual std::string create_multipart_upload(
        const std::string& bucket,
        const std::string& key,
        const std::optional<std::string>& content_type) = 0;

    // Returns the part's ETag. Takes the body by rvalue so the transport
    // sends the caller's buffer without copying it.
    virtual std::string upload_part(const UploadSession& session,
                                    uint32_t part_number,
                                    std::vector<uint8_t>&& body) = 0;

    // All parts recorded for the session, following pagination
    virtual std::vector<RecordedPart> list_parts(const UploadSession& session) = 0;

    // parts must be strictly ascending by part_number
    virtual void complete_multipart_upload(const UploadSession& session,
                                           const std::vector<PartReceipt>& parts,
                                           const RequestTimeouts& timeouts) = 0;

    virtual ObjectMetadata head_object(const std::string& bucket,
                                       const std::string& key) = 0;
};

} // namespace mpupload
