#pragma once

#include "mpupload/object_store.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mpupload::s3 {

// XML parsing helpers for S3 responses (avoids regex for better reliability)
namespace xml {

// Find the value between <tag>value</tag>, returns empty string if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0);

struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // Position after closing tag
};

// Find all occurrences of <tag>...</tag>
std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag);

// Decode the basic entity set used by S3
std::string decode_entities(const std::string& s);
std::string escape(const std::string& s);

} // namespace xml

// <Error><Code>..</Code><Message>..</Message></Error>
struct ErrorBody {
    std::string code;
    std::string message;
};

/// Parse an S3 error document. Returns an empty code when the body is not one.
ErrorBody parse_error(const std::string& body);

/// One page of a ListParts response.
struct ListPartsPage {
    std::vector<RecordedPart> parts;
    bool truncated = false;
    uint32_t next_marker = 0;
};

ListPartsPage parse_list_parts(const std::string& body);

/// UploadId from an InitiateMultipartUploadResult document.
std::string parse_upload_id(const std::string& body);

/// CompleteMultipartUpload request document, parts in the given order.
std::string build_complete_body(const std::vector<PartReceipt>& parts);

/// S3 requires quoted ETags in CompleteMultipartUpload.
std::string ensure_etag_quotes(const std::string& etag);

} // namespace mpupload::s3
