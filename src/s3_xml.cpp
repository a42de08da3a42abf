#include "mpupload/s3_xml.hpp"

#include <sstream>

namespace mpupload::s3 {

namespace xml {

std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

std::vector<ElementRange> find_elements(const std::string& xml, const std::string& tag) {
    std::vector<ElementRange> results;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t pos = 0;
    while (pos < xml.size()) {
        size_t start = xml.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.length();
        size_t end = xml.find(close_tag, content_start);
        if (end == std::string::npos) break;

        ElementRange range;
        range.content_start = content_start;
        range.content_end = end;
        range.element_end = end + close_tag.length();
        results.push_back(range);

        pos = range.element_end;
    }

    return results;
}

std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }  // Unknown entity, keep as-is
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

} // namespace xml

ErrorBody parse_error(const std::string& body) {
    ErrorBody err;
    auto ranges = xml::find_elements(body, "Error");
    if (ranges.empty()) return err;

    std::string content = body.substr(ranges[0].content_start,
                                      ranges[0].content_end - ranges[0].content_start);
    err.code = xml::get_element(content, "Code");
    err.message = xml::decode_entities(xml::get_element(content, "Message"));
    return err;
}

ListPartsPage parse_list_parts(const std::string& body) {
    ListPartsPage page;
    page.truncated = (xml::get_element(body, "IsTruncated") == "true");

    std::string marker = xml::get_element(body, "NextPartNumberMarker");
    if (!marker.empty()) {
        page.next_marker = static_cast<uint32_t>(std::stoul(marker));
    }

    for (const auto& range : xml::find_elements(body, "Part")) {
        std::string content = body.substr(range.content_start,
                                          range.content_end - range.content_start);
        RecordedPart part;
        std::string number = xml::get_element(content, "PartNumber");
        if (number.empty()) continue;
        part.part_number = static_cast<uint32_t>(std::stoul(number));
        part.etag = xml::decode_entities(xml::get_element(content, "ETag"));

        std::string size = xml::get_element(content, "Size");
        if (!size.empty()) {
            part.size = std::stoull(size);
        }
        page.parts.push_back(std::move(part));
    }

    return page;
}

std::string parse_upload_id(const std::string& body) {
    return xml::decode_entities(xml::get_element(body, "UploadId"));
}

std::string build_complete_body(const std::vector<PartReceipt>& parts) {
    std::ostringstream doc;
    doc << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    doc << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
    for (const auto& part : parts) {
        doc << "  <Part>\n";
        doc << "    <PartNumber>" << part.part_number << "</PartNumber>\n";
        doc << "    <ETag>" << xml::escape(ensure_etag_quotes(part.etag)) << "</ETag>\n";
        doc << "  </Part>\n";
    }
    doc << "</CompleteMultipartUpload>";
    return doc.str();
}

std::string ensure_etag_quotes(const std::string& etag) {
    if (etag.empty()) return etag;
    std::string result = etag;
    if (result.front() != '"') result = "\"" + result;
    if (result.size() == 1 || result.back() != '"') result += "\"";
    return result;
}

} // namespace mpupload::s3
