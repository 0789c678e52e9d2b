#pragma once

#include "vidgate/net/http.hpp"
#include "vidgate/storage/backend.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace vidgate {

class MetricsExporter;

/// Inclusive byte range, 0 <= start <= end < size.
struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end - start + 1; }
};

/// Result of checking a Range header against an object size.
struct RangeDecision {
    enum class Kind {
        Full,           // No header, or not a single "bytes=<start>-<end>?" range
        Partial,        // Serve `range` with 206
        Unsatisfiable   // 416, Content-Range: bytes */<size>
    };
    Kind kind = Kind::Full;
    ByteRange range;
};

/// Apply a Range header to an object of `size` bytes. Only the single-range
/// form "bytes=<digits>-<digits>?" is honoured (surrounding whitespace
/// ignored); `end` defaults to and is clamped at size-1. A start at or past
/// the end of the object, or after `end`, is unsatisfiable.
RangeDecision evaluate_range(const std::optional<std::string>& header, uint64_t size);

/// Content type from the key's extension, or application/octet-stream.
std::string guess_content_type(const std::string& key);

/// Last path segment of `key` with quotes, backslashes and control
/// characters removed, for use inside a quoted header parameter.
std::string attachment_filename(const std::string& key);

struct StreamRequest {
    std::string key;
    std::optional<std::string> range;  // Raw Range header
    bool download = false;             // Add Content-Disposition: attachment
    bool head_only = false;            // HEAD: headers only, no backend read
};

/// Status, headers and a lazily produced body. The body writer pulls the
/// selected bytes from the backend and pushes them into the sink chunk by
/// chunk; a sink returning false stops the backend read.
struct StreamResponse {
    using BodyWriter = std::function<StreamResult(const ByteSink& sink)>;

    int status = 200;
    net::HttpHeaders headers;
    uint64_t content_length = 0;

    // Plain-text body for error statuses
    std::string text_body;

    // Object bytes; empty for HEAD and error responses
    BodyWriter body;
};

/// Serves object bytes with HTTP range semantics:
///   START -> HEAD_FETCHED -> PARTIAL (206) | UNSATISFIABLE (416) | FULL (200)
///   START -> NOT_FOUND (404)
/// Backend failures while fetching metadata become 500.
class RangeDeliveryEngine {
public:
    explicit RangeDeliveryEngine(const StorageBackend& backend) : backend_(backend) {}

    StreamResponse serve(const StreamRequest& request) const;

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

private:
    StreamResponse make_response(const StreamRequest& request, const ObjectMetadata& meta) const;

    const StorageBackend& backend_;
    MetricsExporter* metrics_ = nullptr;
};

/// Plain-text response for error statuses (400/404/416/500).
StreamResponse make_text_response(int status, const std::string& text);

}  // namespace vidgate
