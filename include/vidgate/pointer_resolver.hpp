#pragma once

#include "vidgate/gateway_config.hpp"
#include "vidgate/storage/backend.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace vidgate {

class MetricsExporter;

/// Error codes carried in the resolve response's "error" field.
enum class ResolveError {
    MissingId,
    PointerNotFound,
    EmptyKey,
    ObjectNotFound,
    Server
};

/// Wire name, e.g. "POINTER_NOT_FOUND".
const char* resolve_error_name(ResolveError error);

/// Identifier for an email address: lower-cased, '@' and '.' replaced by '_'.
/// "Jane@Acme.com" -> "jane_acme_com".
std::string make_identifier(const std::string& email);

/// Key the ingestion job writes a video to: videos/<identifier>__<filename>.
std::string make_video_key(const std::string& identifier, const std::string& filename);

/// Pointer record stored at <pointer_prefix><identifier>.json.
struct PointerRecord {
    std::string key;                     // Empty when absent or not a string
    std::optional<std::string> company;  // Absent, null and "" all map to nullopt

    /// Parse a pointer document. Returns nullopt and sets `error` when the
    /// text is not JSON or not a JSON object.
    static std::optional<PointerRecord> parse(const std::string& text, std::string& error);

    nlohmann::json to_json() const;
};

/// Where the fallback found the object.
struct KeyResolution {
    std::string key;
    std::string method;  // "exact", "nested" or "prefix"
};

/// Finds the stored key for a candidate that may not match the stored
/// layout verbatim. Attempts, cheapest first:
///   1. exact:  head(candidate)
///   2. nested: head(<candidate>/<last segment>), the layout left behind by
///              uploads that treat the destination as a directory
///   3. prefix: first key listed under <candidate>/ (backend order, which is
///              lexicographic for S3 and local, but not a guarantee)
/// Backend failures propagate as StorageError.
class KeyResolver {
public:
    explicit KeyResolver(const StorageBackend& backend) : backend_(backend) {}

    std::optional<KeyResolution> resolve(const std::string& candidate) const;

    /// "<candidate without trailing '/'>/<last segment>", or empty if the
    /// candidate has no segment.
    static std::string nested_candidate(const std::string& candidate);

    /// Listing prefix: candidate + '/', or candidate if it already ends in '/'.
    static std::string listing_prefix(const std::string& candidate);

private:
    const StorageBackend& backend_;
};

/// Outcome of resolve(). Serialized as
/// { signedUrl|streamUrl, company, link, foundKey?, error?, wantedKey?, message? }.
struct ResolveResult {
    std::optional<ResolveError> error;
    DeliveryMode mode = DeliveryMode::Signed;

    std::optional<std::string> delivery_url;  // signedUrl or streamUrl
    std::optional<std::string> company;
    std::optional<std::string> link;
    std::optional<std::string> found_key;
    std::optional<std::string> wanted_key;
    std::optional<std::string> message;

    // Which fallback step matched (not serialized)
    std::string resolution_method;

    bool ok() const { return !error.has_value(); }

    nlohmann::json to_json() const;
};

struct ResolverOptions {
    std::string public_base;  // Empty: use the request origin
    DeliveryMode mode = DeliveryMode::Signed;
    std::chrono::seconds presign_expiry{86400};
    std::string pointer_prefix = "pointers/";
    std::string stream_path = "/stream";
};

/// Turns an identifier into a delivery reference. Stateless; every call
/// reads the pointer and object metadata fresh from the backend.
class PointerResolver {
public:
    PointerResolver(const StorageBackend& backend, ResolverOptions options);

    /// Never throws for backend failures: they become ResolveError::Server.
    ResolveResult resolve(const std::string& identifier,
                          const std::string& request_origin) const;

    /// <base>/p/?id=<url-encoded identifier>
    std::string make_link(const std::string& identifier,
                          const std::string& request_origin) const;

    std::string pointer_key(const std::string& identifier) const;

    const ResolverOptions& options() const { return options_; }

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

private:
    // Fills `result` step by step so that fields known before a backend
    // failure (link, company) survive into the SERVER response
    void resolve_into(const std::string& identifier, ResolveResult& result) const;

    const StorageBackend& backend_;
    ResolverOptions options_;
    KeyResolver key_resolver_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace vidgate
