#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vidgate::net {

// HTTP methods (the storage client only reads)
enum class HttpMethod {
    GET,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{60000};

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
    bool aborted = false;           // Body sink asked to stop the transfer
};

/// Receives response body bytes as they arrive. Return false to abort.
using HttpBodySink = std::function<bool(const uint8_t* data, size_t size)>;

struct HttpClientConfig {
    size_t max_idle_handles = 32;

    std::chrono::milliseconds default_connect_timeout{10000};

    // Limit for buffered responses (0 = unlimited). Streaming is not limited.
    size_t max_response_size = 16 * 1024 * 1024;

    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;

    std::string user_agent = "vidgate/1.0";

    bool tcp_keepalive = true;
    bool verbose = false;

    // Receive buffer size for streamed bodies (0 = libcurl default)
    size_t receive_buffer_size = 0;
};

// Blocking HTTP client with a pool of reusable easy handles
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Buffered request
    HttpResponse execute(const HttpRequest& request);

    // Streamed request: 2xx body bytes go to `sink`, other bodies are
    // buffered (bounded) into response.body for diagnostics.
    HttpResponse execute_streaming(const HttpRequest& request, const HttpBodySink& sink);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// AWS SigV4 signing helper (used for S3)
class AwsSigV4Signer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    AwsSigV4Signer(const std::string& access_key_id,
                   const std::string& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    // Sign a request with an Authorization header
    void sign(HttpRequest& request) const;

    // Sign with session token (for STS credentials)
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

    /// Build a presigned URL (query-string authentication) for `url`.
    /// Only the host header is signed and the payload is UNSIGNED-PAYLOAD.
    /// Returns an empty string if the URL cannot be parsed.
    std::string presign(HttpMethod method,
                        const std::string& url,
                        std::chrono::seconds expires,
                        const std::string& session_token = "") const;

    /// Override the clock (tests).
    void set_clock(Clock clock) { clock_ = std::move(clock); }

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
    Clock clock_;

    std::chrono::system_clock::time_point now() const;

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;
    std::string fragment;

    std::string to_string() const;

    // Host header value: host, plus the port when it is not the scheme default
    std::string host_header() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// URL encoding/decoding (RFC 3986 unreserved set is left as-is)
std::string url_encode(const std::string& str);
std::string url_decode(const std::string& str);

// Encode an object key for use in a URL path: like url_encode but keeps '/'
std::string uri_encode_path(const std::string& path);

// Parse "a=1&b=2" into decoded name -> value (first occurrence wins)
std::map<std::string, std::string> parse_query_string(const std::string& query);

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string format_http_date(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& value);

}  // namespace vidgate::net
