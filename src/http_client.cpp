#include "vidgate/net/http.hpp"
#include "vidgate/log.hpp"
#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace vidgate::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

static bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (is_unreserved(c)) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string uri_encode_path(const std::string& path) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : path) {
        if (is_unreserved(c) || c == '/') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                int value = (h1 << 4) | h2;
                // Reject embedded null bytes (%00) to prevent truncation
                if (value == 0) {
                    i += 2;
                    continue;
                }
                decoded += static_cast<char>(value);
                i += 2;
                continue;
            }
            // Invalid hex sequence: keep the literal '%'
        } else if (str[i] == '+') {
            decoded += ' ';
            continue;
        }
        decoded += str[i];
    }

    return decoded;
}

std::map<std::string, std::string> parse_query_string(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            std::string name = url_decode(param.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : url_decode(param.substr(eq + 1));
            params.emplace(std::move(name), std::move(value));
        }
        pos = amp + 1;
    }
    return params;
}

std::string format_http_date(std::chrono::system_clock::time_point tp) {
    static const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time, &tm);

    // Locale-independent: put_time would localize day and month names
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& value) {
    static const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                   "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    char day_name[4] = {};
    char month_name[4] = {};
    int day = 0, year = 0, hour = 0, min = 0, sec = 0;
    if (std::sscanf(value.c_str(), "%3s, %d %3s %d %d:%d:%d",
                    day_name, &day, month_name, &year, &hour, &min, &sec) != 7) {
        return std::nullopt;
    }

    int month = -1;
    for (int i = 0; i < 12; ++i) {
        if (std::strcmp(month_name, months[i]) == 0) {
            month = i;
            break;
        }
    }
    if (month < 0) {
        return std::nullopt;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t tt = timegm(&tm);
    if (tt == -1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (!val) return std::nullopt;
    try {
        return std::stoull(*val);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t pos = 0;

    // Scheme
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    pos = scheme_end + 3;

    // Userinfo is not supported for storage endpoints; skip it
    size_t at_pos = url.find('@', pos);
    size_t slash_pos = url.find('/', pos);
    if (at_pos != std::string::npos && (slash_pos == std::string::npos || at_pos < slash_pos)) {
        pos = at_pos + 1;
    }

    // Host and port
    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }
    size_t colon_pos = host_port.rfind(':');

    // Check for IPv6 address
    if (host_port.front() == '[') {
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    pos = host_end;

    // Path
    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    // Query
    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
        pos = query_end;
    }

    // Fragment
    if (pos < url.size() && url[pos] == '#') {
        result.fragment = url.substr(pos + 1);
    }

    return result;
}

std::string ParsedUrl::to_string() const {
    std::ostringstream oss;
    oss << scheme << "://";

    if (host.find(':') != std::string::npos) {
        // IPv6
        oss << "[" << host << "]";
    } else {
        oss << host;
    }

    if (port != 0) {
        oss << ":" << port;
    }

    oss << path;

    if (!query.empty()) {
        oss << "?" << query;
    }

    if (!fragment.empty()) {
        oss << "#" << fragment;
    }

    return oss.str();
}

std::string ParsedUrl::host_header() const {
    std::string value = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = port == 0 ||
                        (scheme == "https" && port == 443) ||
                        (scheme == "http" && port == 80);
    if (!default_port) {
        value += ":" + std::to_string(port);
    }
    return value;
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

// Context for streamed responses. Only 2xx bodies reach the sink.
struct StreamCallbackContext {
    CURL* curl;
    const HttpBodySink* sink;
    std::vector<uint8_t>* error_body;
    bool aborted;
};

static constexpr size_t MAX_ERROR_BODY = 64 * 1024;

static size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);

    if (is_success_status(static_cast<int>(status))) {
        if (!(*ctx->sink)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
            ctx->aborted = true;
            return 0;  // Abort transfer
        }
        return bytes;
    }

    size_t room = MAX_ERROR_BODY - std::min(MAX_ERROR_BODY, ctx->error_body->size());
    size_t take = std::min(room, bytes);
    ctx->error_body->insert(ctx->error_body->end(), ptr, ptr + take);
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) {
        return bytes;
    }

    // A new status line starts a new header block (e.g. after 100-continue)
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = start != std::string::npos ? value.substr(start) : std::string{};

        headers->add(name, value);
    }

    return bytes;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        struct curl_slist* headers_list = setup_handle(curl, request, response);

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.is_network_error = false;
            response.status_code = 413;
        } else if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        release_handle(curl);

        return response;
    }

    HttpResponse execute_streaming(const HttpRequest& request, const HttpBodySink& sink) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        struct curl_slist* headers_list = setup_handle(curl, request, response);

        std::vector<uint8_t> error_body;
        StreamCallbackContext stream_ctx{curl, &sink, &error_body, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &stream_ctx);

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
        response.body = std::move(error_body);

        if (stream_ctx.aborted) {
            response.aborted = true;
            response.error = "transfer aborted by receiver";
        } else if (res != CURLE_OK) {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        release_handle(curl);

        return response;
    }

private:
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);

        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            return handle;
        }

        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        if (!handle) return;

        std::lock_guard<std::mutex> lock(pool_mutex_);

        // Reset handle for reuse; the connection cache survives the reset
        curl_easy_reset(handle);

        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    // Apply everything except the write callback. Returns the header list,
    // which the caller frees after the transfer.
    struct curl_slist* setup_handle(CURL* curl, const HttpRequest& request,
                                    HttpResponse& response) {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        // Timeouts. Streamed bodies may run far longer than a metadata call,
        // so the total timeout only applies when the caller sets one.
        auto connect_timeout = request.connect_timeout.count() > 0
            ? request.connect_timeout : config_.default_connect_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(connect_timeout.count()));
        if (request.total_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(request.total_timeout.count()));
        }
        // Give up on a stalled backend: under 1 byte/s for 60 seconds
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        }

        bool ssl_verify_enabled = request.verify_ssl && config_.verify_ssl_by_default;
        if (!ssl_verify_enabled) {
            static std::once_flag ssl_warning_flag;
            std::call_once(ssl_warning_flag, []() {
                log_error("SSL verification disabled via configuration. "
                          "This exposes storage connections to man-in-the-middle attacks.");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, ssl_verify_enabled ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, ssl_verify_enabled ? 2L : 0L);

        if (!request.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
        } else if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        // Object stores answer directly; a redirect would invalidate the signature
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

        // Required for multi-threaded use of easy handles with timeouts
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.receive_buffer_size > 0) {
            curl_easy_setopt(curl, CURLOPT_BUFFERSIZE,
                             static_cast<long>(config_.receive_buffer_size));
        }

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        return headers_list;
    }

    HttpClientConfig config_;

    mutable std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_streaming(const HttpRequest& request, const HttpBodySink& sink) {
    return impl_->execute_streaming(request, sink);
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const std::string& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

static std::string sha256_hex(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string hmac_sha256_hex(const std::vector<uint8_t>& key, const std::string& data) {
    auto hash = hmac_sha256(key, data);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (const auto b : hash) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

static std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

// Query params are already URL-encoded in the URL, so we just need to sort them
// and ensure params without values have the format "key=" (not just "key")
static std::map<std::string, std::string> split_encoded_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq != std::string::npos) {
                params[param.substr(0, eq)] = param.substr(eq + 1);
            } else {
                params[param] = "";
            }
        }
        pos = amp + 1;
    }
    return params;
}

static std::string join_query(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::chrono::system_clock::time_point AwsSigV4Signer::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;

    oss << http_method_to_string(request.method) << "\n";

    // Canonical URI (object keys are already encoded by the backend)
    oss << (url->path.empty() ? "/" : url->path) << "\n";

    oss << join_query(split_encoded_query(url->query)) << "\n";

    // Canonical headers (names already lowercase in HttpHeaders)
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [name, value] : request.headers.all()) {
        sorted_headers[name] = value;
    }
    for (const auto& [name, value] : sorted_headers) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";

    oss << signed_headers << "\n";
    oss << payload_hash;

    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    return hmac_sha256_hex(k_signing, string_to_sign);
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto timestamp = now();
    std::string datetime = format_utc(timestamp, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(timestamp, "%Y%m%d");

    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    request.headers.set("Host", url->host_header());
    request.headers.set("X-Amz-Date", datetime);

    // Reuse a pre-set payload hash (e.g. UNSIGNED-PAYLOAD) or compute it
    std::string payload_hash;
    if (auto existing = request.headers.get("X-Amz-Content-Sha256"); existing && !existing->empty()) {
        payload_hash = *existing;
    } else {
        payload_hash = request.body.empty() ? sha256_hex("") : sha256_hex(request.body);
    }
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::unordered_set<std::string> header_set;
    for (const auto& [name, value] : request.headers.all()) {
        header_set.insert(name);
    }
    std::vector<std::string> header_names(header_set.begin(), header_set.end());
    std::sort(header_names.begin(), header_names.end());

    std::string signed_headers;
    for (size_t i = 0; i < header_names.size(); ++i) {
        if (i > 0) signed_headers += ";";
        signed_headers += header_names[i];
    }

    std::string canonical_request = get_canonical_request(request, signed_headers, payload_hash);
    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

std::string AwsSigV4Signer::presign(HttpMethod method,
                                    const std::string& url,
                                    std::chrono::seconds expires,
                                    const std::string& session_token) const {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) return "";

    auto timestamp = now();
    std::string datetime = format_utc(timestamp, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(timestamp, "%Y%m%d");
    std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";

    auto params = split_encoded_query(parsed->query);
    params["X-Amz-Algorithm"] = "AWS4-HMAC-SHA256";
    params["X-Amz-Credential"] = url_encode(access_key_id_ + "/" + scope);
    params["X-Amz-Date"] = datetime;
    params["X-Amz-Expires"] = std::to_string(expires.count());
    if (!session_token.empty()) {
        params["X-Amz-Security-Token"] = url_encode(session_token);
    }
    params["X-Amz-SignedHeaders"] = "host";

    std::string canonical_query = join_query(params);
    std::string path = parsed->path.empty() ? "/" : parsed->path;

    std::ostringstream canonical;
    canonical << http_method_to_string(method) << "\n"
              << path << "\n"
              << canonical_query << "\n"
              << "host:" << parsed->host_header() << "\n"
              << "\n"
              << "host\n"
              << "UNSIGNED-PAYLOAD";

    std::string string_to_sign = get_string_to_sign(datetime, date, canonical.str());
    std::string signature = calculate_signature(date, string_to_sign);

    ParsedUrl signed_url = *parsed;
    signed_url.path = path;
    signed_url.query = canonical_query + "&X-Amz-Signature=" + signature;
    signed_url.fragment.clear();
    return signed_url.to_string();
}

}  // namespace vidgate::net
