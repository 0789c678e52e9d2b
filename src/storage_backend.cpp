#include "vidgate/storage/backend.hpp"
#include "vidgate/log.hpp"
#include "vidgate/net/http.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <set>
#include <system_error>
#include <vector>

namespace vidgate {

// Upper bound for X-Amz-Expires accepted by S3 (7 days)
static constexpr std::chrono::seconds MAX_PRESIGN_EXPIRY{604800};

static constexpr size_t DEFAULT_READ_CHUNK_SIZE = 256 * 1024;

// Keys are relative, '/'-separated, and never step outside the bucket
static bool is_safe_key(const std::string& key) {
    if (key.empty() || key.front() == '/' || key.find('\0') != std::string::npos) {
        return false;
    }
    size_t pos = 0;
    while (pos <= key.size()) {
        size_t slash = key.find('/', pos);
        if (slash == std::string::npos) slash = key.size();
        if (key.compare(pos, slash - pos, "..") == 0 && slash - pos == 2) {
            return false;
        }
        pos = slash + 1;
    }
    return true;
}

// ============================================================================
// LocalStorageBackend - File system implementation
// ============================================================================

class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const std::filesystem::path& root,
                                 size_t read_chunk_size = DEFAULT_READ_CHUNK_SIZE)
        : root_(std::filesystem::absolute(root))
        , read_chunk_size_(read_chunk_size > 0 ? read_chunk_size : DEFAULT_READ_CHUNK_SIZE) {
        if (!std::filesystem::is_directory(root_)) {
            log_error("Local storage root is not a directory: %s", root_.c_str());
        }
    }

    std::string type_name() const override { return "local"; }

    bool exists(const std::string& key) const override {
        return head(key).has_value();
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        if (!is_safe_key(key)) {
            return std::nullopt;
        }
        auto path = key_to_path(key);

        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::is_regular_file(status)) {
            if (ec && ec != std::errc::no_such_file_or_directory &&
                ec != std::errc::not_a_directory) {
                throw StorageError("stat " + key + ": " + ec.message());
            }
            return std::nullopt;
        }

        ObjectMetadata meta;
        meta.size = std::filesystem::file_size(path, ec);
        if (ec) {
            throw StorageError("stat " + key + ": " + ec.message());
        }

        auto ftime = std::filesystem::last_write_time(path, ec);
        if (!ec) {
            meta.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(ftime));
        }

        // Weak validator from size and mtime, as static file servers do
        auto mtime = std::chrono::duration_cast<std::chrono::seconds>(
            meta.last_modified.time_since_epoch()).count();
        char etag[64];
        std::snprintf(etag, sizeof(etag), "\"%llx-%llx\"",
                      static_cast<unsigned long long>(meta.size),
                      static_cast<unsigned long long>(mtime));
        meta.etag = etag;

        // Content type is left to the caller (no sidecar metadata on disk)
        return meta;
    }

    GetResult get(const std::string& key,
                  const GetOptions& options) const override {
        GetResult result;
        auto meta = head(key);
        if (!meta) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }

        result.data.reserve(static_cast<size_t>(range_length(*meta, options)));
        auto stream = get_stream(key, [&result](const uint8_t* data, size_t size) {
            result.data.insert(result.data.end(), data, data + size);
            return true;
        }, options);

        if (!stream.success) {
            result.not_found = stream.not_found;
            result.error_message = stream.error_message;
            result.data.clear();
            return result;
        }

        result.success = true;
        result.metadata = *meta;
        return result;
    }

    StreamResult get_stream(const std::string& key,
                            const ByteSink& sink,
                            const GetOptions& options) const override {
        StreamResult result;
        if (!is_safe_key(key)) {
            result.not_found = true;
            result.error_message = "Invalid key: " + key;
            return result;
        }

        auto path = key_to_path(key);
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file || !std::filesystem::is_regular_file(path)) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }

        auto tellg_val = file.tellg();
        if (tellg_val < 0) {
            result.error_message = "Cannot determine file size: " + key;
            return result;
        }
        uint64_t file_size = static_cast<uint64_t>(tellg_val);
        uint64_t start = options.range_start.value_or(0);
        uint64_t end = std::min(options.range_end.value_or(file_size), file_size);

        if (start > 0 && start >= file_size) {
            result.error_message = "Range start beyond file size";
            return result;
        }

        file.seekg(static_cast<std::streamoff>(start));
        std::vector<char> buffer(read_chunk_size_);
        uint64_t remaining = end > start ? end - start : 0;

        while (remaining > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
            file.read(buffer.data(), static_cast<std::streamsize>(want));
            auto got = static_cast<size_t>(file.gcount());
            if (got == 0) {
                result.error_message = "Short read: " + key;
                return result;
            }
            if (!sink(reinterpret_cast<const uint8_t*>(buffer.data()), got)) {
                result.aborted = true;
                result.error_message = "transfer aborted by receiver";
                return result;
            }
            result.bytes += got;
            remaining -= got;
        }

        result.success = true;
        return result;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        // Directory that can contain every key with this prefix
        std::string dir_part;
        size_t last_slash = options.prefix.rfind('/');
        if (last_slash != std::string::npos) {
            dir_part = options.prefix.substr(0, last_slash);
        }
        if (!dir_part.empty() && !is_safe_key(dir_part)) {
            result.success = true;
            return result;
        }

        auto search_path = dir_part.empty() ? root_ : root_ / dir_part;
        std::error_code ec;
        if (!std::filesystem::is_directory(search_path, ec)) {
            result.success = true;
            return result;
        }

        // Collect matching keys in lexicographic order, as S3 returns them
        std::set<std::string> keys;
        std::set<std::string> common_prefixes;
        try {
            for (const auto& entry : std::filesystem::recursive_directory_iterator(search_path)) {
                if (!entry.is_regular_file()) {
                    continue;
                }
                std::string key = std::filesystem::relative(entry.path(), root_).generic_string();
                if (key.compare(0, options.prefix.size(), options.prefix) != 0) {
                    continue;
                }
                if (!options.delimiter.empty()) {
                    size_t d = key.find(options.delimiter, options.prefix.size());
                    if (d != std::string::npos) {
                        common_prefixes.insert(key.substr(0, d + options.delimiter.size()));
                        continue;
                    }
                }
                keys.insert(std::move(key));
            }
        } catch (const std::exception& e) {
            result.success = false;
            result.error_message = e.what();
            return result;
        }

        std::set<std::string> merged(keys);
        merged.insert(common_prefixes.begin(), common_prefixes.end());

        auto it = options.continuation_token.empty()
            ? merged.begin()
            : merged.upper_bound(options.continuation_token);

        for (; it != merged.end(); ++it) {
            if (result.entries.size() >= options.max_keys) {
                result.truncated = true;
                result.continuation_token = result.entries.back().key;
                break;
            }

            ListEntry le;
            le.key = *it;
            if (common_prefixes.count(*it)) {
                le.is_directory = true;
            } else if (auto meta = head(*it)) {
                le.size = meta->size;
                le.last_modified = meta->last_modified;
                le.etag = meta->etag;
            }
            result.entries.push_back(std::move(le));
        }

        result.success = true;
        return result;
    }

    std::optional<std::string> presign_url(const std::string& /*key*/,
                                           std::chrono::seconds /*expires*/) const override {
        return std::nullopt;
    }

    bool is_healthy() const override {
        std::error_code ec;
        return std::filesystem::is_directory(root_, ec);
    }

private:
    std::filesystem::path key_to_path(const std::string& key) const {
        return root_ / key;
    }

    static uint64_t range_length(const ObjectMetadata& meta, const GetOptions& options) {
        uint64_t start = options.range_start.value_or(0);
        uint64_t end = std::min(options.range_end.value_or(meta.size), meta.size);
        return end > start ? end - start : 0;
    }

    std::filesystem::path root_;
    size_t read_chunk_size_;
};

// ============================================================================
// XML parsing helpers for S3 responses (avoids regex for better reliability)
// ============================================================================

namespace xml {

// Find the value between <tag>value</tag>, returns empty string if not found
std::string get_element(const std::string& xml, const std::string& tag, size_t start_pos = 0) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag, start_pos);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Find all occurrences of <tag>...</tag> and return their content positions
struct ElementRange {
    size_t content_start = 0;
    size_t content_end = 0;
    size_t element_end = 0;  // Position after closing tag
};

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

// Decode XML entities (basic set used by S3)
std::string decode_entities(const std::string& s) {
    static const std::pair<const char*, char> entities[] = {
        {"&lt;", '<'}, {"&gt;", '>'}, {"&amp;", '&'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        bool matched = false;
        if (s[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                size_t len = std::strlen(entity);
                if (s.compare(i, len, entity) == 0) {
                    result += ch;
                    i += len;
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            // Plain character or unknown entity, keep as-is
            result += s[i++];
        }
    }

    return result;
}

// Parse ISO 8601 timestamps as used in listings: 2023-12-15T14:30:00.000Z
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& s) {
    int year, month, day, hour, min, sec;
    int millis = 0;
    if (sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
               &year, &month, &day, &hour, &min, &sec, &millis) < 6) {
        return std::nullopt;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    time_t tt = timegm(&tm);
    if (tt == -1) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
}

} // namespace xml

// ============================================================================
// SecureString - A string class that zeros memory on destruction
// Prevents credentials from remaining in memory after use
// ============================================================================

class SecureString {
public:
    SecureString() = default;

    explicit SecureString(const std::string& s) : data_(s) {}
    SecureString(const char* s) : data_(s ? s : "") {}

    SecureString(const SecureString& other) : data_(other.data_) {}

    SecureString(SecureString&& other) noexcept : data_(std::move(other.data_)) {
        other.secure_clear();
    }

    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            secure_clear();
            data_ = other.data_;
        }
        return *this;
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear();
            data_ = std::move(other.data_);
            other.secure_clear();
        }
        return *this;
    }

    SecureString& operator=(const std::string& s) {
        secure_clear();
        data_ = s;
        return *this;
    }

    ~SecureString() {
        secure_clear();
    }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void secure_clear() {
        if (!data_.empty()) {
            // Use volatile to prevent compiler from optimizing away the zeroing
            volatile char* p = const_cast<volatile char*>(data_.data());
            size_t len = data_.size();
            while (len--) {
                *p++ = 0;
            }
            data_.clear();
            data_.shrink_to_fit();
        }
    }

    std::string data_;
};

// ============================================================================
// S3StorageBackend - S3-compatible storage implementation (AWS, R2, MinIO)
// ============================================================================

class S3StorageBackend : public StorageBackend {
public:
    struct Config {
        std::string bucket;
        std::string region = "us-east-1";
        std::string endpoint;     // Empty for AWS, custom for R2/MinIO/etc
        std::string path_prefix;  // Key prefix inside the bucket (e.g. "media/")
        SecureString access_key;
        SecureString secret_key;
        SecureString session_token;  // STS/temporary credentials
        bool use_path_style = false;
        bool verify_ssl = true;
        std::string ca_cert;
        uint32_t connect_timeout_secs = 10;
        uint32_t request_timeout_secs = 30;  // Metadata and listing calls only
        size_t receive_buffer_size = 0;
    };

    explicit S3StorageBackend(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.region, "s3") {
        net::HttpClientConfig http_config;
        http_config.user_agent = "vidgate-s3/1.0";
        http_config.verify_ssl_by_default = config_.verify_ssl;
        http_config.default_ca_bundle = config_.ca_cert;
        http_config.default_connect_timeout = std::chrono::milliseconds(config_.connect_timeout_secs * 1000);
        http_config.receive_buffer_size = config_.receive_buffer_size;
        http_client_ = std::make_unique<net::HttpClient>(http_config);
    }

    std::string type_name() const override { return "s3"; }

    bool exists(const std::string& key) const override {
        return head(key).has_value();
    }

    std::optional<ObjectMetadata> head(const std::string& key) const override {
        auto request = make_request(net::HttpMethod::HEAD, build_url(key));
        sign_request(request);

        auto response = http_client_->execute(request);

        if (response.status_code == 404) {
            return std::nullopt;
        }
        if (!response.ok()) {
            throw StorageError("HEAD " + key + ": " + describe_failure(response));
        }

        return parse_object_metadata(response);
    }

    GetResult get(const std::string& key,
                  const GetOptions& options) const override {
        GetResult result;
        auto request = make_request(net::HttpMethod::GET, build_url(key));
        set_range(request, options);
        sign_request(request);

        auto response = http_client_->execute(request);

        if (response.status_code == 404) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }
        if (!response.ok()) {
            result.error_message = describe_failure(response);
            return result;
        }

        result.success = true;
        result.metadata = parse_object_metadata(response);
        result.data = std::move(response.body);
        return result;
    }

    StreamResult get_stream(const std::string& key,
                            const ByteSink& sink,
                            const GetOptions& options) const override {
        StreamResult result;
        auto request = make_request(net::HttpMethod::GET, build_url(key));
        // Large bodies can take arbitrarily long; stalls are caught by the
        // client's low-speed limit instead
        request.total_timeout = std::chrono::milliseconds(0);
        set_range(request, options);
        sign_request(request);

        auto response = http_client_->execute_streaming(request,
            [&sink, &result](const uint8_t* data, size_t size) {
                if (!sink(data, size)) {
                    return false;
                }
                result.bytes += size;
                return true;
            });

        if (response.aborted) {
            result.aborted = true;
            result.error_message = response.error;
            return result;
        }
        if (response.status_code == 404) {
            result.not_found = true;
            result.error_message = "Object not found: " + key;
            return result;
        }
        if (!response.ok() || !response.error.empty()) {
            result.error_message = describe_failure(response);
            return result;
        }

        result.success = true;
        return result;
    }

    ListResult list(const ListOptions& options) const override {
        ListResult result;

        std::string url = build_url("");

        // ListObjectsV2 query; parameters sorted for readability, the
        // signer sorts them anyway
        std::vector<std::string> params;
        if (!options.continuation_token.empty()) {
            params.push_back("continuation-token=" + net::url_encode(options.continuation_token));
        }
        if (!options.delimiter.empty()) {
            params.push_back("delimiter=" + net::url_encode(options.delimiter));
        }
        params.push_back("list-type=2");
        params.push_back("max-keys=" + std::to_string(options.max_keys));
        std::string prefix = config_.path_prefix + options.prefix;
        if (!prefix.empty()) {
            params.push_back("prefix=" + net::url_encode(prefix));
        }

        url += "?";
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) url += "&";
            url += params[i];
        }

        auto request = make_request(net::HttpMethod::GET, url);
        sign_request(request);

        auto response = http_client_->execute(request);

        if (!response.ok()) {
            result.success = false;
            result.error_message = "LIST " + options.prefix + ": " + describe_failure(response);
            return result;
        }

        return parse_list_response(response.body);
    }

    std::optional<std::string> presign_url(const std::string& key,
                                           std::chrono::seconds expires) const override {
        if (expires.count() < 1) {
            expires = std::chrono::seconds(1);
        }
        if (expires > MAX_PRESIGN_EXPIRY) {
            expires = MAX_PRESIGN_EXPIRY;
        }

        std::string url = signer_.presign(net::HttpMethod::GET, build_url(key), expires,
                                          config_.session_token.str());
        if (url.empty()) {
            return std::nullopt;
        }
        return url;
    }

    bool is_healthy() const override {
        ListOptions options;
        options.max_keys = 1;
        return list(options).success;
    }

private:
    net::HttpRequest make_request(net::HttpMethod method, const std::string& url) const {
        net::HttpRequest request;
        request.method = method;
        request.url = url;
        request.connect_timeout = std::chrono::milliseconds(config_.connect_timeout_secs * 1000);
        request.total_timeout = std::chrono::milliseconds(config_.request_timeout_secs * 1000);
        return request;
    }

    // Sign request, using session token if configured
    void sign_request(net::HttpRequest& request) const {
        if (!config_.session_token.empty()) {
            signer_.sign_with_token(request, config_.session_token.str());
        } else {
            signer_.sign(request);
        }
    }

    // GetOptions::range_end is exclusive, the Range header is inclusive
    static void set_range(net::HttpRequest& request, const GetOptions& options) {
        if (!options.range_start && !options.range_end) {
            return;
        }
        uint64_t start = options.range_start.value_or(0);
        std::string range = "bytes=" + std::to_string(start) + "-";
        if (options.range_end && *options.range_end > start) {
            range += std::to_string(*options.range_end - 1);
        }
        request.headers.set("Range", range);
    }

    std::string build_url(const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = config_.endpoint;
            while (!url.empty() && url.back() == '/') {
                url.pop_back();
            }
            if (config_.use_path_style && !config_.bucket.empty()) {
                url += "/" + config_.bucket;
            }
        } else {
            if (config_.use_path_style) {
                url = "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
            } else {
                url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
            }
        }
        if (!key.empty()) {
            url += "/" + net::uri_encode_path(config_.path_prefix + key);
        }
        return url;
    }

    static std::string describe_failure(const net::HttpResponse& response) {
        if (response.is_network_error || response.status_code == 0) {
            return response.error.empty() ? "network error" : response.error;
        }
        std::string message = "HTTP " + std::to_string(response.status_code);
        std::string code = xml::get_element(response.body_string(), "Code");
        if (!code.empty()) {
            message += " " + code;
        }
        return message;
    }

    static ObjectMetadata parse_object_metadata(const net::HttpResponse& response) {
        ObjectMetadata meta;

        // A ranged GET reports the full size after the slash in Content-Range
        auto content_range = response.headers.get("Content-Range");
        size_t slash = content_range ? content_range->rfind('/') : std::string::npos;
        if (slash != std::string::npos && content_range->compare(slash + 1, 1, "*") != 0) {
            try {
                meta.size = std::stoull(content_range->substr(slash + 1));
            } catch (const std::exception&) {
                meta.size = response.headers.content_length().value_or(0);
            }
        } else {
            meta.size = response.headers.content_length().value_or(0);
        }

        meta.etag = response.headers.get("ETag").value_or("");
        meta.content_type = response.headers.content_type().value_or("");
        if (auto last_modified = response.headers.get("Last-Modified")) {
            if (auto tp = net::parse_http_date(*last_modified)) {
                meta.last_modified = *tp;
            }
        }

        static const std::string meta_prefix = "x-amz-meta-";
        for (const auto& [name, value] : response.headers.all()) {
            if (name.compare(0, meta_prefix.size(), meta_prefix) == 0) {
                meta.user_metadata[name.substr(meta_prefix.size())] = value;
            }
        }
        return meta;
    }

    ListResult parse_list_response(const std::vector<uint8_t>& body) const {
        ListResult result;
        result.success = true;

        std::string xml_str(body.begin(), body.end());

        result.truncated = (xml::get_element(xml_str, "IsTruncated") == "true");
        result.continuation_token = xml::get_element(xml_str, "NextContinuationToken");

        for (const auto& range : xml::find_elements(xml_str, "Contents")) {
            std::string content = xml_str.substr(range.content_start,
                                                  range.content_end - range.content_start);

            ListEntry entry;
            entry.key = strip_prefix(xml::decode_entities(xml::get_element(content, "Key")));

            std::string size_str = xml::get_element(content, "Size");
            if (!size_str.empty()) {
                try {
                    entry.size = std::stoull(size_str);
                } catch (const std::exception&) {
                    log_error("Ignoring bad <Size> for %s: %s", entry.key.c_str(), size_str.c_str());
                }
            }

            if (auto tp = xml::parse_timestamp(xml::get_element(content, "LastModified"))) {
                entry.last_modified = *tp;
            }

            entry.etag = xml::decode_entities(xml::get_element(content, "ETag"));
            result.entries.push_back(entry);
        }

        // CommonPrefixes (directories) when a delimiter was requested
        for (const auto& range : xml::find_elements(xml_str, "CommonPrefixes")) {
            std::string content = xml_str.substr(range.content_start,
                                                  range.content_end - range.content_start);
            ListEntry entry;
            entry.key = strip_prefix(xml::decode_entities(xml::get_element(content, "Prefix")));
            entry.is_directory = true;
            result.entries.push_back(entry);
        }

        return result;
    }

    std::string strip_prefix(const std::string& key) const {
        if (!config_.path_prefix.empty() &&
            key.compare(0, config_.path_prefix.size(), config_.path_prefix) == 0) {
            return key.substr(config_.path_prefix.size());
        }
        return key;
    }

    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

// ============================================================================
// StorageBackendFactory implementation
// ============================================================================

static bool is_true(const std::string& value) {
    return value == "true" || value == "1";
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config) {

    size_t read_chunk_size = 0;
    if (auto it = config.find("read_chunk_size"); it != config.end()) {
        try {
            read_chunk_size = std::stoul(it->second);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid read_chunk_size: " + it->second);
        }
    }

    if (type == "local") {
        auto it = config.find("path");
        if (it == config.end() || it->second.empty()) {
            throw std::runtime_error("Local backend requires 'path' config");
        }
        return std::make_unique<LocalStorageBackend>(it->second, read_chunk_size);
    }

    if (type == "s3") {
        S3StorageBackend::Config s3_config;

        auto it = config.find("bucket");
        if (it == config.end() || it->second.empty()) {
            throw std::runtime_error("S3 backend requires 'bucket' config");
        }
        s3_config.bucket = it->second;

        if ((it = config.find("region")) != config.end() && !it->second.empty()) {
            s3_config.region = it->second;
        }
        if ((it = config.find("endpoint")) != config.end()) {
            s3_config.endpoint = it->second;
        }
        if ((it = config.find("path_prefix")) != config.end()) {
            s3_config.path_prefix = it->second;
        }
        if ((it = config.find("access_key")) != config.end()) {
            s3_config.access_key = it->second;
        }
        if ((it = config.find("secret_key")) != config.end()) {
            s3_config.secret_key = it->second;
        }
        if ((it = config.find("session_token")) != config.end()) {
            s3_config.session_token = it->second;
        }
        if ((it = config.find("use_path_style")) != config.end()) {
            s3_config.use_path_style = is_true(it->second);
        }
        if ((it = config.find("verify_ssl")) != config.end()) {
            s3_config.verify_ssl = is_true(it->second);
        }
        if ((it = config.find("ca_cert")) != config.end()) {
            s3_config.ca_cert = it->second;
        }
        if ((it = config.find("connect_timeout")) != config.end()) {
            try {
                s3_config.connect_timeout_secs = static_cast<uint32_t>(std::stoul(it->second));
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid connect_timeout: " + it->second);
            }
        }
        if ((it = config.find("request_timeout")) != config.end()) {
            try {
                s3_config.request_timeout_secs = static_cast<uint32_t>(std::stoul(it->second));
            } catch (const std::exception&) {
                throw std::runtime_error("Invalid request_timeout: " + it->second);
            }
        }
        s3_config.receive_buffer_size = read_chunk_size;

        return std::make_unique<S3StorageBackend>(s3_config);
    }

    throw std::runtime_error("Unknown storage backend type: " + type);
}

}  // namespace vidgate
