#include "vidgate/range_delivery.hpp"
#include "vidgate/log.hpp"
#include "vidgate/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>

namespace vidgate {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Parse a run of digits starting at `pos`. Returns false if there are none;
// `overflow` is set when the value does not fit in 64 bits.
bool parse_digits(const std::string& s, size_t& pos, uint64_t& value, bool& overflow) {
    size_t begin = pos;
    value = 0;
    overflow = false;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        uint64_t digit = static_cast<uint64_t>(s[pos] - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            overflow = true;
        } else if (!overflow) {
            value = value * 10 + digit;
        }
        ++pos;
    }
    return pos > begin;
}

}  // namespace

RangeDecision evaluate_range(const std::optional<std::string>& header, uint64_t size) {
    RangeDecision decision;
    if (!header) {
        return decision;
    }

    std::string text = trim(*header);
    static const std::string unit = "bytes=";
    if (text.size() < unit.size() ||
        !std::equal(unit.begin(), unit.end(), text.begin(), [](char a, char b) {
            return a == std::tolower(static_cast<unsigned char>(b));
        })) {
        return decision;
    }

    size_t pos = unit.size();
    uint64_t start = 0;
    bool start_overflow = false;
    if (!parse_digits(text, pos, start, start_overflow)) {
        return decision;  // Suffix ranges ("bytes=-500") are not honoured
    }
    if (pos >= text.size() || text[pos] != '-') {
        return decision;
    }
    ++pos;

    uint64_t end = size > 0 ? size - 1 : 0;
    uint64_t parsed_end = 0;
    bool end_overflow = false;
    bool has_end = parse_digits(text, pos, parsed_end, end_overflow);
    if (pos != text.size()) {
        return decision;  // Multiple ranges or trailing junk
    }
    if (has_end && !end_overflow) {
        end = std::min(parsed_end, end);
    }

    if (start_overflow || start >= size || start > end) {
        decision.kind = RangeDecision::Kind::Unsatisfiable;
        return decision;
    }

    decision.kind = RangeDecision::Kind::Partial;
    decision.range = {start, end};
    return decision;
}

std::string guess_content_type(const std::string& key) {
    static const std::map<std::string, std::string> types = {
        {"mp4", "video/mp4"},
        {"mov", "video/quicktime"},
        {"webm", "video/webm"},
        {"m4v", "video/x-m4v"},
        {"mkv", "video/x-matroska"},
        {"avi", "video/x-msvideo"},
        {"ogv", "video/ogg"},
        {"mp3", "audio/mpeg"},
        {"m4a", "audio/mp4"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"pdf", "application/pdf"},
        {"json", "application/json"},
        {"txt", "text/plain"},
    };

    auto slash = key.rfind('/');
    auto dot = key.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "application/octet-stream";
    }

    std::string ext = key.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string attachment_filename(const std::string& key) {
    std::string base = key;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    auto slash = base.rfind('/');
    std::string name = slash == std::string::npos ? base : base.substr(slash + 1);

    std::string clean;
    clean.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '"' || c == '\\' || c < 0x20 || c == 0x7f) continue;
        clean += static_cast<char>(c);
    }
    return clean.empty() ? "download" : clean;
}

StreamResponse make_text_response(int status, const std::string& text) {
    StreamResponse response;
    response.status = status;
    response.headers.set("Content-Type", "text/plain; charset=utf-8");
    response.headers.set("Cache-Control", "no-store");
    response.text_body = text;
    response.content_length = text.size();
    return response;
}

StreamResponse RangeDeliveryEngine::serve(const StreamRequest& request) const {
    StreamResponse response;

    if (request.key.empty()) {
        response = make_text_response(400, "Missing key");
    } else {
        try {
            auto meta = backend_.head(request.key);
            if (!meta) {
                response = make_text_response(404, "Not found");
            } else {
                response = make_response(request, *meta);
            }
        } catch (const std::exception& e) {
            log_error("stream %s: %s", request.key.c_str(), e.what());
            if (metrics_) metrics_->backend_errors().Increment();
            response = make_text_response(500, "Server error");
        }
    }

    if (metrics_) {
        metrics_->record_stream_status(response.status);
    }
    return response;
}

StreamResponse RangeDeliveryEngine::make_response(const StreamRequest& request,
                                                  const ObjectMetadata& meta) const {
    StreamResponse response;
    auto& headers = response.headers;

    headers.set("Content-Type",
                meta.content_type.empty() ? guess_content_type(request.key) : meta.content_type);
    headers.set("Accept-Ranges", "bytes");
    headers.set("Cache-Control", "no-store");
    if (!meta.etag.empty()) {
        headers.set("ETag", meta.etag);
    }
    if (meta.last_modified.time_since_epoch().count() != 0) {
        headers.set("Last-Modified", net::format_http_date(meta.last_modified));
    }
    if (request.download) {
        headers.set("Content-Disposition",
                    "attachment; filename=\"" + attachment_filename(request.key) + "\"");
    }

    auto decision = evaluate_range(request.range, meta.size);
    GetOptions options;

    switch (decision.kind) {
        case RangeDecision::Kind::Unsatisfiable: {
            auto error = make_text_response(416, "Range Not Satisfiable");
            error.headers.set("Accept-Ranges", "bytes");
            error.headers.set("Content-Range", "bytes */" + std::to_string(meta.size));
            return error;
        }
        case RangeDecision::Kind::Partial:
            response.status = 206;
            response.content_length = decision.range.length();
            headers.set("Content-Range", "bytes " + std::to_string(decision.range.start) + "-" +
                                         std::to_string(decision.range.end) + "/" +
                                         std::to_string(meta.size));
            options.range_start = decision.range.start;
            options.range_end = decision.range.end + 1;
            break;
        case RangeDecision::Kind::Full:
            response.status = 200;
            response.content_length = meta.size;
            break;
    }

    if (request.head_only || response.content_length == 0) {
        return response;
    }

    // Captures by value: the writer runs after serve() has returned
    const StorageBackend* backend = &backend_;
    MetricsExporter* metrics = metrics_;
    std::string key = request.key;
    response.body = [backend, metrics, key, options](const ByteSink& sink) {
        auto result = backend->get_stream(key, sink, options);
        if (metrics) {
            metrics->stream_bytes_total().Increment(static_cast<double>(result.bytes));
            if (result.aborted) {
                metrics->stream_client_aborts().Increment();
            } else if (!result.success) {
                metrics->backend_errors().Increment();
            }
        }
        return result;
    };
    return response;
}

}  // namespace vidgate
