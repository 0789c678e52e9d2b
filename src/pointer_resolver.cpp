#include "vidgate/pointer_resolver.hpp"
#include "vidgate/log.hpp"
#include "vidgate/metrics.hpp"
#include "vidgate/net/http.hpp"

#include <algorithm>
#include <cctype>

namespace vidgate {

const char* resolve_error_name(ResolveError error) {
    switch (error) {
        case ResolveError::MissingId: return "MISSING_ID";
        case ResolveError::PointerNotFound: return "POINTER_NOT_FOUND";
        case ResolveError::EmptyKey: return "EMPTY_KEY";
        case ResolveError::ObjectNotFound: return "OBJECT_NOT_FOUND";
        case ResolveError::Server: return "SERVER";
    }
    return "SERVER";
}

std::string make_identifier(const std::string& email) {
    std::string id = email;
    std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) {
        if (c == '@' || c == '.') return '_';
        return static_cast<char>(std::tolower(c));
    });
    return id;
}

std::string make_video_key(const std::string& identifier, const std::string& filename) {
    return "videos/" + identifier + "__" + filename;
}

// --- PointerRecord ---

std::optional<PointerRecord> PointerRecord::parse(const std::string& text, std::string& error) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        error = "pointer is not valid JSON";
        return std::nullopt;
    }
    if (!j.is_object()) {
        error = "pointer is not a JSON object";
        return std::nullopt;
    }

    PointerRecord record;
    if (auto it = j.find("key"); it != j.end() && it->is_string()) {
        record.key = it->get<std::string>();
    }
    if (auto it = j.find("company"); it != j.end() && it->is_string()) {
        auto company = it->get<std::string>();
        if (!company.empty()) {
            record.company = std::move(company);
        }
    }
    return record;
}

nlohmann::json PointerRecord::to_json() const {
    nlohmann::json j;
    j["key"] = key;
    j["company"] = company ? nlohmann::json(*company) : nlohmann::json(nullptr);
    return j;
}

// --- KeyResolver ---

std::string KeyResolver::nested_candidate(const std::string& candidate) {
    std::string base = candidate;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (base.empty()) {
        return {};
    }
    auto slash = base.rfind('/');
    std::string filename = slash == std::string::npos ? base : base.substr(slash + 1);
    return base + "/" + filename;
}

std::string KeyResolver::listing_prefix(const std::string& candidate) {
    if (!candidate.empty() && candidate.back() == '/') {
        return candidate;
    }
    return candidate + "/";
}

std::optional<KeyResolution> KeyResolver::resolve(const std::string& candidate) const {
    if (backend_.head(candidate)) {
        return KeyResolution{candidate, "exact"};
    }

    auto nested = nested_candidate(candidate);
    if (!nested.empty() && backend_.head(nested)) {
        return KeyResolution{nested, "nested"};
    }

    ListOptions options;
    options.prefix = listing_prefix(candidate);
    options.max_keys = 1;
    auto listing = backend_.list(options);
    if (!listing.success) {
        throw StorageError(listing.error_message);
    }
    for (const auto& entry : listing.entries) {
        if (!entry.is_directory) {
            return KeyResolution{entry.key, "prefix"};
        }
    }

    return std::nullopt;
}

// --- ResolveResult ---

nlohmann::json ResolveResult::to_json() const {
    auto optional_string = [](const std::optional<std::string>& value) {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    };

    nlohmann::json j;
    j[mode == DeliveryMode::Stream ? "streamUrl" : "signedUrl"] = optional_string(delivery_url);
    j["company"] = optional_string(company);
    j["link"] = optional_string(link);
    if (found_key) j["foundKey"] = *found_key;
    if (error) j["error"] = resolve_error_name(*error);
    if (wanted_key) j["wantedKey"] = *wanted_key;
    if (message) j["message"] = *message;
    return j;
}

// --- PointerResolver ---

PointerResolver::PointerResolver(const StorageBackend& backend, ResolverOptions options)
    : backend_(backend)
    , options_(std::move(options))
    , key_resolver_(backend) {
    while (!options_.public_base.empty() && options_.public_base.back() == '/') {
        options_.public_base.pop_back();
    }
}

std::string PointerResolver::make_link(const std::string& identifier,
                                       const std::string& request_origin) const {
    std::string base = options_.public_base.empty() ? request_origin : options_.public_base;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/p/?id=" + net::url_encode(identifier);
}

std::string PointerResolver::pointer_key(const std::string& identifier) const {
    return options_.pointer_prefix + identifier + ".json";
}

ResolveResult PointerResolver::resolve(const std::string& identifier,
                                       const std::string& request_origin) const {
    ResolveResult result;
    result.mode = options_.mode;

    if (identifier.empty()) {
        result.error = ResolveError::MissingId;
        if (metrics_) metrics_->record_resolve(resolve_error_name(*result.error));
        return result;
    }

    result.link = make_link(identifier, request_origin);

    try {
        resolve_into(identifier, result);
    } catch (const std::exception& e) {
        log_error("resolve %s: %s", identifier.c_str(), e.what());
        result.error = ResolveError::Server;
        result.message = e.what();
        result.delivery_url.reset();
        result.found_key.reset();
        if (metrics_) metrics_->backend_errors().Increment();
    }

    if (metrics_) {
        metrics_->record_resolve(result.error ? resolve_error_name(*result.error) : "ok");
        if (!result.resolution_method.empty()) {
            metrics_->record_key_resolution(result.resolution_method);
        }
    }
    return result;
}

void PointerResolver::resolve_into(const std::string& identifier, ResolveResult& result) const {
    auto pointer = backend_.get(pointer_key(identifier));
    if (!pointer.success) {
        if (pointer.not_found) {
            result.error = ResolveError::PointerNotFound;
            return;
        }
        throw StorageError("pointer " + identifier + ": " + pointer.error_message);
    }

    std::string parse_error;
    auto record = PointerRecord::parse(
        std::string(pointer.data.begin(), pointer.data.end()), parse_error);
    if (!record) {
        result.error = ResolveError::EmptyKey;
        result.message = parse_error;
        return;
    }

    result.company = record->company;
    if (record->key.empty()) {
        result.error = ResolveError::EmptyKey;
        return;
    }

    auto found = key_resolver_.resolve(record->key);
    if (!found) {
        result.error = ResolveError::ObjectNotFound;
        result.wanted_key = record->key;
        return;
    }

    result.found_key = found->key;
    result.resolution_method = found->method;
    if (found->method != "exact") {
        log_info("resolve %s: %s found via %s fallback (wanted %s)",
                 identifier.c_str(), found->key.c_str(), found->method.c_str(),
                 record->key.c_str());
    }

    if (options_.mode == DeliveryMode::Stream) {
        result.delivery_url = options_.stream_path + "?key=" + net::url_encode(found->key);
        return;
    }

    auto url = backend_.presign_url(found->key, options_.presign_expiry);
    if (!url) {
        throw StorageError(backend_.type_name() + " backend cannot presign URLs");
    }
    result.delivery_url = std::move(*url);
}

}  // namespace vidgate
