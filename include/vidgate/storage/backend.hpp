#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vidgate {

// Raised by backend calls that cannot report failure in their return value
// (head/exists). "Not found" is never an error.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string content_type;
    std::string etag;
    std::map<std::string, std::string> user_metadata;
};

// Result of a buffered get
struct GetResult {
    bool success = false;
    bool not_found = false;
    std::vector<uint8_t> data;
    ObjectMetadata metadata;
    std::string error_message;
};

// Receives object bytes in order. Return false to stop the transfer.
using ByteSink = std::function<bool(const uint8_t* data, size_t size)>;

// Result of a streamed get
struct StreamResult {
    bool success = false;
    bool not_found = false;
    bool aborted = false;    // The sink returned false
    uint64_t bytes = 0;      // Bytes handed to the sink
    std::string error_message;
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string etag;
    bool is_directory = false;
};

// Result of a list operation
struct ListResult {
    bool success = false;
    std::vector<ListEntry> entries;
    bool truncated = false;
    std::string continuation_token;
    std::string error_message;
};

// Options for get operations. range_end is exclusive.
struct GetOptions {
    std::optional<uint64_t> range_start;
    std::optional<uint64_t> range_end;
};

// Options for list operations. An empty delimiter lists recursively.
struct ListOptions {
    std::string prefix;
    std::string delimiter;
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

// Read-only interface to an object store
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Get the backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Check if a key exists
    virtual bool exists(const std::string& key) const = 0;

    // Get object metadata without downloading content
    virtual std::optional<ObjectMetadata> head(const std::string& key) const = 0;

    // Read object content into memory (small objects only)
    virtual GetResult get(const std::string& key,
                          const GetOptions& options = {}) const = 0;

    // Read object content into a sink, chunk by chunk
    virtual StreamResult get_stream(const std::string& key,
                                    const ByteSink& sink,
                                    const GetOptions& options = {}) const = 0;

    // List objects with prefix
    virtual ListResult list(const ListOptions& options = {}) const = 0;

    // Time-limited GET URL for direct client access, or nullopt if the
    // backend cannot issue one
    virtual std::optional<std::string> presign_url(const std::string& key,
                                                   std::chrono::seconds expires) const = 0;

    // Health check
    virtual bool is_healthy() const = 0;
};

// Factory for creating storage backends from configuration
class StorageBackendFactory {
public:
    // Create a backend from a configuration map. Throws std::runtime_error
    // for an unknown type or missing required parameters.
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& config);
};

}  // namespace vidgate
