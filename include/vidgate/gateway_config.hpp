#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace vidgate {

/// How a resolved object is handed to the client.
enum class DeliveryMode {
    Signed,  // Presigned backend URL, client fetches directly
    Stream   // Same-origin /stream?key= reference served by this gateway
};

const char* delivery_mode_name(DeliveryMode mode);
std::optional<DeliveryMode> parse_delivery_mode(const std::string& name);

/// Configuration for the object store holding pointers and videos.
struct BackendConfig {
    std::string type;  // "s3", "local"
    std::map<std::string, std::string> params;  // Passed to StorageBackendFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the gateway daemon and the vidgate-resolve tool.
struct GatewayConfig {
    // HTTP listener
    std::string listen_address = "0.0.0.0";
    uint16_t port = 8080;
    size_t max_connections = 256;

    // Canonical page links: <public_base>/p/?id=<identifier>.
    // Empty means "use the request origin".
    std::string public_base;

    // Resolution
    DeliveryMode delivery_mode = DeliveryMode::Signed;
    std::chrono::seconds presign_expiry{86400};
    std::string pointer_prefix = "pointers/";

    // Streaming
    size_t stream_chunk_kb = 256;

    BackendConfig backend;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;  // e.g. /var/lib/node_exporter/textfile/vidgate.prom
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<GatewayConfig> from_args(int argc, char* argv[]);

    /// Consume one option at argv[i] (advancing i past its value).
    /// Returns false and prints an error for unknown or malformed options.
    bool parse_option(int argc, char* argv[], int& i);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in environment fallbacks (public base, S3 credentials) and
    /// derived backend parameters.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    static const char* usage();
};

}  // namespace vidgate
