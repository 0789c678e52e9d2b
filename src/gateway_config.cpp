#include "vidgate/gateway_config.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace vidgate {

// Largest X-Amz-Expires S3 accepts
static constexpr int64_t MAX_PRESIGN_EXPIRY_SECS = 604800;

const char* delivery_mode_name(DeliveryMode mode) {
    switch (mode) {
        case DeliveryMode::Signed: return "signed";
        case DeliveryMode::Stream: return "stream";
    }
    return "signed";
}

std::optional<DeliveryMode> parse_delivery_mode(const std::string& name) {
    if (name == "signed") return DeliveryMode::Signed;
    if (name == "stream") return DeliveryMode::Stream;
    return std::nullopt;
}

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "s3") {
        if (params.count("bucket") == 0 || params.at("bucket").empty())
            return "s3 backend requires 'bucket'";
    } else if (type == "local") {
        if (params.count("path") == 0 || params.at("path").empty())
            return "local backend requires 'path'";
        if (!std::filesystem::is_directory(params.at("path")))
            return "local backend path is not a directory: " + params.at("path");
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

// --- GatewayConfig ---

namespace {

// Map a --backend-X flag to a StorageBackendFactory parameter.
// Returns false if the suffix is not a known backend flag.
bool parse_backend_flag(const std::string& suffix, const char* value, BackendConfig& target) {
    if (suffix == "type") {
        target.type = value;
    } else if (suffix == "endpoint") {
        target.params["endpoint"] = value;
    } else if (suffix == "bucket") {
        target.params["bucket"] = value;
    } else if (suffix == "region") {
        target.params["region"] = value;
    } else if (suffix == "access-key") {
        target.params["access_key"] = value;
    } else if (suffix == "secret-key") {
        target.params["secret_key"] = value;
    } else if (suffix == "session-token") {
        target.params["session_token"] = value;
    } else if (suffix == "path") {
        target.params["path"] = value;
    } else if (suffix == "prefix") {
        target.params["path_prefix"] = value;
    } else if (suffix == "ca-cert") {
        target.params["ca_cert"] = value;
    } else {
        return false;
    }
    return true;
}

bool is_backend_bool_flag(const std::string& suffix) {
    return suffix == "no-verify-ssl" || suffix == "path-style";
}

void parse_backend_bool_flag(const std::string& suffix, BackendConfig& target) {
    if (suffix == "no-verify-ssl") {
        target.params["verify_ssl"] = "false";
    } else if (suffix == "path-style") {
        target.params["use_path_style"] = "true";
    }
}

template <typename T>
bool parse_unsigned(const char* name, const char* text, T& out) {
    try {
        size_t used = 0;
        unsigned long long value = std::stoull(text, &used);
        if (used != std::strlen(text) || text[0] == '-') {
            throw std::invalid_argument(text);
        }
        out = static_cast<T>(value);
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << name << " expects a non-negative integer, got '" << text << "'\n";
        return false;
    }
}

}  // namespace

bool GatewayConfig::parse_option(int argc, char* argv[], int& i) {
    std::string arg = argv[i];

    auto next_arg = [&](const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    if (arg.compare(0, 10, "--backend-") == 0) {
        std::string suffix = arg.substr(10);
        if (is_backend_bool_flag(suffix)) {
            parse_backend_bool_flag(suffix, backend);
            return true;
        }
        auto* v = next_arg(arg.c_str());
        if (!v) return false;
        if (!parse_backend_flag(suffix, v, backend)) {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return false;
        }
        return true;
    }

    if (arg == "--listen") {
        auto* v = next_arg("--listen");
        if (!v) return false;
        listen_address = v;
    } else if (arg == "--port") {
        auto* v = next_arg("--port");
        if (!v) return false;
        unsigned long value = 0;
        if (!parse_unsigned("--port", v, value)) return false;
        if (value == 0 || value > 65535) {
            std::cerr << "Error: --port out of range: " << v << "\n";
            return false;
        }
        port = static_cast<uint16_t>(value);
    } else if (arg == "--public-base") {
        auto* v = next_arg("--public-base");
        if (!v) return false;
        public_base = v;
    } else if (arg == "--delivery-mode") {
        auto* v = next_arg("--delivery-mode");
        if (!v) return false;
        auto mode = parse_delivery_mode(v);
        if (!mode) {
            std::cerr << "Error: --delivery-mode must be 'signed' or 'stream'\n";
            return false;
        }
        delivery_mode = *mode;
    } else if (arg == "--presign-expiry") {
        auto* v = next_arg("--presign-expiry");
        if (!v) return false;
        int64_t secs = 0;
        if (!parse_unsigned("--presign-expiry", v, secs)) return false;
        presign_expiry = std::chrono::seconds(secs);
    } else if (arg == "--pointer-prefix") {
        auto* v = next_arg("--pointer-prefix");
        if (!v) return false;
        pointer_prefix = v;
    } else if (arg == "--stream-chunk-kb") {
        auto* v = next_arg("--stream-chunk-kb");
        if (!v) return false;
        if (!parse_unsigned("--stream-chunk-kb", v, stream_chunk_kb)) return false;
    } else if (arg == "--max-connections") {
        auto* v = next_arg("--max-connections");
        if (!v) return false;
        if (!parse_unsigned("--max-connections", v, max_connections)) return false;
    } else if (arg == "--config") {
        auto* v = next_arg("--config");
        if (!v) return false;
        if (!load_json(v)) return false;
    } else if (arg == "--daemon") {
        daemonize = true;
    } else if (arg == "--verbose") {
        verbose = true;
    } else if (arg == "--pid-file") {
        auto* v = next_arg("--pid-file");
        if (!v) return false;
        pid_file = v;
    } else if (arg == "--log-file") {
        auto* v = next_arg("--log-file");
        if (!v) return false;
        log_file = v;
    } else if (arg == "--metrics-file") {
        auto* v = next_arg("--metrics-file");
        if (!v) return false;
        metrics_file = v;
    } else if (arg == "--metrics-interval") {
        auto* v = next_arg("--metrics-interval");
        if (!v) return false;
        if (!parse_unsigned("--metrics-interval", v, metrics_interval_secs)) return false;
    } else {
        std::cerr << "Error: unknown option: " << arg << "\n";
        return false;
    }
    return true;
}

std::optional<GatewayConfig> GatewayConfig::from_args(int argc, char* argv[]) {
    GatewayConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cerr << usage();
            return std::nullopt;
        }
        if (!config.parse_option(argc, argv, i)) {
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

const char* GatewayConfig::usage() {
    return
        "Usage: vidgate --backend-type <s3|local> [options]\n"
        "\n"
        "Listener:\n"
        "  --listen <addr>                  Bind address (default: 0.0.0.0)\n"
        "  --port <N>                       Port (default: 8080)\n"
        "  --max-connections <N>            Concurrent connections (default: 256)\n"
        "\n"
        "Resolution:\n"
        "  --public-base <url>              Base for canonical links (or VIDGATE_PUBLIC_BASE env,\n"
        "                                   default: request origin)\n"
        "  --delivery-mode <signed|stream>  Presigned URLs or /stream references (default: signed)\n"
        "  --presign-expiry <secs>          Presigned URL lifetime (default: 86400, max 604800)\n"
        "  --pointer-prefix <prefix>        Pointer record prefix (default: pointers/)\n"
        "  --stream-chunk-kb <N>            Backend read size for streaming (default: 256)\n"
        "\n"
        "Backend (--backend-*):\n"
        "  --backend-type <type>            s3 or local\n"
        "  --backend-endpoint <url>         Endpoint URL (S3-compatible stores, e.g. R2/MinIO)\n"
        "  --backend-bucket <name>          Bucket name (S3)\n"
        "  --backend-region <region>        Region (S3, default: us-east-1)\n"
        "  --backend-access-key <key>       Access key (S3, or AWS_ACCESS_KEY_ID env)\n"
        "  --backend-secret-key <key>       Secret key (S3, or AWS_SECRET_ACCESS_KEY env)\n"
        "  --backend-session-token <tok>    Session token (S3, or AWS_SESSION_TOKEN env)\n"
        "  --backend-prefix <prefix>        Key prefix inside the bucket\n"
        "  --backend-path <path>            Root directory (local)\n"
        "  --backend-ca-cert <path>         CA certificate for SSL\n"
        "  --backend-path-style             Path-style bucket addressing\n"
        "  --backend-no-verify-ssl          Skip SSL verification\n"
        "\n"
        "Daemon:\n"
        "  --config <path>                  JSON config file\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

bool GatewayConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("listen")) listen_address = j["listen"].get<std::string>();
        if (j.contains("port")) port = j["port"].get<uint16_t>();
        if (j.contains("max_connections")) max_connections = j["max_connections"].get<size_t>();
        if (j.contains("public_base")) public_base = j["public_base"].get<std::string>();
        if (j.contains("delivery_mode")) {
            auto mode = parse_delivery_mode(j["delivery_mode"].get<std::string>());
            if (!mode) {
                std::cerr << "Error parsing config: delivery_mode must be 'signed' or 'stream'\n";
                return false;
            }
            delivery_mode = *mode;
        }
        if (j.contains("presign_expiry"))
            presign_expiry = std::chrono::seconds(j["presign_expiry"].get<int64_t>());
        if (j.contains("pointer_prefix")) pointer_prefix = j["pointer_prefix"].get<std::string>();
        if (j.contains("stream_chunk_kb")) stream_chunk_kb = j["stream_chunk_kb"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("pid_file")) pid_file = j["pid_file"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
            for (auto& [key, val] : jb.items()) {
                if (key == "type") continue;
                // Booleans are accepted as JSON booleans or strings
                backend.params[key] = val.is_boolean()
                    ? (val.get<bool>() ? "true" : "false")
                    : val.get<std::string>();
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void GatewayConfig::apply_defaults() {
    if (public_base.empty()) {
        if (const char* v = std::getenv("VIDGATE_PUBLIC_BASE")) {
            public_base = v;
        }
    }
    // Trim whitespace and trailing slashes
    auto first = public_base.find_first_not_of(" \t");
    auto last = public_base.find_last_not_of(" \t/");
    public_base = (first == std::string::npos || last == std::string::npos || last < first)
        ? std::string{}
        : public_base.substr(first, last - first + 1);

    // Load S3 credentials from environment if not set on CLI
    if (backend.type == "s3") {
        auto from_env = [&](const char* param, const char* env) {
            if (backend.params.count(param) == 0 || backend.params[param].empty()) {
                if (const char* v = std::getenv(env)) {
                    backend.params[param] = v;
                }
            }
        };
        from_env("access_key", "AWS_ACCESS_KEY_ID");
        from_env("secret_key", "AWS_SECRET_ACCESS_KEY");
        from_env("session_token", "AWS_SESSION_TOKEN");
    }

    if (!backend.empty() && stream_chunk_kb > 0) {
        backend.params["read_chunk_size"] = std::to_string(stream_chunk_kb * 1024);
    }
}

std::string GatewayConfig::validate() const {
    if (backend.empty()) return "backend type is required (--backend-type)";
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;
    if (port == 0) return "port must be > 0";
    if (max_connections == 0) return "max_connections must be > 0";
    if (stream_chunk_kb == 0) return "stream_chunk_kb must be > 0";
    if (presign_expiry.count() < 1 || presign_expiry.count() > MAX_PRESIGN_EXPIRY_SECS)
        return "presign_expiry must be between 1 and 604800 seconds";
    if (delivery_mode == DeliveryMode::Signed && backend.type != "s3")
        return "delivery mode 'signed' requires an s3 backend (use --delivery-mode stream)";
    if (!public_base.empty() &&
        public_base.compare(0, 7, "http://") != 0 && public_base.compare(0, 8, "https://") != 0)
        return "public_base must start with http:// or https://";
    return {};
}

}  // namespace vidgate
