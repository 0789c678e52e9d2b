#include "vidgate/gateway_config.hpp"
#include "vidgate/http_server.hpp"
#include "vidgate/log.hpp"
#include "vidgate/metrics.hpp"
#include "vidgate/pointer_resolver.hpp"
#include "vidgate/range_delivery.hpp"
#include "vidgate/storage/backend.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // Redirect stdin to /dev/null; stdout/stderr will be redirected
    // to log file after this function returns.
    close(STDIN_FILENO);
    open("/dev/null", O_RDONLY);  // stdin = fd 0

    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}

bool is_secret_param(const std::string& name) {
    return name.find("key") != std::string::npos || name.find("secret") != std::string::npos ||
           name.find("token") != std::string::npos;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = vidgate::GatewayConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    vidgate::set_verbose_logging(config.verbose);

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    // Redirect log output if log file specified (after daemonize)
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    std::cout << "vidgate starting..." << std::endl;
    std::cout << "  listen: " << config.listen_address << ":" << config.port << std::endl;
    std::cout << "  max-connections: " << config.max_connections << std::endl;
    std::cout << "  public-base: "
              << (config.public_base.empty() ? "(request origin)" : config.public_base)
              << std::endl;
    std::cout << "  delivery-mode: " << vidgate::delivery_mode_name(config.delivery_mode)
              << std::endl;
    if (config.delivery_mode == vidgate::DeliveryMode::Signed) {
        std::cout << "  presign-expiry: " << config.presign_expiry.count() << "s" << std::endl;
    }
    std::cout << "  pointer-prefix: " << config.pointer_prefix << std::endl;
    std::cout << "  stream-chunk: " << config.stream_chunk_kb << " KB" << std::endl;
    std::cout << "  backend-type: " << config.backend.type << std::endl;
    for (auto& [k, v] : config.backend.params) {
        // Mask secrets in log output
        if (is_secret_param(k)) {
            std::cout << "  backend-" << k << ": ****" << std::endl;
        } else {
            std::cout << "  backend-" << k << ": " << v << std::endl;
        }
    }
    if (!config.metrics_file.empty()) {
        std::cout << "  metrics-file: " << config.metrics_file.string()
                  << " (every " << config.metrics_interval_secs << "s)" << std::endl;
    }

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.pid_file.parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A client hanging up mid-body must fail the write, not kill the process
    signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<vidgate::StorageBackend> backend;
    try {
        backend = vidgate::StorageBackendFactory::create(config.backend.type,
                                                         config.backend.params);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create storage backend: " << e.what() << std::endl;
        return 1;
    }

    if (!backend->is_healthy()) {
        vidgate::log_error("Storage backend %s is not reachable yet; serving anyway",
                           backend->type_name().c_str());
    }

    vidgate::ResolverOptions resolver_options;
    resolver_options.public_base = config.public_base;
    resolver_options.mode = config.delivery_mode;
    resolver_options.presign_expiry = config.presign_expiry;
    resolver_options.pointer_prefix = config.pointer_prefix;

    vidgate::PointerResolver resolver(*backend, resolver_options);
    vidgate::RangeDeliveryEngine engine(*backend);

    vidgate::ServerOptions server_options;
    server_options.listen_address = config.listen_address;
    server_options.port = config.port;
    server_options.max_connections = config.max_connections;

    auto server = std::make_unique<vidgate::HttpServer>(server_options, resolver, engine,
                                                        *backend);

    // Declared after the server so it is destroyed first; its final
    // snapshot reads the connection gauge from the server
    std::unique_ptr<vidgate::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        std::map<std::string, std::string> labels = {
            {"backend", config.backend.type},
            {"mode", vidgate::delivery_mode_name(config.delivery_mode)},
        };
        metrics = std::make_unique<vidgate::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs), labels);
        metrics->set_server(server.get());
        resolver.set_metrics(metrics.get());
        engine.set_metrics(metrics.get());
        server->set_metrics(metrics.get());
        metrics->start();
    }

    err = server->start();
    if (!err.empty()) {
        std::cerr << "Failed to start server: " << err << std::endl;
        return 1;
    }

    std::cout << "vidgate running (PID " << getpid() << ")" << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server->stop();
    if (metrics) {
        metrics->stop();
    }

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "vidgate exited cleanly" << std::endl;
    return 0;
}
