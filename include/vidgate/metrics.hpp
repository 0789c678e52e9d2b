#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace vidgate {

class HttpServer;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports gateway metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointer for the connection gauge snapshot.
    void set_server(const HttpServer* server) { server_ = server; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Count one resolve outcome ("ok" or the error code, e.g. "POINTER_NOT_FOUND").
    void record_resolve(const std::string& result);

    /// Count which fallback step found the key ("exact", "nested", "prefix").
    void record_key_resolution(const std::string& method);

    /// Count one /stream response by status code.
    void record_stream_status(int status);

    // --- Counter accessors ---
    prometheus::Counter& stream_bytes_total() { return *stream_bytes_total_; }
    prometheus::Counter& stream_client_aborts() { return *stream_client_aborts_; }
    prometheus::Counter& backend_errors() { return *backend_errors_; }

    // --- Histogram accessors ---
    prometheus::Histogram& resolve_duration() { return *resolve_duration_; }
    prometheus::Histogram& stream_duration() { return *stream_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Pointer for gauge snapshots (not owned)
    const HttpServer* server_ = nullptr;

    // --- Counters ---
    prometheus::Family<prometheus::Counter>* resolve_family_;
    prometheus::Family<prometheus::Counter>* key_resolution_family_;
    prometheus::Family<prometheus::Counter>* stream_family_;
    prometheus::Counter* stream_bytes_total_;
    prometheus::Counter* stream_client_aborts_;
    prometheus::Counter* backend_errors_;

    // --- Gauges ---
    prometheus::Gauge* active_connections_;

    // --- Histograms ---
    prometheus::Histogram* resolve_duration_;
    prometheus::Histogram* stream_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace vidgate
