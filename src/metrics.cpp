#include "vidgate/metrics.hpp"
#include "vidgate/http_server.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace vidgate {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    resolve_family_ = &prometheus::BuildCounter()
        .Name("vidgate_resolve_requests_total")
        .Help("Resolve requests by outcome")
        .Labels(labels)
        .Register(*registry_);

    key_resolution_family_ = &prometheus::BuildCounter()
        .Name("vidgate_key_resolutions_total")
        .Help("Resolved keys by fallback step")
        .Labels(labels)
        .Register(*registry_);

    stream_family_ = &prometheus::BuildCounter()
        .Name("vidgate_stream_responses_total")
        .Help("Stream responses by status code")
        .Labels(labels)
        .Register(*registry_);

    stream_bytes_total_ = &prometheus::BuildCounter()
        .Name("vidgate_stream_bytes_total")
        .Help("Total object bytes written to clients")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    stream_client_aborts_ = &prometheus::BuildCounter()
        .Name("vidgate_stream_client_aborts_total")
        .Help("Streams cut short by the client disconnecting")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    backend_errors_ = &prometheus::BuildCounter()
        .Name("vidgate_backend_errors_total")
        .Help("Storage backend failures")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    active_connections_ = &prometheus::BuildGauge()
        .Name("vidgate_active_connections")
        .Help("Open client connections")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    resolve_duration_ = &prometheus::BuildHistogram()
        .Name("vidgate_resolve_duration_seconds")
        .Help("Resolve request duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10});

    stream_duration_ = &prometheus::BuildHistogram()
        .Name("vidgate_stream_duration_seconds")
        .Help("Stream request duration in seconds, including the body")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30, 60, 300, 900, 3600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::record_resolve(const std::string& result) {
    resolve_family_->Add({{"result", result}}).Increment();
}

void MetricsExporter::record_key_resolution(const std::string& method) {
    key_resolution_family_->Add({{"method", method}}).Increment();
}

void MetricsExporter::record_stream_status(int status) {
    stream_family_->Add({{"status", std::to_string(status)}}).Increment();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    if (server_) {
        active_connections_->Set(static_cast<double>(server_->active_connections()));
    }
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace vidgate
