#pragma once

#include "vidgate/pointer_resolver.hpp"
#include "vidgate/range_delivery.hpp"
#include "vidgate/storage/backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace vidgate {

class MetricsExporter;

struct ServerOptions {
    std::string listen_address = "0.0.0.0";
    uint16_t port = 8080;  // 0 picks a free port (see HttpServer::port())
    size_t max_connections = 256;
    std::chrono::seconds idle_timeout{30};    // Keep-alive read timeout
    std::chrono::seconds shutdown_grace{10};  // Wait for in-flight connections
};

/// Blocking HTTP/1.1 front end. One accept thread; each connection gets its
/// own thread that serves requests sequentially, including the full
/// duration of a streamed body.
///
/// Routes:
///   GET      /sample, /api/sample   ?id=      -> PointerResolver (always 200 JSON)
///   GET|HEAD /stream, /api/stream   ?key=&download= -> RangeDeliveryEngine
///   GET      /healthz                          -> 200 "ok" / 503
class HttpServer {
public:
    HttpServer(ServerOptions options,
               const PointerResolver& resolver,
               const RangeDeliveryEngine& engine,
               const StorageBackend& backend);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start the accept thread.
    /// Returns error message or empty string on success.
    std::string start();

    /// Stop accepting and end every connection. Idle connections are closed
    /// at once; in-flight responses get up to shutdown_grace to finish before
    /// their sockets are shut down. All connection threads are joined before
    /// returning. Returns false if the grace period ran out.
    bool stop();

    /// Bound port (after start()).
    uint16_t port() const { return bound_port_; }

    size_t active_connections() const { return active_connections_.load(); }

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

private:
    void accept_loop();
    void handle_connection(boost::asio::ip::tcp::socket socket, uint64_t id);
    void reject_connection(boost::asio::ip::tcp::socket& socket);
    void reap_finished_connections();

    struct Connection {
        int fd = -1;  // -1 once the connection thread has closed its socket
        std::thread thread;
    };

    ServerOptions options_;
    const PointerResolver& resolver_;
    const RangeDeliveryEngine& engine_;
    const StorageBackend& backend_;
    MetricsExporter* metrics_ = nullptr;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t bound_port_ = 0;

    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    // Connection threads by id. Finished ids are joined by the accept loop
    // before it starts the next thread, and the rest by stop().
    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::map<uint64_t, Connection> connections_;
    std::vector<uint64_t> finished_connections_;
    uint64_t next_connection_id_ = 0;
    std::atomic<size_t> active_connections_{0};
};

}  // namespace vidgate
