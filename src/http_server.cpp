#include "vidgate/http_server.hpp"
#include "vidgate/log.hpp"
#include "vidgate/metrics.hpp"
#include "vidgate/net/http.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <poll.h>
#include <sys/socket.h>

#include <chrono>
#include <map>
#include <optional>

namespace vidgate {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr size_t kMaxRequestHeaderBytes = 16 * 1024;
constexpr size_t kMaxRequestBodyBytes = 64 * 1024;

using Request = http::request<http::string_body>;

struct Target {
    std::string path;
    std::map<std::string, std::string> query;
};

Target split_target(beast::string_view target) {
    Target t;
    std::string raw(target.data(), target.size());
    auto q = raw.find('?');
    if (q == std::string::npos) {
        t.path = raw;
    } else {
        t.path = raw.substr(0, q);
        t.query = net::parse_query_string(raw.substr(q + 1));
    }
    return t;
}

std::string query_value(const Target& target, const std::string& name) {
    auto it = target.query.find(name);
    return it != target.query.end() ? it->second : std::string();
}

std::optional<std::string> header_value(const Request& req, http::field field) {
    auto it = req.find(field);
    if (it == req.end()) return std::nullopt;
    return std::string(it->value());
}

// Scheme and authority the client used to reach us, for links built
// without a configured public base.
std::string request_origin(const Request& req, const tcp::socket& socket) {
    std::string scheme = "http";
    auto proto = req.find("X-Forwarded-Proto");
    if (proto != req.end() && !proto->value().empty()) {
        std::string value(proto->value());
        scheme = value.substr(0, value.find(','));
    }

    std::string host;
    auto fwd_host = req.find("X-Forwarded-Host");
    if (fwd_host != req.end() && !fwd_host->value().empty()) {
        std::string value(fwd_host->value());
        host = value.substr(0, value.find(','));
    } else if (auto h = header_value(req, http::field::host); h && !h->empty()) {
        host = *h;
    } else {
        boost::system::error_code ec;
        auto local = socket.local_endpoint(ec);
        if (!ec) {
            host = local.address().to_string() + ":" + std::to_string(local.port());
        }
    }
    return scheme + "://" + host;
}

// Write a response whose body is already in memory. HEAD gets the same
// headers with no body.
bool write_buffered(tcp::socket& socket, const Request& req,
                    http::response<http::string_body>& res, uint64_t& bytes_sent) {
    boost::system::error_code ec;
    if (req.method() == http::verb::head) {
        http::response<http::empty_body> head{res.result(), res.version()};
        for (const auto& field : res.base()) {
            head.set(field.name_string(), field.value());
        }
        head.keep_alive(res.keep_alive());
        http::write(socket, head, ec);
        return !ec;
    }
    http::write(socket, res, ec);
    if (!ec) bytes_sent += res.body().size();
    return !ec;
}

bool send_text(tcp::socket& socket, const Request& req, http::status status,
               const std::string& content_type, const std::string& body,
               const net::HttpHeaders* extra, uint64_t& bytes_sent) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "vidgate");
    res.set(http::field::content_type, content_type);
    if (extra) {
        for (const auto& [name, value] : extra->all()) {
            res.set(name, value);
        }
    }
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return write_buffered(socket, req, res, bytes_sent);
}

// Stream an engine response: header first, then body chunks as the backend
// produces them. Returns false when the connection can no longer be reused.
bool send_stream(tcp::socket& socket, const Request& req, const StreamResponse& response,
                 uint64_t& bytes_sent) {
    http::response<http::buffer_body> res{static_cast<http::status>(response.status),
                                          req.version()};
    res.set(http::field::server, "vidgate");
    for (const auto& [name, value] : response.headers.all()) {
        res.set(name, value);
    }
    res.set(http::field::content_length, std::to_string(response.content_length));
    res.keep_alive(req.keep_alive());
    res.body().data = nullptr;
    res.body().more = true;

    http::response_serializer<http::buffer_body> sr{res};
    boost::system::error_code ec;
    http::write_header(socket, sr, ec);
    if (ec) return false;

    auto result = response.body([&](const uint8_t* data, size_t size) {
        res.body().data = const_cast<uint8_t*>(data);
        res.body().size = size;
        res.body().more = true;
        http::write(socket, sr, ec);
        if (ec == http::error::need_buffer) ec = {};
        if (ec) return false;
        bytes_sent += size;
        return true;
    });

    if (!result.success) {
        if (!result.aborted) {
            log_error("stream %s: %s", std::string(req.target()).c_str(),
                      result.error_message.c_str());
        }
        // Body is short of Content-Length; the connection cannot be reused
        return false;
    }

    res.body().data = nullptr;
    res.body().more = false;
    http::write(socket, sr, ec);
    if (ec == http::error::need_buffer) ec = {};
    return !ec && result.bytes == response.content_length;
}

}  // namespace

HttpServer::HttpServer(ServerOptions options,
                       const PointerResolver& resolver,
                       const RangeDeliveryEngine& engine,
                       const StorageBackend& backend)
    : options_(std::move(options))
    , resolver_(resolver)
    , engine_(engine)
    , backend_(backend)
    , acceptor_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::start() {
    boost::system::error_code ec;
    auto address = asio::ip::make_address(options_.listen_address, ec);
    if (ec) {
        return "Invalid listen address '" + options_.listen_address + "': " + ec.message();
    }
    tcp::endpoint endpoint{address, options_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return "Failed to open listen socket: " + ec.message();
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) return "Failed to set SO_REUSEADDR: " + ec.message();
    acceptor_.bind(endpoint, ec);
    if (ec) return "Failed to bind " + options_.listen_address + ":" +
                   std::to_string(options_.port) + ": " + ec.message();
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) return "Failed to listen: " + ec.message();

    bound_port_ = acceptor_.local_endpoint(ec).port();
    running_ = true;
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);

    log_info("Listening on %s:%u", options_.listen_address.c_str(),
             static_cast<unsigned>(bound_port_));
    return {};
}

bool HttpServer::stop() {
    if (!running_.exchange(false)) return active_connections_.load() == 0;

    log_info("Shutting down server...");

    // Unblock accept()
    boost::system::error_code ec;
    ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
    if (accept_thread_.joinable()) accept_thread_.join();
    acceptor_.close(ec);

    std::map<uint64_t, Connection> connections;
    bool drained = false;
    {
        std::unique_lock lock(connections_mutex_);

        // Idle keep-alive readers see end of stream; responses being written
        // are left to finish
        for (auto& [id, conn] : connections_) {
            if (conn.fd >= 0) ::shutdown(conn.fd, SHUT_RD);
        }

        drained = connections_cv_.wait_for(lock, options_.shutdown_grace, [this] {
            return active_connections_.load() == 0;
        });
        if (!drained) {
            log_error("%zu connection(s) still active after %llds, closing them",
                      active_connections_.load(),
                      static_cast<long long>(options_.shutdown_grace.count()));
            for (auto& [id, conn] : connections_) {
                if (conn.fd >= 0) ::shutdown(conn.fd, SHUT_RDWR);
            }
        }

        connections.swap(connections_);
        finished_connections_.clear();
    }

    // A forced close fails the client write, which stops the backend read
    for (auto& [id, conn] : connections) {
        if (conn.thread.joinable()) conn.thread.join();
    }

    log_info("Server stopped");
    return drained;
}

void HttpServer::accept_loop() {
    while (running_) {
        tcp::socket socket(ioc_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            if (!running_) break;
            log_error("accept failed: %s", ec.message().c_str());
            continue;
        }

        reap_finished_connections();

        if (active_connections_.load() >= options_.max_connections) {
            reject_connection(socket);
            continue;
        }

        // Held while the thread is stored, so it cannot report itself
        // finished before its entry exists
        std::lock_guard lock(connections_mutex_);
        uint64_t id = next_connection_id_++;
        auto& conn = connections_[id];
        conn.fd = socket.native_handle();
        ++active_connections_;
        conn.thread = std::thread(&HttpServer::handle_connection, this, std::move(socket), id);
    }
}

void HttpServer::reap_finished_connections() {
    std::vector<std::thread> done;
    {
        std::lock_guard lock(connections_mutex_);
        for (uint64_t id : finished_connections_) {
            auto it = connections_.find(id);
            if (it == connections_.end()) continue;
            done.push_back(std::move(it->second.thread));
            connections_.erase(it);
        }
        finished_connections_.clear();
    }
    for (auto& thread : done) {
        if (thread.joinable()) thread.join();
    }
}

void HttpServer::reject_connection(tcp::socket& socket) {
    log_error("connection limit (%zu) reached, rejecting client", options_.max_connections);
    http::response<http::string_body> res{http::status::service_unavailable, 11};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set(http::field::retry_after, "1");
    res.keep_alive(false);
    res.body() = "Server busy";
    res.prepare_payload();

    boost::system::error_code ec;
    http::write(socket, res, ec);
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

void HttpServer::handle_connection(tcp::socket socket, uint64_t id) {
    const int fd = socket.native_handle();
    beast::flat_buffer buffer;
    boost::system::error_code ec;

    while (running_) {
        // Idle keep-alive timeout; blocking Beast reads have no deadline
        if (buffer.size() == 0) {
            struct pollfd pfd = {fd, POLLIN, 0};
            int timeout_ms = static_cast<int>(options_.idle_timeout.count() * 1000);
            if (::poll(&pfd, 1, timeout_ms) <= 0) break;
        }

        http::request_parser<http::string_body> parser;
        parser.header_limit(kMaxRequestHeaderBytes);
        parser.body_limit(kMaxRequestBodyBytes);
        http::read(socket, buffer, parser, ec);
        if (ec == http::error::end_of_stream) break;
        if (ec) {
            log_debug("read failed: %s", ec.message().c_str());
            break;
        }

        Request req = parser.release();
        auto started = std::chrono::steady_clock::now();
        uint64_t bytes_sent = 0;
        int status = 0;
        bool keep_open = true;

        Target target = split_target(req.target());
        bool is_get = req.method() == http::verb::get;
        bool is_head = req.method() == http::verb::head;

        if (!is_get && !is_head) {
            status = 405;
            net::HttpHeaders allow;
            allow.set("Allow", "GET, HEAD");
            keep_open = send_text(socket, req, http::status::method_not_allowed,
                                  "text/plain; charset=utf-8", "Method not allowed", &allow,
                                  bytes_sent);
        } else if (target.path == "/sample" || target.path == "/api/sample") {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->resolve_duration());

            auto result = resolver_.resolve(query_value(target, "id"),
                                            request_origin(req, socket));
            status = 200;
            net::HttpHeaders headers;
            headers.set("Cache-Control", "no-store");
            keep_open = send_text(socket, req, http::status::ok, "application/json",
                                  result.to_json().dump(), &headers, bytes_sent);
        } else if (target.path == "/stream" || target.path == "/api/stream") {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->stream_duration());

            StreamRequest sreq;
            sreq.key = query_value(target, "key");
            sreq.range = header_value(req, http::field::range);
            auto download = query_value(target, "download");
            sreq.download = download == "1" || download == "true";
            sreq.head_only = is_head;

            auto response = engine_.serve(sreq);
            status = response.status;
            if (response.body) {
                keep_open = send_stream(socket, req, response, bytes_sent);
            } else {
                http::response<http::string_body> res{
                    static_cast<http::status>(response.status), req.version()};
                res.set(http::field::server, "vidgate");
                for (const auto& [name, value] : response.headers.all()) {
                    res.set(name, value);
                }
                res.keep_alive(req.keep_alive());
                res.body() = response.text_body;
                if (response.text_body.empty()) {
                    // HEAD or empty object: advertise the object size
                    res.set(http::field::content_length,
                            std::to_string(response.content_length));
                } else {
                    res.prepare_payload();
                }
                keep_open = write_buffered(socket, req, res, bytes_sent);
            }
        } else if (target.path == "/healthz") {
            bool healthy = false;
            try {
                healthy = backend_.is_healthy();
            } catch (const std::exception& e) {
                log_error("health check: %s", e.what());
            }
            status = healthy ? 200 : 503;
            keep_open = send_text(socket, req,
                                  healthy ? http::status::ok : http::status::service_unavailable,
                                  "text/plain; charset=utf-8", healthy ? "ok" : "unhealthy",
                                  nullptr, bytes_sent);
        } else {
            status = 404;
            keep_open = send_text(socket, req, http::status::not_found,
                                  "text/plain; charset=utf-8", "Not found", nullptr, bytes_sent);
        }

        auto elapsed = std::chrono::steady_clock::now() - started;
        log_info("%s %s %d %llu %.1fms", std::string(req.method_string()).c_str(),
                 std::string(req.target()).c_str(), status,
                 static_cast<unsigned long long>(bytes_sent),
                 std::chrono::duration<double, std::milli>(elapsed).count());

        if (!keep_open || !req.keep_alive()) break;
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
    {
        std::lock_guard lock(connections_mutex_);
        socket.close(ec);
        auto it = connections_.find(id);
        if (it != connections_.end()) it->second.fd = -1;
        finished_connections_.push_back(id);
        --active_connections_;
    }
    connections_cv_.notify_all();
}

}  // namespace vidgate
