#pragma once

#include "governor.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace portfolio_opt {

/**
 * Blocking HTTP/1.1 front end for the job governor.
 *
 * Routes:
 *   POST /optimize  JSON request in, JSON result out
 *   GET  /health    "OK", no optimization work
 *   GET  /stats     governor counters
 *
 * The accept loop polls a non-blocking acceptor so stop() is observed
 * within one poll interval. Each connection is served on its own thread,
 * owned by the server and joined by stop() or by the accept loop once the
 * connection has closed. Concurrency of the actual optimization is bounded
 * by the governor, not by the number of connections.
 */
class HttpServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    struct Config {
        std::string address{"0.0.0.0"};
        uint16_t port{8080};                // 0 picks an ephemeral port
        int max_connections{256};           // Open connections before 503
        size_t max_body_bytes{1 << 20};
        int retry_after_seconds{1};         // Retry-After on overload
        bool verbose{false};
    };

    HttpServer(const Config& config, JobGovernor& governor);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen. Throws boost::system::system_error on failure.
    void listen();

    // Accept connections until stop(). Calls listen() if needed.
    void run();

    // Stop accepting, unblock open connections and join their threads.
    // Safe to call from another thread; idempotent.
    void stop();

    // Connection threads not yet joined, including ones that finished
    // serving but have not been reaped by the accept loop.
    [[nodiscard]] size_t connection_threads() const;

    [[nodiscard]] uint16_t bound_port() const { return bound_port_.load(); }
    [[nodiscard]] bool running() const { return running_.load(); }

    // Route one request. Never throws for request-level failures; they map
    // to 4xx/5xx responses with a JSON error body.
    [[nodiscard]] Response handle(const Request& request);

private:
    Config config_;
    JobGovernor& governor_;

    boost::asio::io_context ioc_;
    std::optional<boost::asio::ip::tcp::acceptor> acceptor_;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};

    // Open connection sockets by id, so stop() can unblock their reads,
    // and the threads serving them
    mutable std::mutex connections_mutex_;
    std::unordered_map<uint64_t, int> connections_;
    std::unordered_map<uint64_t, std::thread> connection_threads_;
    std::vector<uint64_t> finished_connections_;
    uint64_t next_connection_id_{0};
    bool accepting_{true};

    void serve(boost::asio::ip::tcp::socket& socket);
    [[nodiscard]] bool spawn_connection(boost::asio::ip::tcp::socket socket);
    void release_connection(uint64_t id, boost::asio::ip::tcp::socket& socket);
    void reap_connections();

    [[nodiscard]] Response handle_optimize(const Request& request);
    [[nodiscard]] Response json_response(
        const Request& request,
        boost::beast::http::status status,
        const std::string& body
    ) const;
    [[nodiscard]] Response error_response(
        const Request& request,
        boost::beast::http::status status,
        const std::string& kind,
        const std::optional<std::string>& field,
        const std::string& message
    ) const;
};

}  // namespace portfolio_opt
