#include "portfolio_opt/service/http_server.hpp"
#include "portfolio_opt/core/errors.hpp"
#include "portfolio_opt/service/json_codec.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <sys/socket.h>
#include <chrono>
#include <iostream>
#include <string_view>
#include <thread>
#include <utility>

namespace portfolio_opt {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

std::string_view target_path(const HttpServer::Request& request) {
    std::string_view target(request.target().data(), request.target().size());
    const auto query = target.find('?');
    if (query != std::string_view::npos) {
        target = target.substr(0, query);
    }
    return target;
}

bool is_read_method(http::verb method) {
    return method == http::verb::get || method == http::verb::head;
}

}  // namespace

HttpServer::HttpServer(const Config& config, JobGovernor& governor)
    : config_(config), governor_(governor) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::listen() {
    const auto address = asio::ip::make_address(config_.address);
    acceptor_.emplace(ioc_);
    const tcp::endpoint endpoint(address, config_.port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(asio::socket_base::max_listen_connections);
    acceptor_->non_blocking(true);

    bound_port_.store(acceptor_->local_endpoint().port());
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        accepting_ = true;
    }
    running_.store(true);
}

void HttpServer::run() {
    if (!acceptor_) listen();

    std::cout << "[server] Listening on " << config_.address << ":" << bound_port() << "\n";

    while (running_.load()) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_->accept(socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        if (ec) {
            if (config_.verbose) {
                std::cerr << "[server] accept failed: " << ec.message() << "\n";
            }
            continue;
        }
        socket.non_blocking(false, ec);

        bool over_limit = false;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            over_limit = static_cast<int>(connections_.size()) >= config_.max_connections;
        }
        if (over_limit) {
            Request placeholder{http::verb::get, "/", 11};
            placeholder.keep_alive(false);
            auto res = error_response(
                placeholder, http::status::service_unavailable,
                "overload", std::nullopt, "Too many open connections"
            );
            http::write(socket, res, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
            continue;
        }

        reap_connections();
        if (!spawn_connection(std::move(socket))) {
            break;
        }
    }

    beast::error_code ec;
    acceptor_->close(ec);
    std::cout << "[server] Stopped accepting connections\n";
}

void HttpServer::stop() {
    std::unordered_map<uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        running_.store(false);
        accepting_ = false;
        for (const auto& [id, fd] : connections_) {
            ::shutdown(fd, SHUT_RDWR);
        }
        threads.swap(connection_threads_);
        finished_connections_.clear();
    }
    // Joined outside the lock: finishing threads take it to release themselves
    for (auto& [id, thread] : threads) {
        if (thread.joinable()) thread.join();
    }
}

size_t HttpServer::connection_threads() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connection_threads_.size();
}

bool HttpServer::spawn_connection(tcp::socket socket) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (!accepting_) {
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return false;
    }
    // Registered under the lock stop() takes, so stop() never misses one
    const uint64_t id = next_connection_id_++;
    connections_.emplace(id, socket.native_handle());
    connection_threads_.emplace(id, std::thread([this, id, s = std::move(socket)]() mutable {
        serve(s);
        release_connection(id, s);
    }));
    return true;
}

void HttpServer::release_connection(uint64_t id, tcp::socket& socket) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    // Closed under the lock, so stop() never shuts down a reused descriptor
    beast::error_code ec;
    socket.close(ec);
    connections_.erase(id);
    finished_connections_.push_back(id);
}

void HttpServer::reap_connections() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (uint64_t id : finished_connections_) {
            const auto it = connection_threads_.find(id);
            if (it == connection_threads_.end()) continue;
            done.push_back(std::move(it->second));
            connection_threads_.erase(it);
        }
        finished_connections_.clear();
    }
    for (auto& thread : done) {
        thread.join();
    }
}

void HttpServer::serve(tcp::socket& socket) {
    beast::error_code ec;

    try {
        beast::flat_buffer buffer;
        while (running_.load()) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(config_.max_body_bytes);
            http::read(socket, buffer, parser, ec);

            if (ec == http::error::end_of_stream) break;
            if (ec == http::error::body_limit) {
                auto res = error_response(
                    parser.get(), http::status::payload_too_large,
                    "payload_too_large", std::nullopt, "Request body exceeds the size limit"
                );
                res.keep_alive(false);
                http::write(socket, res, ec);
                break;
            }
            if (ec) {
                if (config_.verbose) {
                    std::cerr << "[server] read failed: " << ec.message() << "\n";
                }
                break;
            }

            const Request request = parser.release();
            Response res = handle(request);
            const bool keep_alive = res.keep_alive() && running_.load();
            http::write(socket, res, ec);
            if (ec || !keep_alive) break;
        }
    } catch (const std::exception& e) {
        std::cerr << "[server] connection error: " << e.what() << "\n";
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

HttpServer::Response HttpServer::handle(const Request& request) {
    const auto start = std::chrono::steady_clock::now();
    const std::string_view path = target_path(request);

    Response res;
    if (path == "/optimize") {
        if (request.method() == http::verb::post) {
            res = handle_optimize(request);
        } else {
            res = error_response(request, http::status::method_not_allowed,
                                 "method_not_allowed", std::nullopt, "Use POST for /optimize");
            res.set(http::field::allow, "POST");
        }
    } else if (path == "/health") {
        if (is_read_method(request.method())) {
            res = Response{http::status::ok, request.version()};
            res.set(http::field::content_type, "text/plain");
            res.keep_alive(request.keep_alive());
            res.body() = "OK";
            res.prepare_payload();
        } else {
            res = error_response(request, http::status::method_not_allowed,
                                 "method_not_allowed", std::nullopt, "Use GET for /health");
            res.set(http::field::allow, "GET, HEAD");
        }
    } else if (path == "/stats") {
        if (is_read_method(request.method())) {
            res = json_response(request, http::status::ok, to_json(governor_.stats()).dump());
        } else {
            res = error_response(request, http::status::method_not_allowed,
                                 "method_not_allowed", std::nullopt, "Use GET for /stats");
            res.set(http::field::allow, "GET, HEAD");
        }
    } else {
        res = error_response(request, http::status::not_found,
                             "not_found", std::nullopt, "No route for " + std::string(path));
    }

    if (config_.verbose) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << "[server] " << request.method_string() << " " << path
                  << " -> " << res.result_int() << " (" << elapsed.count() << " ms)\n";
    }
    return res;
}

HttpServer::Response HttpServer::handle_optimize(const Request& request) {
    try {
        OptimizationRequest parsed = parse_request(request.body());
        auto future = governor_.submit(std::move(parsed));
        const OptimizationResult result = future.get();
        return json_response(request, http::status::ok, to_json(result).dump());
    } catch (const InvalidFilingStatus& e) {
        return error_response(request, http::status::bad_request,
                              "invalid_filing_status", e.field(), e.what());
    } catch (const ValidationError& e) {
        return error_response(request, http::status::bad_request,
                              "validation_error", e.field(), e.what());
    } catch (const OverloadError& e) {
        auto res = error_response(request, http::status::service_unavailable,
                                  "overload", std::nullopt, e.what());
        res.set(http::field::retry_after, std::to_string(config_.retry_after_seconds));
        return res;
    } catch (const InternalFault& e) {
        std::cerr << "[server] internal fault: " << e.what() << "\n";
        return error_response(request, http::status::internal_server_error,
                              "internal_fault", std::nullopt, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[server] unexpected error: " << e.what() << "\n";
        return error_response(request, http::status::internal_server_error,
                              "internal_error", std::nullopt, e.what());
    }
}

HttpServer::Response HttpServer::json_response(
    const Request& request,
    http::status status,
    const std::string& body
) const {
    Response res{status, request.version()};
    res.set(http::field::server, "portfolio_opt");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(request.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

HttpServer::Response HttpServer::error_response(
    const Request& request,
    http::status status,
    const std::string& kind,
    const std::optional<std::string>& field,
    const std::string& message
) const {
    return json_response(request, status, error_body(kind, field, message).dump());
}

}  // namespace portfolio_opt
