#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "portfolio_opt/portfolio_opt.hpp"
#include "portfolio_opt/service/server_config.hpp"

using namespace portfolio_opt;

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        config = ServerConfig::from_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << ServerConfig::usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << ServerConfig::usage(argv[0]);
        return 0;
    }

    try {
        JobGovernor governor(config.governor);
        HttpServer server(config.http, governor);
        server.listen();

        std::cout << "[server] " << governor.slots() << " slots, queue "
                  << config.governor.queue_capacity << ", budget "
                  << config.governor.default_budget.count() << " ms\n";

        // Signals are handled on their own io_context so the accept loop stays blocking
        boost::asio::io_context signal_ioc;
        boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec) return;
            std::cout << "[server] Received signal " << signal << ", shutting down\n";
            // Cancel running jobs first so in-flight requests complete quickly
            governor.shutdown();
            server.stop();
        });
        std::thread signal_thread([&] { signal_ioc.run(); });

        server.run();

        signal_ioc.stop();
        signal_thread.join();
        governor.shutdown();
        server.stop();
    } catch (const std::exception& e) {
        std::cerr << "[server] Fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
