#include "config.hpp"
#include "metrics.hpp"
#include "server.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace conn_header;

int main(int argc, char* argv[]) {
    try {
        std::string config_path;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [-c|--config path]\n";
                return 0;
            } else {
                std::cerr << "[fatal] unknown argument: " << arg << "\n";
                return 1;
            }
        }

        auto config = load_config(config_path, std::cerr);

        boost::asio::io_context io;
        Server server(io, config);
        server.start();

        std::unique_ptr<MetricsServer> metrics_server;
        if (config.metrics.enable && config.metrics.port != 0) {
            auto report = std::make_shared<const Report>(config.metrics.prefix,
                                                         server.report_registry(),
                                                         config.metrics.retain_idle);
            metrics_server = std::make_unique<MetricsServer>(io, server.metrics(), config.metrics.port, report);
            metrics_server->start();
        }

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            std::cout << "[server] Signal " << signo << " received, shutting down\n";
            io.stop();
        });

        const auto workers = std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (unsigned int i = 0; i < workers; ++i) {
            threads.emplace_back([&io]() { io.run(); });
        }

        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
