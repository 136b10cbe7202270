#include "server.hpp"

#include <boost/asio/ip/address.hpp>

#include <iostream>

namespace conn_header {

Server::Server(boost::asio::io_context& io, AppConfig config)
    : acceptor_(io, tcp::endpoint(boost::asio::ip::make_address(config.listener.address), config.listener.port)),
      config_(std::move(config)),
      session_options_(make_session_options(config_)),
      detector_(make_header_detector()),
      metrics_(make_metrics()),
      report_(std::make_shared<ReportRegistry>()) {
    std::cout << "[server] Listening on " << config_.listener.address << ":" << bound_port()
              << " detector=" << detector_->name() << "\n";
    std::cout << "[server] Header target host " << config_.header_target_host
              << ", buffer capacity " << config_.detect.buffer_capacity << " bytes";
    if (config_.detect.timeout.count() > 0) {
        std::cout << ", detect timeout " << config_.detect.timeout.count() << "ms";
    }
    std::cout << "\n";
    std::cout << "[server] Fallback -> " << config_.fallback.host << ":" << config_.fallback.port << "\n";
}

void Server::start() {
    do_accept();
}

uint16_t Server::bound_port() const {
    return acceptor_.local_endpoint().port();
}

void Server::do_accept() {
    acceptor_.async_accept([this](auto ec, auto socket) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (!ec) {
            std::make_shared<Session>(std::move(socket), detector_, session_options_,
                                      config_.metrics.enable ? metrics_ : nullptr,
                                      config_.metrics.enable ? report_ : nullptr)->start();
        } else {
            std::cerr << "[server] Accept error: " << ec.message() << "\n";
        }
        do_accept();
    });
}

} // namespace conn_header
