#pragma once

#include "config.hpp"
#include "detector.hpp"
#include "metrics.hpp"
#include "session.hpp"

#include <memory>

#include <boost/asio.hpp>

namespace conn_header {

class Server {
public:
    Server(boost::asio::io_context& io, AppConfig config);
    void start();
    uint16_t bound_port() const;

    MetricsPtr metrics() const { return metrics_; }
    ReportRegistryPtr report_registry() const { return report_; }

private:
    void do_accept();

    using tcp = boost::asio::ip::tcp;

    tcp::acceptor acceptor_;
    AppConfig config_;
    SessionOptions session_options_;
    std::shared_ptr<const Detect<Header>> detector_;
    MetricsPtr metrics_;
    ReportRegistryPtr report_;
};

} // namespace conn_header
