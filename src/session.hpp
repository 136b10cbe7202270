#pragma once

#include "byte_buffer.hpp"
#include "config.hpp"
#include "detector.hpp"
#include "header.hpp"
#include "metrics.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>

namespace conn_header {

struct SessionOptions {
    Backend fallback;
    std::string header_target_host;
    std::size_t buffer_capacity = 8192;
    std::chrono::milliseconds detect_timeout{0};
};

SessionOptions make_session_options(const AppConfig& config);

// One accepted inbound connection: detect an optional connection header, pick
// the backend it names (or the fallback), hand over the buffered bytes and
// relay in both directions.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket client_socket,
            std::shared_ptr<const Detect<Header>> detector,
            SessionOptions options,
            MetricsPtr metrics,
            ReportRegistryPtr report);

    void start();

private:
    using tcp = boost::asio::ip::tcp;
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;

    boost::asio::awaitable<void> run(std::shared_ptr<Session> self);
    boost::asio::awaitable<std::optional<Header>> detect_header(ByteBuffer& buf);
    boost::asio::awaitable<void> connect_backend(const Backend& backend);
    boost::asio::awaitable<void> relay(std::shared_ptr<Session> self,
                                       tcp::socket& from,
                                       tcp::socket& to,
                                       std::atomic<uint64_t>* counter);
    void close_sockets(const boost::system::error_code& ec);

    Strand strand_;
    tcp::socket client_socket_;
    tcp::socket backend_socket_;
    boost::asio::steady_timer detect_timer_;
    std::shared_ptr<const Detect<Header>> detector_;
    SessionOptions options_;
    MetricsPtr metrics_;
    ReportRegistryPtr report_;

    std::string remote_label_;
    std::string target_;
    std::chrono::steady_clock::time_point accepted_at_;
    bool detect_timed_out_ = false;
    std::atomic<bool> closed_{false};
};

} // namespace conn_header
