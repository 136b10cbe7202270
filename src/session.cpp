#include "session.hpp"

#include "transport.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <iostream>

namespace conn_header {

namespace {

using boost::asio::ip::tcp;
using boost::asio::use_awaitable;

// Stops the detection timer however detection ends.
struct TimerGuard {
    boost::asio::steady_timer& timer;
    ~TimerGuard() { timer.cancel(); }
};

std::string endpoint_label(const tcp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

SessionOptions make_session_options(const AppConfig& config) {
    SessionOptions options;
    options.fallback = config.fallback;
    options.header_target_host = config.header_target_host;
    options.buffer_capacity = config.detect.buffer_capacity;
    options.detect_timeout = config.detect.timeout;
    return options;
}

Session::Session(tcp::socket client_socket,
                 std::shared_ptr<const Detect<Header>> detector,
                 SessionOptions options,
                 MetricsPtr metrics,
                 ReportRegistryPtr report)
    : strand_(boost::asio::make_strand(client_socket.get_executor())),
      client_socket_(std::move(client_socket)),
      backend_socket_(client_socket_.get_executor()),
      detect_timer_(strand_),
      detector_(std::move(detector)),
      options_(std::move(options)),
      metrics_(std::move(metrics)),
      report_(std::move(report)),
      accepted_at_(std::chrono::steady_clock::now()) {
    boost::system::error_code ec;
    auto remote = client_socket_.remote_endpoint(ec);
    if (!ec) {
        remote_label_ = endpoint_label(remote);
    }

    if (metrics_) {
        metrics_->total_connections.fetch_add(1, std::memory_order_relaxed);
        metrics_->active_sessions.fetch_add(1, std::memory_order_relaxed);
    }
}

void Session::start() {
    boost::asio::co_spawn(strand_, run(shared_from_this()), boost::asio::detached);
}

boost::asio::awaitable<void> Session::run(std::shared_ptr<Session> self) {
    ByteBuffer buf(options_.buffer_capacity);

    std::optional<Header> header;
    try {
        header = co_await detect_header(buf);
    } catch (const boost::system::system_error& ex) {
        if (metrics_) {
            metrics_->detect_failures.fetch_add(1, std::memory_order_relaxed);
        }
        if (detect_timed_out_) {
            std::cerr << "[session] Detection timed out for " << remote_label_ << "\n";
        } else {
            std::cerr << "[session] Rejecting " << remote_label_ << ": " << ex.code().message() << "\n";
        }
        close_sockets(ex.code());
        co_return;
    }

    Backend backend;
    if (header) {
        backend = Backend{options_.header_target_host, header->port()};
        target_ = (header->name() ? header->name()->str() : backend.host) + ":" + std::to_string(header->port());
        if (metrics_) {
            metrics_->headers_detected.fetch_add(1, std::memory_order_relaxed);
        }
        std::cout << "[session] Connection header from " << remote_label_ << ": " << *header << "\n";
    } else {
        backend = options_.fallback;
        target_ = "fallback";
        if (metrics_) {
            metrics_->headers_absent.fetch_add(1, std::memory_order_relaxed);
        }
    }
    if (report_) {
        report_->record_request(target_);
    }

    std::cout << "[session] New connection " << remote_label_
              << " -> " << backend.host << ":" << backend.port << " (" << target_ << ")\n";

    try {
        co_await connect_backend(backend);
        if (!buf.empty()) {
            co_await boost::asio::async_write(backend_socket_,
                                              boost::asio::buffer(buf.data(), buf.size()),
                                              use_awaitable);
            buf.clear();
        }
    } catch (const boost::system::system_error& ex) {
        std::cerr << "[session] Connect error to " << backend.host << ":" << backend.port
                  << " - " << ex.code().message() << "\n";
        close_sockets(ex.code());
        co_return;
    }

    boost::asio::co_spawn(strand_,
                          relay(self, client_socket_, backend_socket_,
                                metrics_ ? &metrics_->bytes_upstream : nullptr),
                          boost::asio::detached);
    co_await relay(self, backend_socket_, client_socket_,
                   metrics_ ? &metrics_->bytes_downstream : nullptr);
}

boost::asio::awaitable<std::optional<Header>> Session::detect_header(ByteBuffer& buf) {
    StreamTransport<tcp::socket> socket_io(client_socket_);
    std::optional<CountingTransport> counting;
    Transport* io = &socket_io;
    if (metrics_) {
        io = &counting.emplace(socket_io, metrics_->bytes_upstream);
    }

    TimerGuard guard{detect_timer_};
    if (options_.detect_timeout.count() > 0) {
        detect_timer_.expires_after(options_.detect_timeout);
        detect_timer_.async_wait(
            boost::asio::bind_executor(strand_, [self = shared_from_this()](const boost::system::error_code& ec) {
                if (ec) return;
                self->detect_timed_out_ = true;
                boost::system::error_code ignored;
                self->client_socket_.cancel(ignored);
            }));
    }

    co_return co_await detector_->detect(*io, buf);
}

boost::asio::awaitable<void> Session::connect_backend(const Backend& backend) {
    tcp::resolver resolver(strand_);
    auto endpoints = co_await resolver.async_resolve(backend.host, std::to_string(backend.port), use_awaitable);
    co_await boost::asio::async_connect(backend_socket_, endpoints, use_awaitable);
}

boost::asio::awaitable<void> Session::relay(std::shared_ptr<Session> self,
                                            tcp::socket& from,
                                            tcp::socket& to,
                                            std::atomic<uint64_t>* counter) {
    std::array<char, 4096> data{};
    boost::system::error_code ec;
    while (!ec) {
        const auto n = co_await from.async_read_some(boost::asio::buffer(data),
                                                     boost::asio::redirect_error(use_awaitable, ec));
        if (ec) break;
        if (counter) {
            counter->fetch_add(n, std::memory_order_relaxed);
        }
        co_await boost::asio::async_write(to, boost::asio::buffer(data.data(), n),
                                          boost::asio::redirect_error(use_awaitable, ec));
    }
    self->close_sockets(ec);
}

void Session::close_sockets(const boost::system::error_code& ec) {
    if (closed_.exchange(true)) return;
    const bool clean = !ec || ec == boost::asio::error::eof;
    if (!clean) {
        std::cerr << "[session] Closing session " << remote_label_ << ": " << ec.message() << "\n";
    }

    if (report_ && !target_.empty()) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - accepted_at_);
        report_->record_response(target_, std::nullopt, clean ? "success" : "failure", elapsed);
    }

    boost::system::error_code ignored;
    if (client_socket_.is_open()) {
        client_socket_.shutdown(tcp::socket::shutdown_both, ignored);
        client_socket_.close(ignored);
    }
    if (backend_socket_.is_open()) {
        backend_socket_.shutdown(tcp::socket::shutdown_both, ignored);
        backend_socket_.close(ignored);
    }

    if (metrics_) {
        metrics_->active_sessions.fetch_sub(1, std::memory_order_relaxed);
    }
}

} // namespace conn_header
