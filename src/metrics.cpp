#include "metrics.hpp"

#include <boost/asio/write.hpp>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <system_error>

namespace conn_header {

namespace {

std::string escape_label(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '"') out.push_back('\\');
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string target_labels(const std::string& target, const std::optional<uint16_t>& status) {
    std::string labels = "target=\"" + escape_label(target) + "\"";
    if (status) {
        labels += ",status_code=\"" + std::to_string(*status) + "\"";
    }
    return labels;
}

void write_help(std::ostream& os, const std::string& name, const char* type, const char* help) {
    os << "# HELP " << name << " " << help << "\n";
    os << "# TYPE " << name << " " << type << "\n";
}

} // namespace

MetricsPtr make_metrics() {
    return std::make_shared<MetricsRegistry>();
}

void LatencyHistogram::add(std::chrono::milliseconds latency) {
    const auto ms = static_cast<uint64_t>(std::max<std::chrono::milliseconds::rep>(latency.count(), 0));
    std::size_t i = 0;
    while (i < kBoundsMs.size() && ms > kBoundsMs[i]) ++i;
    ++buckets_[i];
    ++count_;
    sum_ms_ += ms;
}

void ReportRegistry::record_request(const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& tm = by_target_[target];
    ++tm.total;
    tm.last_update = Clock::now();
}

void ReportRegistry::record_response(const std::string& target,
                                     std::optional<uint16_t> status,
                                     const std::string& classification,
                                     std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& tm = by_target_[target];
    auto& sm = tm.by_status[status];
    sm.latency.add(latency);
    ++sm.by_class[classification].total;
    tm.last_update = Clock::now();
}

void ReportRegistry::retain_since(Clock::time_point since) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(since);
}

void ReportRegistry::prune(Clock::time_point since) {
    for (auto it = by_target_.begin(); it != by_target_.end();) {
        if (it->second.last_update < since) {
            it = by_target_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t ReportRegistry::target_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_target_.size();
}

Report::Report(std::string prefix, ReportRegistryPtr registry, std::chrono::seconds retain_idle)
    : prefix_(std::move(prefix)),
      registry_(std::move(registry)),
      retain_idle_(retain_idle) {}

std::string Report::render() const {
    return render(ReportRegistry::Clock::now());
}

std::string Report::render(ReportRegistry::Clock::time_point now) const {
    if (!registry_) return {};

    // A report that cannot be produced must not take the endpoint down.
    std::unique_lock<std::mutex> lock(registry_->mutex_, std::defer_lock);
    try {
        lock.lock();
    } catch (const std::system_error& ex) {
        std::cerr << "[metrics] Skipping report " << prefix_ << ": " << ex.what() << "\n";
        return {};
    }

    registry_->prune(now - retain_idle_);
    const auto& targets = registry_->by_target_;
    if (targets.empty()) return {};

    std::ostringstream os;

    const auto request_total = prefix_ + "_request_total";
    write_help(os, request_total, "counter", "Total count of inbound connections.");
    for (const auto& [target, tm] : targets) {
        os << request_total << "{" << target_labels(target, std::nullopt) << "} " << tm.total << "\n";
    }

    const auto latency = prefix_ + "_response_latency_ms";
    write_help(os, latency, "histogram",
               "Elapsed times between a connection being accepted and its stream completing");
    for (const auto& [target, tm] : targets) {
        for (const auto& [status, sm] : tm.by_status) {
            const auto labels = target_labels(target, status);
            uint64_t cumulative = 0;
            for (std::size_t i = 0; i < LatencyHistogram::kBoundsMs.size(); ++i) {
                cumulative += sm.latency.bucket(i);
                os << latency << "_bucket{" << labels << ",le=\"" << LatencyHistogram::kBoundsMs[i]
                   << "\"} " << cumulative << "\n";
            }
            cumulative += sm.latency.bucket(LatencyHistogram::kBoundsMs.size());
            os << latency << "_bucket{" << labels << ",le=\"+Inf\"} " << cumulative << "\n";
            os << latency << "_count{" << labels << "} " << sm.latency.count() << "\n";
            os << latency << "_sum{" << labels << "} " << sm.latency.sum_ms() << "\n";
        }
    }

    const auto response_total = prefix_ + "_response_total";
    write_help(os, response_total, "counter", "Total count of completed inbound connections.");
    for (const auto& [target, tm] : targets) {
        for (const auto& [status, sm] : tm.by_status) {
            for (const auto& [cls, cm] : sm.by_class) {
                os << response_total << "{" << target_labels(target, status)
                   << ",classification=\"" << escape_label(cls) << "\"} " << cm.total << "\n";
            }
        }
    }

    return os.str();
}

MetricsServer::MetricsServer(boost::asio::io_context& io, MetricsPtr metrics, uint16_t port,
                             std::shared_ptr<const Report> report)
    : acceptor_(io, tcp::endpoint(tcp::v4(), port)),
      metrics_(std::move(metrics)),
      report_(std::move(report)) {
    std::cout << "[metrics] Exposing metrics on 0.0.0.0:" << bound_port() << "\n";
}

void MetricsServer::start() {
    do_accept();
}

uint16_t MetricsServer::bound_port() const {
    return acceptor_.local_endpoint().port();
}

void MetricsServer::do_accept() {
    acceptor_.async_accept([this](auto ec, auto socket) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (!ec) {
            serve_connection(std::move(socket));
        } else {
            std::cerr << "[metrics] Accept error: " << ec.message() << "\n";
        }
        do_accept();
    });
}

void MetricsServer::serve_connection(tcp::socket socket) {
    auto socket_ptr = std::make_shared<tcp::socket>(std::move(socket));

    const auto body = render();
    std::ostringstream oss;
    oss << "HTTP/1.1 200 OK\r\n"
        << "Content-Type: text/plain; version=0.0.4\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    auto buffer = std::make_shared<std::string>(oss.str());
    boost::asio::async_write(
        *socket_ptr,
        boost::asio::buffer(*buffer),
        [buffer, socket_ptr](auto, auto) {
            boost::system::error_code ignored;
            socket_ptr->shutdown(tcp::socket::shutdown_both, ignored);
            socket_ptr->close(ignored);
        });
}

std::string MetricsServer::render() const {
    std::ostringstream os;
    os << "conn_header_total_connections " << metrics_->total_connections.load() << "\n";
    os << "conn_header_active_sessions " << metrics_->active_sessions.load() << "\n";
    os << "conn_header_bytes_upstream " << metrics_->bytes_upstream.load() << "\n";
    os << "conn_header_bytes_downstream " << metrics_->bytes_downstream.load() << "\n";
    os << "conn_header_headers_detected " << metrics_->headers_detected.load() << "\n";
    os << "conn_header_headers_absent " << metrics_->headers_absent.load() << "\n";
    os << "conn_header_detect_failures " << metrics_->detect_failures.load() << "\n";
    if (report_) {
        os << report_->render();
    }
    return os.str();
}

} // namespace conn_header
