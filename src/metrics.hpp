#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include <boost/asio.hpp>

namespace conn_header {

struct MetricsRegistry {
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> active_sessions{0};
    std::atomic<uint64_t> bytes_upstream{0};
    std::atomic<uint64_t> bytes_downstream{0};
    std::atomic<uint64_t> headers_detected{0};
    std::atomic<uint64_t> headers_absent{0};
    std::atomic<uint64_t> detect_failures{0};
};

using MetricsPtr = std::shared_ptr<MetricsRegistry>;

MetricsPtr make_metrics();

// Cumulative latency histogram with millisecond buckets.
class LatencyHistogram {
public:
    static constexpr std::array<uint64_t, 25> kBoundsMs = {
        1, 2, 3, 4, 5, 10, 20, 30, 40, 50, 100, 200, 300, 400, 500,
        1000, 2000, 3000, 4000, 5000, 10000, 20000, 30000, 40000, 50000};

    void add(std::chrono::milliseconds latency);

    uint64_t count() const noexcept { return count_; }
    uint64_t sum_ms() const noexcept { return sum_ms_; }
    // Number of samples in bucket `i`; index kBoundsMs.size() is +Inf.
    uint64_t bucket(std::size_t i) const { return buckets_.at(i); }

private:
    std::array<uint64_t, kBoundsMs.size() + 1> buckets_{};
    uint64_t count_ = 0;
    uint64_t sum_ms_ = 0;
};

// Per-target connection metrics, broken down by status and classification.
// Status is optional: plain TCP connections carry none.
class ReportRegistry {
public:
    using Clock = std::chrono::steady_clock;

    void record_request(const std::string& target);
    void record_response(const std::string& target,
                         std::optional<uint16_t> status,
                         const std::string& classification,
                         std::chrono::milliseconds latency);

    // Drops targets with no activity since `since`.
    void retain_since(Clock::time_point since);

    std::size_t target_count() const;

private:
    friend class Report;

    struct ClassMetrics {
        uint64_t total = 0;
    };
    struct StatusMetrics {
        LatencyHistogram latency;
        std::map<std::string, ClassMetrics> by_class;
    };
    struct TargetMetrics {
        uint64_t total = 0;
        std::map<std::optional<uint16_t>, StatusMetrics> by_status;
        Clock::time_point last_update;
    };

    // Caller holds mutex_.
    void prune(Clock::time_point since);

    mutable std::mutex mutex_;
    std::map<std::string, TargetMetrics> by_target_;
};

using ReportRegistryPtr = std::shared_ptr<ReportRegistry>;

// Renders a ReportRegistry in Prometheus text format, pruning idle targets.
class Report {
public:
    Report(std::string prefix, ReportRegistryPtr registry, std::chrono::seconds retain_idle);

    std::string render() const;
    std::string render(ReportRegistry::Clock::time_point now) const;

private:
    std::string prefix_;
    ReportRegistryPtr registry_;
    std::chrono::seconds retain_idle_;
};

class MetricsServer {
public:
    MetricsServer(boost::asio::io_context& io, MetricsPtr metrics, uint16_t port,
                  std::shared_ptr<const Report> report = nullptr);
    void start();
    uint16_t bound_port() const;

    std::string render() const;

private:
    using tcp = boost::asio::ip::tcp;
    void do_accept();
    void serve_connection(tcp::socket socket);

    tcp::acceptor acceptor_;
    MetricsPtr metrics_;
    std::shared_ptr<const Report> report_;
};

} // namespace conn_header
