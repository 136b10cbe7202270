#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace conn_header {

struct Backend {
    std::string host;
    uint16_t port = 0;
};

struct Listener {
    std::string address = "0.0.0.0";
    uint16_t port = 4143;
};

struct DetectSettings {
    static constexpr std::size_t kMinBufferCapacity = 64;
    static constexpr std::size_t kMaxBufferCapacity = 1024 * 1024;

    // Initial buffer size per connection; also bounds the header frame length.
    std::size_t buffer_capacity = 8192;
    // Zero disables the detection timer.
    std::chrono::milliseconds timeout{10000};
};

struct AppConfig {
    Listener listener;
    // Where connections without a header are sent.
    Backend fallback{"127.0.0.1", 8080};
    // Host paired with the port carried in a connection header.
    std::string header_target_host = "127.0.0.1";
    DetectSettings detect;
    struct Metrics {
        bool enable = false;
        uint16_t port = 0; // 0 means disabled
        std::string prefix = "inbound";
        std::chrono::seconds retain_idle{600};
    } metrics;
};

// Load configuration from JSON, or return defaults when the file is missing/invalid.
AppConfig load_config(const std::string& config_path, std::ostream& log);

AppConfig make_default_config();

} // namespace conn_header
