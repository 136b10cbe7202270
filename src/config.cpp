#include "config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <fstream>

namespace pt = boost::property_tree;

namespace conn_header {

namespace {

Backend parse_backend(const pt::ptree& node, const Backend& fallback) {
    Backend backend = fallback;
    backend.host = node.get<std::string>("host", backend.host);
    backend.port = node.get<uint16_t>("port", backend.port);
    return backend;
}

std::size_t clamp_capacity(std::size_t v) {
    return std::max(DetectSettings::kMinBufferCapacity,
                    std::min(v, DetectSettings::kMaxBufferCapacity));
}

} // namespace

AppConfig make_default_config() {
    return AppConfig{};
}

AppConfig load_config(const std::string& config_path, std::ostream& log) {
    if (config_path.empty()) {
        log << "[config] No config path provided. Using defaults.\n";
        return make_default_config();
    }

    std::ifstream in(config_path);
    if (!in) {
        log << "[config] Cannot open config file at " << config_path << ". Using defaults.\n";
        return make_default_config();
    }

    pt::ptree tree;
    try {
        pt::read_json(in, tree);
    } catch (const pt::ptree_error& ex) {
        log << "[config] Failed to parse JSON: " << ex.what() << ". Using defaults.\n";
        return make_default_config();
    }

    AppConfig config = make_default_config();
    try {
        config.listener.address = tree.get<std::string>("listen.address", config.listener.address);
        config.listener.port = tree.get<uint16_t>("listen.port", config.listener.port);
        config.header_target_host = tree.get<std::string>("header_target_host", config.header_target_host);

        config.detect.buffer_capacity =
            clamp_capacity(tree.get<std::size_t>("detect.buffer_capacity", config.detect.buffer_capacity));
        config.detect.timeout = std::chrono::milliseconds(
            tree.get<long long>("detect.timeout_ms", config.detect.timeout.count()));
        if (config.detect.timeout.count() < 0) {
            log << "[config] Negative detect.timeout_ms, disabling the detection timer.\n";
            config.detect.timeout = std::chrono::milliseconds::zero();
        }

        config.metrics.enable = tree.get<bool>("metrics.enable", config.metrics.enable);
        config.metrics.port = tree.get<uint16_t>("metrics.port", config.metrics.port);
        config.metrics.prefix = tree.get<std::string>("metrics.prefix", config.metrics.prefix);
        const auto retain_idle_secs =
            tree.get<long long>("metrics.retain_idle_secs", config.metrics.retain_idle.count());
        if (retain_idle_secs < 0) {
            log << "[config] Negative metrics.retain_idle_secs, keeping " << config.metrics.retain_idle.count()
                << "s.\n";
        } else {
            config.metrics.retain_idle = std::chrono::seconds(retain_idle_secs);
        }

        if (auto fallback_node = tree.get_child_optional("fallback")) {
            auto fallback = parse_backend(*fallback_node, config.fallback);
            if (fallback.port == 0) {
                log << "[config] Ignore fallback '" << fallback.host << "' due to invalid port.\n";
            } else {
                config.fallback = std::move(fallback);
            }
        }
    } catch (const pt::ptree_error& ex) {
        log << "[config] Invalid value: " << ex.what() << ". Using defaults.\n";
        return make_default_config();
    }

    return config;
}

} // namespace conn_header
