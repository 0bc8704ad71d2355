#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <stdexcept>
#include <string>

namespace pull {

namespace {

// Keeps steady_clock deadlines far from overflow.
constexpr std::chrono::milliseconds max_lease_duration = std::chrono::hours(24);

std::chrono::milliseconds read_duration_ms(const YAML::Node& node, const char* key) {
    auto ms = node.as<int64_t>();
    if (ms <= 0) {
        throw std::runtime_error(std::string("config: 'lease.") + key + "' must be positive");
    }
    if (ms > max_lease_duration.count()) {
        throw std::runtime_error(std::string("config: 'lease.") + key + "' must not exceed "
                                 + std::to_string(max_lease_duration.count()) + "ms");
    }
    return std::chrono::milliseconds(ms);
}

config from_node(const YAML::Node& root) {
    config cfg;

    // NATS connection
    if (auto n = root["nats_address"]) cfg.nats_address = n.as<std::string>();
    if (auto n = root["nats_port"])    cfg.nats_port = n.as<uint16_t>();
    if (auto n = root["tls_cert"])     cfg.tls_cert = n.as<std::string>();
    if (auto n = root["tls_key"])      cfg.tls_key  = n.as<std::string>();
    if (auto n = root["tls_ca"])       cfg.tls_ca   = n.as<std::string>();

    // Input
    if (auto n = root["deliver_subject"]) {
        cfg.deliver_subject = n.as<std::string>();
    } else {
        throw std::runtime_error("config: 'deliver_subject' is required");
    }
    if (cfg.deliver_subject.empty()) {
        throw std::runtime_error("config: 'deliver_subject' must not be empty");
    }

    if (auto n = root["queue_group"]) cfg.queue_group = n.as<std::string>();

    // Lease timers
    if (auto lease = root["lease"]) {
        if (!lease.IsMap()) throw std::runtime_error("config: 'lease' must be a map");
        if (auto n = lease["flush_period_ms"])  cfg.lease.flush_period  = read_duration_ms(n, "flush_period_ms");
        if (auto n = lease["flush_start_ms"])   cfg.lease.flush_start   = read_duration_ms(n, "flush_start_ms");
        if (auto n = lease["extend_period_ms"]) cfg.lease.extend_period = read_duration_ms(n, "extend_period_ms");
        if (auto n = lease["extend_start_ms"])  cfg.lease.extend_start  = read_duration_ms(n, "extend_start_ms");
    }

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }

    if (auto n = root["log_level"]) {
        cfg.log_level = n.as<std::string>();
        if (!parse_log_level(cfg.log_level)) {
            throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
        }
    }

    return cfg;
}

} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "debug")                 return spdlog::level::debug;
    if (s == "info")                  return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error")                 return spdlog::level::err;
    return std::nullopt;
}

config load_config(const std::string& path) {
    return from_node(YAML::LoadFile(path));
}

config parse_config(const std::string& yaml) {
    return from_node(YAML::Load(yaml));
}

} // namespace pull
