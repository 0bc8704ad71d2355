#pragma once

#include "lease_state.hpp"
#include <spdlog/common.h>
#include <cstdint>
#include <optional>
#include <string>

namespace pull {

struct config {
    // NATS connection
    std::string nats_address = "127.0.0.1";
    uint16_t nats_port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;

    // Deliver subject of the JetStream push consumer to pull from
    std::string deliver_subject;
    std::string queue_group;  // optional load-balancing across clients

    // Flush/extend timers of the lease loop
    lease_options lease;

    // Operational
    int stats_interval_seconds = 10;
    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse config from a YAML document. Throws on error.
config parse_config(const std::string& yaml);

// Parse a log level name. Returns nullopt if invalid.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

} // namespace pull
