/**
 * @file transport_config.h
 * @brief Transport tuning parameters
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace swarmnet {
namespace utils {
class Config;
}

namespace network {

/**
 * @brief Transport configuration, read from the "network" section
 */
struct TransportConfig {
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds discovery_interval{60000};
    std::chrono::milliseconds connect_timeout{2000};
    uint32_t message_ttl_seconds = 300;
    bool enforce_ttl = false;           ///< Drop expired messages instead of delivering them
    size_t seen_cache_size = 4096;      ///< Message ids remembered for duplicate suppression
    std::string listen_address = "0.0.0.0";

    static TransportConfig fromConfig(const utils::Config& config);
};

} // namespace network
} // namespace swarmnet
