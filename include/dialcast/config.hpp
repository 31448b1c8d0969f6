#ifndef DIALCAST_CONFIG_HPP
#define DIALCAST_CONFIG_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dialcast/app_registry.hpp"
#include "dialcast/dial_server.hpp"
#include "dialcast/log.hpp"
#include "dialcast/udp_ssdp_peer.hpp"

namespace dialcast
{

struct receiver_config
{
    server_options server;
    discovery::udp_peer_options peer;
    log::level log_level = log::level::info;
    std::vector<registered_app> apps;
};

// Throws std::invalid_argument or nlohmann::json::exception on invalid values
receiver_config parse_receiver_config(const nlohmann::json& config);

receiver_config load_receiver_config(const std::string& path);

// Number or numeric string, never below min_content_length
size_t parse_max_content_length(const nlohmann::json& value);

// Keeps string, number and boolean values; names are upper cased like all SSDP headers
discovery::ssdp_headers parse_extra_headers(const nlohmann::json& value);

} // namespace dialcast

#endif
