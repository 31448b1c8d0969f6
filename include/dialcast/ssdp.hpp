#ifndef DIALCAST_SSDP_HPP
#define DIALCAST_SSDP_HPP

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#define DIALCAST_SSDP_IP "239.255.255.250"
#define DIALCAST_SSDP_PORT 1900

namespace dialcast::discovery
{

// Header names are kept upper case, e.g. "LOCATION" or "CONFIGID.UPNP.ORG"
using ssdp_headers = std::map<std::string, std::string>;

// Replaced by the transport with the address of the sending interface
constexpr const char* interface_address_placeholder = "{{networkInterfaceAddress}}";

constexpr const char* nts_alive = "ssdp:alive";
constexpr const char* nts_byebye = "ssdp:byebye";

struct ssdp_address
{
    std::string addr;
    uint16_t port = 0;
};

enum class ssdp_method
{
    search,     // M-SEARCH * HTTP/1.1
    notify,     // NOTIFY * HTTP/1.1
    response    // HTTP/1.1 200 OK, answer to a search
};

struct ssdp_message
{
    ssdp_method method;
    ssdp_headers headers;
};

// Throws std::invalid_argument if the datagram is no SSDP message
ssdp_message parse_message(std::string_view view);

std::string render_message(ssdp_method method, const ssdp_headers& headers);

// Returns base with every key of defaults added that base does not contain yet.
// Values already present in base are never replaced.
ssdp_headers merge(ssdp_headers base, const ssdp_headers& defaults);

// Replaces the interface address placeholder in LOCATION, other headers are left alone
ssdp_headers substitute_interface_address(ssdp_headers headers, const std::string& interface_address);

} // namespace dialcast::discovery

#endif
