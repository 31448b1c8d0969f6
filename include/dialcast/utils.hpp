#ifndef DIALCAST_UTILS_HPP
#define DIALCAST_UTILS_HPP

#include <string>
#include <string_view>

namespace dialcast::utils
{

// First address of an interface that is up and not a loopback device
std::string get_local_ipaddr();

std::string get_hostname();

// Resolves a host name to a numeric IPv4 address. Numeric input is returned unchanged.
std::string resolve_ipv4(const std::string& host);

// Random RFC 4122 version 4 uuid
std::string generate_uuid();

// Value of the SERVER header, e.g. "Linux/6.1.0 UPnP/1.1 dialcast/0.1.0"
std::string server_string();

std::string to_upper(std::string_view view);

bool iequals(std::string_view lhs, std::string_view rhs);

std::string_view trim(std::string_view view);

std::string url_decode(std::string_view view);

} // namespace dialcast::utils

#endif
