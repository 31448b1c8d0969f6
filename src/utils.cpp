#include "dialcast/utils.hpp"

#include <array>
#include <cctype>
#include <random>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <sys/utsname.h>
#include <netdb.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <fmt/format.h>

#ifndef DIALCAST_VERSION
#define DIALCAST_VERSION "0.1.0"
#endif

namespace dialcast::utils
{

static constexpr const char* error_msg = "Unable to get local ip address";

std::string get_local_ipaddr()
{
    ifaddrs* addrs;
    if(getifaddrs(&addrs))
        throw std::runtime_error {error_msg};

    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr)
            continue;

        // SSDP runs over IPv4 multicast, so only IPv4 addresses are usable in LOCATION
        if(curr_addr->ifa_addr->sa_family != AF_INET)
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in),
            host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s != 0)
        {
            freeifaddrs(addrs);
            throw std::runtime_error {error_msg};
        }

        if((curr_addr->ifa_flags & IFF_UP) && !(curr_addr->ifa_flags & IFF_LOOPBACK))
        {
            std::string result {host.data()};
            freeifaddrs(addrs);
            return result;
        }
    }

    freeifaddrs(addrs);
    throw std::runtime_error {error_msg};
}

std::string get_hostname()
{
    std::array<char, 256> name {};
    if(gethostname(name.data(), name.size() - 1) != 0)
        return {};
    return name.data();
}

std::string resolve_ipv4(const std::string& host)
{
    in_addr numeric;
    if(inet_pton(AF_INET, host.c_str(), &numeric) == 1)
        return host;

    addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    if(getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr)
        throw std::runtime_error {"Unable to resolve host " + host};

    std::array<char, INET_ADDRSTRLEN> buffer;
    const auto* addr = reinterpret_cast<const sockaddr_in*>(result->ai_addr);
    const char* ok = inet_ntop(AF_INET, &addr->sin_addr, buffer.data(), buffer.size());
    freeaddrinfo(result);
    if(ok == nullptr)
        throw std::runtime_error {"Unable to resolve host " + host};

    return buffer.data();
}

std::string generate_uuid()
{
    std::random_device rd;
    std::mt19937_64 gen {rd()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t hi = dist(gen);
    uint64_t lo = dist(gen);

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 10xx

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(hi >> 32),
        static_cast<uint16_t>(hi >> 16),
        static_cast<uint16_t>(hi),
        static_cast<uint16_t>(lo >> 48),
        lo & 0xFFFFFFFFFFFFULL);
}

std::string server_string()
{
    utsname info;
    if(uname(&info) != 0)
        return fmt::format("unknown/0 UPnP/1.1 dialcast/{}", DIALCAST_VERSION);

    return fmt::format("{}/{} UPnP/1.1 dialcast/{}", info.sysname, info.release, DIALCAST_VERSION);
}

std::string to_upper(std::string_view view)
{
    std::string result {view};
    for(auto& c : result)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return result;
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    if(lhs.size() != rhs.size())
        return false;

    for(size_t i = 0; i < lhs.size(); ++i)
    {
        if(std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
            return false;
    }
    return true;
}

std::string_view trim(std::string_view view)
{
    const char* ws = " \t\r\n";
    size_t start = view.find_first_not_of(ws);
    if(start == std::string_view::npos)
        return {};
    size_t end = view.find_last_not_of(ws);
    return view.substr(start, end - start + 1);
}

static int hex_value(char c)
{
    if(c >= '0' && c <= '9')
        return c - '0';
    if(c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if(c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view view)
{
    std::string result;
    result.reserve(view.size());
    for(size_t i = 0; i < view.size(); ++i)
    {
        if(view[i] == '%' && i + 2 < view.size())
        {
            int hi = hex_value(view[i + 1]);
            int lo = hex_value(view[i + 2]);
            if(hi >= 0 && lo >= 0)
            {
                result.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        result.push_back(view[i]);
    }
    return result;
}

} // namespace dialcast::utils
