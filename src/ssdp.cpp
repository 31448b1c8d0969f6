#include "dialcast/ssdp.hpp"
#include "dialcast/utils.hpp"

#include <stdexcept>

namespace dialcast::discovery
{

static ssdp_method parse_startline(std::string_view line)
{
    if(line.substr(0, 9) == "M-SEARCH ")
        return ssdp_method::search;
    else if(line.substr(0, 7) == "NOTIFY ")
        return ssdp_method::notify;
    else if(line.substr(0, 5) == "HTTP/")
        return ssdp_method::response;

    throw std::invalid_argument {"Not a SSDP start line: " + std::string {line}};
}

ssdp_message parse_message(std::string_view view)
{
    size_t endl = view.find("\r\n");
    if(endl == std::string_view::npos)
        throw std::invalid_argument {"Truncated SSDP message"};

    ssdp_message msg {parse_startline(view.substr(0, endl)), {}};

    view.remove_prefix(endl + 2);
    while(!view.empty())
    {
        endl = view.find("\r\n");
        std::string_view line = view.substr(0, endl);
        if(line.empty())
            break;

        size_t sep = line.find(':');
        if(sep != std::string_view::npos)
            msg.headers[utils::to_upper(utils::trim(line.substr(0, sep)))] = std::string {utils::trim(line.substr(sep + 1))};

        if(endl == std::string_view::npos)
            break;
        view.remove_prefix(endl + 2);
    }

    return msg;
}

std::string render_message(ssdp_method method, const ssdp_headers& headers)
{
    std::string msg;
    switch(method)
    {
        case ssdp_method::search:
            msg = "M-SEARCH * HTTP/1.1\r\n";
            break;
        case ssdp_method::notify:
            msg = "NOTIFY * HTTP/1.1\r\n";
            break;
        case ssdp_method::response:
            msg = "HTTP/1.1 200 OK\r\n";
            break;
    }

    for(const auto& it : headers)
        (((msg += it.first) += ": ") += it.second) += "\r\n";
    msg += "\r\n";

    return msg;
}

ssdp_headers merge(ssdp_headers base, const ssdp_headers& defaults)
{
    for(const auto& it : defaults)
        base.emplace(it.first, it.second);
    return base;
}

ssdp_headers substitute_interface_address(ssdp_headers headers, const std::string& interface_address)
{
    auto location = headers.find("LOCATION");
    if(location == headers.end())
        return headers;

    const std::string placeholder {interface_address_placeholder};
    size_t pos = location->second.find(placeholder);
    if(pos != std::string::npos)
        location->second.replace(pos, placeholder.size(), interface_address);
    return headers;
}

} // namespace dialcast::discovery
