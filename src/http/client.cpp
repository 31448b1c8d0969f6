#include "dialcast/http/client.hpp"
#include "dialcast/log.hpp"
#include "dialcast/utils.hpp"

#include <array>
#include <charconv>
#include <stdexcept>

#include <fmt/format.h>
#include <socketwrapper.hpp>

namespace dialcast::http
{

url parse_url(std::string_view view)
{
    const std::string_view scheme {"http://"};
    if(view.size() <= scheme.size() || !utils::iequals(view.substr(0, scheme.size()), scheme))
        throw std::invalid_argument {"Not an http url: " + std::string {view}};
    view.remove_prefix(scheme.size());

    url parsed;
    size_t slash = view.find('/');
    std::string_view authority = view.substr(0, slash);
    parsed.path = (slash == std::string_view::npos) ? "/" : std::string {view.substr(slash)};

    size_t colon = authority.rfind(':');
    if(colon != std::string_view::npos)
    {
        std::string_view port_view = authority.substr(colon + 1);
        uint16_t port = 0;
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size())
            throw std::invalid_argument {"Invalid port in url: " + std::string {port_view}};
        parsed.port = port;
        authority = authority.substr(0, colon);
    }

    if(authority.empty())
        throw std::invalid_argument {"Missing host in url"};
    parsed.host = std::string {authority};

    return parsed;
}

static bool response_complete(const std::string& raw)
{
    size_t head_end = raw.find("\r\n\r\n");
    if(head_end == std::string::npos)
        return false;

    response head;
    head.parse(std::string_view {raw}.substr(0, head_end + 4));
    if(!head.check_header("Content-Length"))
        return false;

    const std::string hdr = head.get_header("Content-Length");
    size_t length = 0;
    auto res = std::from_chars(hdr.data(), hdr.data() + hdr.size(), length);
    if(res.ec != std::errc {})
        return false;

    return raw.size() >= head_end + 4 + length;
}

response tcp_transport::perform(const client_request& req)
{
    url target;
    try {
        target = parse_url(req.target);
    } catch(const std::invalid_argument& e) {
        throw std::runtime_error {e.what()};
    }

    std::string req_str = fmt::format("{} {} HTTP/1.1\r\nHOST: {}:{}\r\nCONNECTION: close\r\n",
        req.method, target.path, target.host, target.port);
    for(const auto& it : req.headers)
        req_str += fmt::format("{}: {}\r\n", it.first, it.second);
    req_str += "\r\n";
    req_str += req.body;

    net::tcp_connection<net::ip_version::v4> conn {utils::resolve_ipv4(target.host), target.port};
    conn.send(net::span {req_str});

    // Receive until the peer closes the connection or the announced body is complete
    std::array<char, 4096> buffer;
    std::string raw;
    while(true)
    {
        size_t br = conn.read(net::span {buffer});
        if(br == 0)
            break;
        raw.append(buffer.data(), br);

        try {
            if(response_complete(raw))
                break;
        } catch(const std::invalid_argument&) {
            throw std::runtime_error {"Malformed response from " + req.target};
        }
    }

    response res;
    try {
        res.parse(raw);
    } catch(const std::invalid_argument&) {
        throw std::runtime_error {"Malformed response from " + req.target};
    }

    log::debug("{} {} -> {}", req.method, req.target, res.get_code());
    return res;
}

} // namespace dialcast::http
