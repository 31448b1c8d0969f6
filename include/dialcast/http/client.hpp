#ifndef DIALCAST_HTTP_CLIENT_HPP
#define DIALCAST_HTTP_CLIENT_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "dialcast/http/request.hpp"
#include "dialcast/http/response.hpp"

namespace dialcast::http
{

struct url
{
    std::string host;
    uint16_t port = 80;
    std::string path = "/";  // including the query string
};

// Parses http://host[:port][/path]. Throws std::invalid_argument for anything else.
url parse_url(std::string_view view);

struct client_request
{
    std::string method;
    std::string target;      // absolute http url
    header_map headers;
    std::string body;
};

// Performs outbound HTTP requests for the controller side
class transport
{
public:
    virtual ~transport() = default;

    // Throws std::runtime_error if the remote side can not be reached or the
    // response is not valid HTTP. Any status code counts as a response.
    virtual response perform(const client_request& req) = 0;
};

// One connection per request, closed by the peer after the response
class tcp_transport : public transport
{
public:

    response perform(const client_request& req) override;

};

} // namespace dialcast::http

#endif
