#ifndef DIALCAST_HTTP_ROUTER_HPP
#define DIALCAST_HTTP_ROUTER_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "dialcast/http/request.hpp"
#include "dialcast/http/response.hpp"

namespace dialcast::http
{

// Values of the ":name" segments of a matched route pattern
using route_params = std::map<std::string, std::string>;

using handler = std::function<response(const request&, const route_params&)>;

class router
{
public:

    router() = default;
    router(const router&) = delete;
    router& operator=(const router&) = delete;
    router(router&&) = default;
    router& operator=(router&&) = default;
    ~router() = default;

    // Patterns are absolute paths whose segments are either literal or ":name"
    void add(std::string method, std::string_view pattern, handler fn);

    void get(std::string_view pattern, handler fn)
    {
        add("GET", pattern, std::move(fn));
    }

    void post(std::string_view pattern, handler fn)
    {
        add("POST", pattern, std::move(fn));
    }

    void del(std::string_view pattern, handler fn)
    {
        add("DELETE", pattern, std::move(fn));
    }

    // Routes are tried in registration order. Unmatched requests get 404,
    // exceptions escaping a handler get 500.
    response dispatch(const request& req) const;

private:

    struct route
    {
        std::string method;
        std::vector<std::string> segments;
        handler fn;
    };

    static std::vector<std::string> split_path(std::string_view path);

    static bool match(const route& r, const std::vector<std::string>& segments, route_params& params);

    std::vector<route> m_routes;

};

} // namespace dialcast::http

#endif
