#include "dialcast/http/router.hpp"
#include "dialcast/log.hpp"
#include "dialcast/utils.hpp"

#include <exception>

namespace dialcast::http
{

void router::add(std::string method, std::string_view pattern, handler fn)
{
    m_routes.push_back(route {std::move(method), split_path(pattern), std::move(fn)});
}

std::vector<std::string> router::split_path(std::string_view path)
{
    std::vector<std::string> segments;
    if(!path.empty() && path.front() == '/')
        path.remove_prefix(1);

    // "/apps/" yields {"apps", ""} so an empty trailing segment can still bind a parameter
    while(true)
    {
        size_t sep = path.find('/');
        segments.emplace_back(path.substr(0, sep));
        if(sep == std::string_view::npos)
            break;
        path.remove_prefix(sep + 1);
    }

    return segments;
}

bool router::match(const route& r, const std::vector<std::string>& segments, route_params& params)
{
    if(r.segments.size() != segments.size())
        return false;

    for(size_t i = 0; i < segments.size(); ++i)
    {
        const std::string& pattern = r.segments[i];
        if(!pattern.empty() && pattern.front() == ':')
            params[pattern.substr(1)] = utils::url_decode(segments[i]);
        else if(pattern != segments[i])
            return false;
    }

    return true;
}

response router::dispatch(const request& req) const
{
    const std::vector<std::string> segments = split_path(req.get_path());
    for(const auto& r : m_routes)
    {
        if(!utils::iequals(r.method, req.get_method()))
            continue;

        route_params params;
        if(!match(r, segments, params))
            continue;

        try {
            return r.fn(req, params);
        } catch(const std::exception& e) {
            log::error("Handler for {} {} failed: {}", req.get_method(), req.get_path(), e.what());
            return response {500};
        }
    }

    log::debug("No route for {} {}", req.get_method(), req.get_path());
    return response {404};
}

} // namespace dialcast::http
