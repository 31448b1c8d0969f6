#include "dialcast/dial_server.hpp"
#include "dialcast/log.hpp"
#include "dialcast/utils.hpp"

#include <algorithm>
#include <exception>

#include <fmt/format.h>

using namespace dialcast::discovery;

namespace dialcast
{

static constexpr const char* boot_id = "7337";
static constexpr const char* config_id = "7337";

app_state infer_state(const app_info& info)
{
    if(info.state)
        return *info.state;
    return (info.pid && !info.pid->empty()) ? app_state::running : app_state::stopped;
}

dial_server::dial_server(server_options options, std::unique_ptr<ssdp_peer> peer, app_provider& provider)
    : m_options {std::move(options)},
      m_peer {std::move(peer)},
      m_provider {provider},
      m_server {utils::server_string()}
{
    if(!m_peer)
        throw std::invalid_argument {"dial_server needs a ssdp peer"};

    while(!m_options.prefix.empty() && m_options.prefix.back() == '/')
        m_options.prefix.pop_back();
    if(m_options.uuid.empty())
        m_options.uuid = utils::generate_uuid();
    if(m_options.friendly_name.empty())
        m_options.friendly_name = utils::get_hostname();
    if(m_options.friendly_name.empty())
        m_options.friendly_name = "unknown";
    m_options.max_content_length = std::max(m_options.max_content_length, min_content_length);

    m_service_types = {
        dial_service_type,
        dial_device_type,
        root_device_type,
        all_service_type,
        "uuid:" + m_options.uuid
    };

    const std::string host = m_options.host.empty() ? std::string {interface_address_placeholder} : m_options.host;
    m_location = fmt::format("http://{}:{}{}/ssdp/device-desc.xml", host, m_options.port, m_options.prefix);

    ssdp_events events;
    events.on_ready = [this]() {
        announce();
        log::info("Advertising \"{}\" (uuid:{}) at {}", m_options.friendly_name, m_options.uuid, m_location);
        if(m_on_ready)
            m_on_ready();
    };
    events.on_search = [this](const ssdp_headers& headers, const ssdp_address& sender) {
        handle_search(headers, sender);
    };
    events.on_tick = [this]() {
        if(!m_stopping.load())
            announce();
    };
    events.on_close = [this]() {
        log::info("Advertisement of uuid:{} stopped", m_options.uuid);
        if(m_on_stop)
            m_on_stop();
    };
    m_peer->set_events(std::move(events));
}

dial_server::~dial_server()
{
    // Events keep arriving until the transport is closed, members must still be alive then
    m_peer->close();
}

void dial_server::start()
{
    if(m_started.exchange(true))
        return;
    m_peer->start();
}

void dial_server::stop()
{
    if(!m_started.load())
    {
        log::warn("dial_server::stop() called before start()");
        return;
    }
    if(m_stopping.exchange(true))
        return;

    // Closing waits for every byebye; the order they complete in does not matter
    m_pending_byebye = m_service_types.size();
    for(const auto& st : m_service_types)
    {
        m_peer->byebye(advertisement(st), [this]() {
            if(--m_pending_byebye == 0)
                m_peer->close();
        });
    }
}

ssdp_headers dial_server::advertisement(const std::string& service_type) const
{
    return merge({
        {"NT", service_type},
        {"USN", fmt::format("uuid:{}::{}", m_options.uuid, service_type)},
        {"SERVER", m_server},
        {"LOCATION", m_location}
    }, m_options.extra_headers);
}

void dial_server::announce()
{
    for(const auto& st : m_service_types)
        m_peer->alive(advertisement(st));
}

void dial_server::handle_search(const ssdp_headers& headers, const ssdp_address& sender)
{
    auto st = headers.find("ST");
    if(st == headers.end())
        return;
    if(std::find(m_service_types.begin(), m_service_types.end(), st->second) == m_service_types.end())
        return;

    log::debug("Answering search for {} from {}:{}", st->second, sender.addr, sender.port);
    m_peer->reply(merge({
        {"LOCATION", m_location},
        {"ST", st->second},
        {"CONFIGID.UPNP.ORG", config_id},
        {"BOOTID.UPNP.ORG", boot_id},
        {"SERVER", m_server},
        {"USN", fmt::format("uuid:{}::{}", m_options.uuid, st->second)}
    }, m_options.extra_headers), sender);
}

std::string dial_server::base_url(const http::request& req) const
{
    std::string host = req.get_header("Host");
    if(!host.empty() && host.front() == '[')
    {
        host = host.substr(0, host.find(']') + 1);
    }
    else
    {
        size_t colon = host.find(':');
        if(colon != std::string::npos)
            host.erase(colon);
    }

    if(host.empty())
        host = req.get_remote_addr();
    if(host.empty())
        host = m_options.host;

    return fmt::format("http://{}:{}{}", host, m_options.port, m_options.prefix);
}

bool dial_server::exceeds_max_content_length(const http::request& req) const
{
    return std::max(req.get_body().size(), req.content_length()) > m_options.max_content_length;
}

void dial_server::register_routes(http::router& router)
{
    const std::string& pref = m_options.prefix;

    router.get(pref + "/apps", [](const http::request&, const http::route_params&) {
        return http::response {204};
    });

    router.get(pref + "/apps/:app_name", [this](const http::request& req, const http::route_params& params) {
        return get_app(req, params.at("app_name"));
    });

    router.post(pref + "/apps/:app_name", [this](const http::request& req, const http::route_params& params) {
        return launch_app(req, params.at("app_name"));
    });

    router.post(pref + "/apps/:app_name/dial_data", [this](const http::request& req, const http::route_params& params) {
        return post_dial_data(req, params.at("app_name"));
    });

    router.del(pref + "/apps/:app_name/:pid", [this](const http::request& req, const http::route_params& params) {
        return stop_app(req, params.at("app_name"), params.at("pid"));
    });

    router.get(pref + "/ssdp/device-desc.xml", [this](const http::request& req, const http::route_params&) {
        return get_device_description(req);
    });

    router.get(pref + "/ssdp/notfound", [](const http::request&, const http::route_params&) {
        return http::response {404};
    });
}

http::response dial_server::get_app(const http::request& req, const std::string& name)
{
    request_context ctx {req, base_url(req)};
    std::optional<app_info> info = m_provider.get_app(ctx, name);
    if(!info)
        return http::response {404};

    app_description desc;
    desc.name = name;
    desc.state = infer_state(*info);
    desc.allow_stop = info->allow_stop;
    desc.rel = "run";
    desc.href = info->pid.value_or("");
    desc.additional_data = info->additional_data;
    desc.namespaces = info->namespaces;

    http::response res {200};
    res.set_header("Content-Type", "application/xml; charset=utf-8");
    res.set_body(render_app_description(desc));
    return res;
}

http::response dial_server::launch_app(const http::request& req, const std::string& name)
{
    request_context ctx {req, base_url(req)};
    std::optional<app_info> info = m_provider.get_app(ctx, name);
    if(!info)
        return http::response {404};
    if(exceeds_max_content_length(req))
        return http::response {413};

    // 201 vs 200 depends on the state before the launch
    const app_state prior = infer_state(*info);

    std::optional<std::string> launch_data;
    if(!req.get_body().empty())
        launch_data = req.get_body();

    std::optional<std::string> pid;
    try {
        pid = m_provider.launch_app(ctx, name, launch_data).get();
    } catch(const std::exception& e) {
        log::warn("Launching {} failed: {}", name, e.what());
        return http::response {503};
    }

    http::response res {(prior == app_state::stopped) ? 201 : 200};
    if(pid && !pid->empty())
        res.set_header("LOCATION", fmt::format("{}/apps/{}/{}", ctx.base_url, name, *pid));

    log::info("Launched {} (pid {})", name, pid.value_or("none"));
    return res;
}

http::response dial_server::post_dial_data(const http::request& req, const std::string& name)
{
    request_context ctx {req, base_url(req)};
    if(!m_provider.get_app(ctx, name))
        return http::response {404};
    if(exceeds_max_content_length(req))
        return http::response {413};

    return http::response {501};
}

http::response dial_server::stop_app(const http::request& req, const std::string& name, const std::string& pid)
{
    request_context ctx {req, base_url(req)};
    std::optional<app_info> info = m_provider.get_app(ctx, name);
    if(!info)
        return http::response {404};
    if(!info->allow_stop)
        return http::response {405};
    if(pid.empty())
        return http::response {400};

    bool stopped = false;
    try {
        stopped = m_provider.stop_app(ctx, name, pid).get();
    } catch(const std::exception& e) {
        log::warn("Stopping {} ({}) failed: {}", name, pid, e.what());
        return http::response {400};
    }

    log::info("Stop request for {} ({}): {}", name, pid, stopped ? "stopped" : "refused");
    return http::response {stopped ? 200 : 400};
}

http::response dial_server::get_device_description(const http::request& req) const
{
    const std::string base = base_url(req);

    device_description desc;
    desc.url_base = base;
    desc.friendly_name = m_options.friendly_name;
    desc.manufacturer = m_options.manufacturer;
    desc.model_name = m_options.model_name;
    desc.uuid = m_options.uuid;
    desc.icons = m_options.icons;

    http::response res {200};
    res.set_header("Content-Type", "application/xml");
    res.set_header("Application-URL", base + "/apps");
    res.set_body(render_device_description(desc));
    return res;
}

} // namespace dialcast
