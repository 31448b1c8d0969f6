#include "dialcast/dial_client.hpp"
#include "dialcast/description.hpp"
#include "dialcast/log.hpp"

#include <stdexcept>

using namespace dialcast::discovery;

namespace dialcast
{

dial_client::dial_client(std::unique_ptr<ssdp_peer> peer)
    : m_peer {std::move(peer)}
{
    if(!m_peer)
        throw std::invalid_argument {"dial_client needs a ssdp peer"};

    ssdp_events events;
    events.on_ready = [this]() {
        search_all();
        if(m_on_ready)
            m_on_ready();
    };
    events.on_found = [this](const ssdp_headers& headers, const ssdp_address&) {
        handle_found(headers);
    };
    events.on_notify = [this](const ssdp_headers& headers, const ssdp_address&) {
        handle_notify(headers);
    };
    events.on_close = [this]() {
        if(m_on_stop)
            m_on_stop();
    };
    m_peer->set_events(std::move(events));
}

dial_client::~dial_client()
{
    // Events keep arriving until the transport is closed, members must still be alive then
    m_peer->close();
}

void dial_client::start()
{
    m_peer->start();
}

void dial_client::refresh()
{
    {
        std::lock_guard<std::mutex> lock {m_services_mutex};
        m_services.clear();
    }
    search_all();
}

void dial_client::stop()
{
    m_peer->close();
}

std::vector<std::string> dial_client::locations() const
{
    std::lock_guard<std::mutex> lock {m_services_mutex};
    std::vector<std::string> result;
    result.reserve(m_services.size());
    for(const auto& it : m_services)
        result.push_back(it.first);
    return result;
}

void dial_client::search_all()
{
    m_peer->search({{"ST", dial_device_type}});
    m_peer->search({{"ST", dial_service_type}});
}

bool dial_client::tracked_type(const ssdp_headers& headers, const char* key)
{
    auto it = headers.find(key);
    if(it == headers.end())
        return false;
    return it->second == dial_device_type || it->second == dial_service_type;
}

void dial_client::record(const std::string& location, const ssdp_headers& headers)
{
    if(location.empty())
        return;

    {
        std::lock_guard<std::mutex> lock {m_services_mutex};
        if(!m_services.emplace(location, headers).second)
            return;
    }

    log::debug("Found DIAL device at {}", location);
    if(m_on_found)
        m_on_found(location, headers);
}

void dial_client::handle_found(const ssdp_headers& headers)
{
    if(!tracked_type(headers, "ST"))
        return;

    auto location = headers.find("LOCATION");
    if(location != headers.end())
        record(location->second, headers);
}

void dial_client::handle_notify(const ssdp_headers& headers)
{
    if(!tracked_type(headers, "NT"))
        return;

    auto location = headers.find("LOCATION");
    auto nts = headers.find("NTS");
    if(location == headers.end() || nts == headers.end())
        return;

    if(nts->second == nts_alive)
    {
        record(location->second, headers);
    }
    else if(nts->second == nts_byebye)
    {
        ssdp_headers previous;
        {
            std::lock_guard<std::mutex> lock {m_services_mutex};
            auto it = m_services.find(location->second);
            if(it == m_services.end())
                return;

            previous = std::move(it->second);
            m_services.erase(it);
        }

        log::debug("DIAL device at {} disappeared", location->second);
        if(m_on_disappear)
            m_on_disappear(location->second, previous);
    }
}

} // namespace dialcast
